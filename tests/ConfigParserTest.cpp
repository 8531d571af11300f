// =================================================================
// tests/ConfigParserTest.cpp
// =================================================================
// Unit tests for ConfigParser.

#include "Sieve/ConfigParser.hpp"
#include "Sieve/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>

namespace fs = std::filesystem;
using namespace Sieve;

class ConfigParserTest {
private:
    std::string config_path;

    void writeConfig(const std::string& text) {
        std::ofstream(config_path) << text;
    }

    void cleanup() {
        if (fs::exists(config_path)) {
            fs::remove(config_path);
        }
    }

public:
    ConfigParserTest()
        : config_path((fs::temp_directory_path() / "sieve_config_test.yml").string()) {}

    void testMissingFileKeepsDefaults() {
        std::cout << "Testing missing configuration file..." << std::endl;

        cleanup();
        ConfigParser parser(config_path);
        assert(!parser.isLoaded());

        const SieveConfig& config = parser.getConfig();
        assert(config.listing_backend == "local");
        assert(config.max_retries == 3);
        assert(config.empty_result_base_delay_ms == 1000);
        assert(config.error_base_delay_ms == 1500);
        assert(config.history_limit == 20);
        assert(config.regex_max_length == 500);
        assert(config.content_line_max_length == 4096);
        assert(config.excluded_directories.size() == 5);

        std::cout << "✓ Missing configuration file test passed" << std::endl;
    }

    void testDefaultTextRoundTrips() {
        std::cout << "Testing generated default configuration..." << std::endl;

        writeConfig(ConfigParser::defaultConfigText());
        ConfigParser parser(config_path);
        assert(parser.isLoaded());

        SieveConfig defaults;
        const SieveConfig& config = parser.getConfig();
        assert(config.listing_backend == defaults.listing_backend);
        assert(config.server_url == defaults.server_url);
        assert(config.pattern == defaults.pattern);
        assert(config.excluded_directories == defaults.excluded_directories);
        assert(config.poll_interval_ms == defaults.poll_interval_ms);
        assert(config.console_log_level == defaults.console_log_level);
        assert(parser.getStringValue("listing.endpoint") == "/api/list-files");

        cleanup();
        std::cout << "✓ Default configuration test passed" << std::endl;
    }

    void testOverrides() {
        std::cout << "Testing configuration overrides..." << std::endl;

        writeConfig(
            "listing:\n"
            "  backend: http\n"
            "  server_url: http://files.internal:8080\n"
            "  include_stats: no\n"
            "  exclude: [vendor, target]\n"
            "retry:\n"
            "  max_retries: 5\n"
            "selection:\n"
            "  history_limit: 50\n"
            "  detect_session_deletion: false\n"
            "jobs:\n"
            "  max_polls: 10\n");

        ConfigParser parser(config_path);
        const SieveConfig& config = parser.getConfig();
        assert(config.listing_backend == "http");
        assert(config.server_url == "http://files.internal:8080");
        assert(!config.include_stats);
        assert((config.excluded_directories == std::vector<std::string>{"vendor", "target"}));
        assert(config.max_retries == 5);
        assert(config.history_limit == 50);
        assert(!config.detect_session_deletion);
        assert(config.max_polls == 10);
        // Untouched keys keep their defaults
        assert(config.read_timeout_seconds == 60);

        cleanup();
        std::cout << "✓ Configuration override test passed" << std::endl;
    }

    void testInvalidValuesFallBack() {
        std::cout << "Testing invalid values..." << std::endl;

        writeConfig(
            "listing:\n"
            "  backend: ftp\n"
            "retry:\n"
            "  max_retries: many\n"
            "  error_base_delay_ms: -5\n"
            "logging:\n"
            "  console: maybe\n");

        ConfigParser parser(config_path);
        const SieveConfig& config = parser.getConfig();
        assert(config.listing_backend == "local");
        assert(config.max_retries == 3);
        assert(config.error_base_delay_ms == 1500);
        assert(config.console_logging);

        cleanup();
        std::cout << "✓ Invalid value test passed" << std::endl;
    }

    void testMalformedYaml() {
        std::cout << "Testing malformed YAML..." << std::endl;

        writeConfig("listing: [unclosed\n  backend: http\n");
        ConfigParser parser(config_path);
        assert(!parser.isLoaded());
        assert(parser.getConfig().listing_backend == "local");
        assert(parser.getStringValue("listing.backend").empty());

        cleanup();
        std::cout << "✓ Malformed YAML test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ConfigParser unit tests..." << std::endl;

        testMissingFileKeepsDefaults();
        testDefaultTextRoundTrips();
        testOverrides();
        testInvalidValuesFallBack();
        testMalformedYaml();

        std::cout << "All ConfigParser tests passed!" << std::endl;
    }
};

int main() {
    Logger::getInstance().setConsoleLogLevel(LogLevel::CRITICAL);

    try {
        ConfigParserTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ConfigParser component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
