// =================================================================
// include/Sieve/ConfigParser.hpp
// =================================================================
// Defines the parser for the .sieve/config.yml file.

#pragma once

#include <map>
#include <string>
#include <vector>

namespace Sieve {

/**
 * @brief Typed view of the configuration, filled with defaults first
 */
struct SieveConfig {
    // listing
    std::string listing_backend = "local";              ///< "local" or "http"
    std::string server_url = "http://localhost:3000";
    std::string endpoint = "/api/list-files";
    std::string pattern = "**/*";
    bool include_stats = true;
    int connection_timeout_seconds = 10;
    int read_timeout_seconds = 60;
    std::vector<std::string> excluded_directories = {"node_modules", ".git", ".next", "dist", "build"};

    // retry
    int max_retries = 3;
    int empty_result_base_delay_ms = 1000;
    int error_base_delay_ms = 1500;

    // selection
    size_t history_limit = 20;
    bool detect_session_deletion = true;

    // filter
    size_t regex_max_length = 500;
    size_t content_line_max_length = 4096;

    // jobs
    int poll_interval_ms = 1000;
    int max_polls = 120;

    // logging
    std::string log_directory = ".sieve/logs";
    std::string console_log_level = "info";
    std::string file_log_level = "debug";
    bool console_logging = true;
};

class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the config.yml file. A missing file
     *        leaves every value at its default.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Retrieves a scalar value by dotted key.
     * @param key The configuration key (e.g., "listing.server_url").
     * @return The corresponding value, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    const SieveConfig& getConfig() const { return m_config; }

    /// False when the file was missing or unreadable
    bool isLoaded() const { return m_loaded; }

    /**
     * @brief Commented configuration written by `sieve init`.
     */
    static std::string defaultConfigText();

private:
    std::map<std::string, std::string> m_config_values;
    std::map<std::string, std::vector<std::string>> m_list_values;
    SieveConfig m_config;
    bool m_loaded = false;

    void buildTypedConfig();

    int intValue(const std::string& key, int fallback) const;
    bool boolValue(const std::string& key, bool fallback) const;
};

} // namespace Sieve
