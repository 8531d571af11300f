// =================================================================
// src/Sieve/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration parser.

#include "Sieve/ConfigParser.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/PathNormalizer.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <stdexcept>

namespace Sieve {

namespace {

void flatten(const YAML::Node& node, const std::string& prefix,
             std::map<std::string, std::string>& scalars,
             std::map<std::string, std::vector<std::string>>& lists) {
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            flatten(it->second, prefix.empty() ? key : prefix + "." + key, scalars, lists);
        }
    } else if (node.IsSequence()) {
        std::vector<std::string>& items = lists[prefix];
        for (const auto& item : node) {
            if (item.IsScalar()) {
                items.push_back(item.as<std::string>());
            }
        }
    } else if (node.IsScalar()) {
        scalars[prefix] = node.as<std::string>();
    }
}

} // namespace

ConfigParser::ConfigParser(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        // Fine before `init` has been run
        return;
    }

    try {
        YAML::Node root = YAML::LoadFile(config_path);
        flatten(root, "", m_config_values, m_list_values);
        m_loaded = true;
    } catch (const YAML::Exception& e) {
        Logger::getInstance().error("ConfigParser",
            "Failed to parse configuration file: " + std::string(e.what()), config_path);
        m_config_values.clear();
        m_list_values.clear();
    }

    buildTypedConfig();
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it != m_config_values.end()) {
        return it->second;
    }
    return "";
}

void ConfigParser::buildTypedConfig() {
    SieveConfig& c = m_config;

    auto str = [this](const std::string& key, std::string& target) {
        std::string value = getStringValue(key);
        if (!value.empty()) {
            target = value;
        }
    };

    str("listing.backend", c.listing_backend);
    str("listing.server_url", c.server_url);
    str("listing.endpoint", c.endpoint);
    str("listing.pattern", c.pattern);
    c.include_stats = boolValue("listing.include_stats", c.include_stats);
    c.connection_timeout_seconds = intValue("listing.connection_timeout_seconds", c.connection_timeout_seconds);
    c.read_timeout_seconds = intValue("listing.read_timeout_seconds", c.read_timeout_seconds);

    auto exclude = m_list_values.find("listing.exclude");
    if (exclude != m_list_values.end()) {
        c.excluded_directories = exclude->second;
    }

    c.max_retries = intValue("retry.max_retries", c.max_retries);
    c.empty_result_base_delay_ms = intValue("retry.empty_result_base_delay_ms", c.empty_result_base_delay_ms);
    c.error_base_delay_ms = intValue("retry.error_base_delay_ms", c.error_base_delay_ms);

    c.history_limit = static_cast<size_t>(intValue("selection.history_limit", static_cast<int>(c.history_limit)));
    c.detect_session_deletion = boolValue("selection.detect_session_deletion", c.detect_session_deletion);

    c.regex_max_length = static_cast<size_t>(intValue("filter.regex_max_length", static_cast<int>(c.regex_max_length)));
    c.content_line_max_length = static_cast<size_t>(
        intValue("filter.content_line_max_length", static_cast<int>(c.content_line_max_length)));

    c.poll_interval_ms = intValue("jobs.poll_interval_ms", c.poll_interval_ms);
    c.max_polls = intValue("jobs.max_polls", c.max_polls);

    str("logging.directory", c.log_directory);
    str("logging.console_level", c.console_log_level);
    str("logging.file_level", c.file_log_level);
    c.console_logging = boolValue("logging.console", c.console_logging);

    if (c.listing_backend != "local" && c.listing_backend != "http") {
        Logger::getInstance().warning("ConfigParser",
            "Unknown listing backend '" + c.listing_backend + "', using local");
        c.listing_backend = "local";
    }
}

int ConfigParser::intValue(const std::string& key, int fallback) const {
    std::string value = getStringValue(key);
    if (value.empty()) {
        return fallback;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed < 0) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        Logger::getInstance().warning("ConfigParser",
            "Invalid number for " + key + ": '" + value + "', using " + std::to_string(fallback));
        return fallback;
    }
}

bool ConfigParser::boolValue(const std::string& key, bool fallback) const {
    std::string value = PathNormalizer::toLower(getStringValue(key));
    if (value.empty()) {
        return fallback;
    }
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    Logger::getInstance().warning("ConfigParser", "Invalid boolean for " + key + ": '" + value + "'");
    return fallback;
}

std::string ConfigParser::defaultConfigText() {
    return R"(# Sieve Configuration File

listing:
  # Where listings come from: "local" walks the directory, "http" asks a server
  backend: local
  server_url: http://localhost:3000
  endpoint: /api/list-files
  pattern: "**/*"
  include_stats: true
  connection_timeout_seconds: 10
  read_timeout_seconds: 60
  exclude:
    - node_modules
    - .git
    - .next
    - dist
    - build

retry:
  max_retries: 3
  empty_result_base_delay_ms: 1000
  error_base_delay_ms: 1500

selection:
  history_limit: 20
  # Freeze when both selection lists empty at once (session being deleted)
  detect_session_deletion: true

filter:
  regex_max_length: 500
  # Content regexes skip longer lines
  content_line_max_length: 4096

jobs:
  poll_interval_ms: 1000
  max_polls: 120

logging:
  directory: .sieve/logs
  console_level: info
  file_level: debug
  console: true
)";
}

} // namespace Sieve
