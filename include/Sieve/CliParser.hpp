// =================================================================
// include/Sieve/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Sieve {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string config_path = ".sieve/config.yml";
    bool verbose = false;

    // Project directory for 'list', 'select', 'filter' and 'apply-job'
    std::string directory;
    std::string session_file;

    // Options for 'select'
    std::vector<std::string> toggle_paths;
    std::vector<std::string> exclude_paths;
    std::vector<std::string> include_paths;
    std::vector<std::string> deselect_paths;
    std::vector<std::string> apply_paths;
    std::vector<std::string> replace_paths;
    std::string paths_file;
    bool no_merge = false;
    size_t undo_steps = 0;

    // Options for 'filter'
    std::string search_term;
    std::string mode = "all";
    std::string title_regex;
    std::string content_regex;
    std::string negative_title_regex;
    std::string negative_content_regex;
    bool load_contents = false;

    // Options for 'apply-job'
    std::string job_file;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupInitCommand(CLI::App& app);
    void setupListCommand(CLI::App& app);
    void setupSelectCommand(CLI::App& app);
    void setupFilterCommand(CLI::App& app);
    void setupApplyJobCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Sieve
