// =================================================================
// src/Sieve/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Sieve/CliParser.hpp"

namespace Sieve {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Sieve: reconcile project file listings with saved file selections.");
    m_app->require_subcommand(1);

    m_app->add_option("-c,--config", m_commands.config_path, "Path to the configuration file (default: .sieve/config.yml)");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Show debug output on the console");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Define all commands
    setupInitCommand(*m_app);
    setupListCommand(*m_app);
    setupSelectCommand(*m_app);
    setupFilterCommand(*m_app);
    setupApplyJobCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupInitCommand(CLI::App& app) {
    app.add_subcommand("init", "Initializes Sieve configuration in the current project.");
}

void CliParser::setupListCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("list", "Lists the project files as the selection engine sees them.");
    sub->add_option("directory", m_commands.directory, "Absolute path of the project directory.")->required();
}

void CliParser::setupSelectCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("select", "Applies selection operations to a saved session.");
    sub->add_option("directory", m_commands.directory, "Absolute path of the project directory.")->required();
    sub->add_option("-s,--session", m_commands.session_file, "Session JSON file with includedFiles and excludedFiles.")->required();
    sub->add_option("--toggle", m_commands.toggle_paths, "Flip inclusion of a file (repeatable).");
    sub->add_option("--exclude", m_commands.exclude_paths, "Flip forced exclusion of a file (repeatable).");
    sub->add_option("--include-all", m_commands.include_paths, "Include files in bulk (repeatable).");
    sub->add_option("--deselect", m_commands.deselect_paths, "Un-include files in bulk (repeatable).");
    sub->add_option("--apply", m_commands.apply_paths, "Include files matched from free-form paths (repeatable).");
    sub->add_option("--replace", m_commands.replace_paths, "Make the matched paths the whole selection (repeatable).");
    sub->add_option("--paths-file", m_commands.paths_file, "Read free-form paths to apply, one per line.")->check(CLI::ExistingFile);
    sub->add_flag("--no-merge", m_commands.no_merge, "Applied paths replace the included list instead of joining it.");
    sub->add_option("--undo", m_commands.undo_steps, "Undo this many of the operations above.");
}

void CliParser::setupFilterCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("filter", "Shows the files that pass a search and regex filter.");
    sub->add_option("directory", m_commands.directory, "Absolute path of the project directory.")->required();
    sub->add_option("-s,--session", m_commands.session_file, "Session JSON file with includedFiles and excludedFiles.");
    sub->add_option("--search", m_commands.search_term, "Case-insensitive path substring.");
    sub->add_option("--mode", m_commands.mode, "Filter mode: all, selected or regex (default: all)")
        ->check(CLI::IsMember({"all", "selected", "regex"}));
    sub->add_option("--title-regex", m_commands.title_regex, "Keep files whose path matches.");
    sub->add_option("--content-regex", m_commands.content_regex, "Keep files whose content matches.");
    sub->add_option("--negative-title-regex", m_commands.negative_title_regex, "Drop files whose path matches.");
    sub->add_option("--negative-content-regex", m_commands.negative_content_regex, "Drop files whose content matches.");
    sub->add_flag("--load-contents", m_commands.load_contents, "Read file contents so content patterns can run.");
}

void CliParser::setupApplyJobCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("apply-job", "Merges the result of a relevant-files job into a session.");
    sub->add_option("directory", m_commands.directory, "Absolute path of the project directory.")->required();
    sub->add_option("-s,--session", m_commands.session_file, "Session JSON file with includedFiles and excludedFiles.")->required();
    sub->add_option("-j,--job", m_commands.job_file, "Job JSON file as exported by the job store.")->required()->check(CLI::ExistingFile);
    sub->add_flag("--no-merge", m_commands.no_merge, "Job paths replace the included list instead of joining it.");
}

} // namespace Sieve
