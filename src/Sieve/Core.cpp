// =================================================================
// src/Sieve/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Sieve/Core.hpp"
#include "Sieve/ConfigParser.hpp"
#include "Sieve/DirectoryLoader.hpp"
#include "Sieve/EventLoop.hpp"
#include "Sieve/FileFilterEngine.hpp"
#include "Sieve/FileJobSource.hpp"
#include "Sieve/HttpListingClient.hpp"
#include "Sieve/LocalListingClient.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/PathNormalizer.hpp"
#include "Sieve/RelevantFilesPoller.hpp"
#include "Sieve/SelectionReconciler.hpp"
#include "Sieve/SessionFile.hpp"
#include "Sieve/SysInteraction.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace Sieve {

namespace {

const size_t MAX_CONTENT_BYTES = 1024 * 1024;

// Helper function to convert a string to a vector of non-empty lines
std::vector<std::string> to_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream stream(text);
    while (std::getline(stream, line)) {
        std::string trimmed = PathNormalizer::trim(line);
        if (!trimmed.empty()) {
            lines.push_back(trimmed);
        }
    }
    return lines;
}

std::string formatSize(const std::optional<uint64_t>& size) {
    if (!size) {
        return "-";
    }
    std::ostringstream out;
    if (*size >= 1024 * 1024) {
        out << std::fixed << std::setprecision(1) << (*size / (1024.0 * 1024.0)) << " MB";
    } else if (*size >= 1024) {
        out << std::fixed << std::setprecision(1) << (*size / 1024.0) << " KB";
    } else {
        out << *size << " B";
    }
    return out.str();
}

char selectionMarker(const FileRecord& record) {
    if (record.force_excluded) {
        return '-';
    }
    return record.included ? 'x' : ' ';
}

ReconcilerOptions reconcilerOptions(const SieveConfig& config) {
    ReconcilerOptions options;
    options.history_limit = config.history_limit;
    options.detect_session_deletion = config.detect_session_deletion;
    return options;
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_config(std::make_unique<ConfigParser>(commands.config_path)),
      m_sys(std::make_unique<SysInteraction>())
{
    setupLogging();
}

Core::~Core() = default;

int Core::run() {
    auto start = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(m_commands.active_command, m_commands.directory);

    int exit_code = 1;
    try {
        exit_code = dispatch();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: invalid JSON: " << e.what() << std::endl;
        LOG_ERROR("Core", std::string("Invalid JSON input: ") + e.what());
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        LOG_ERROR("Core", e.what());
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(duration));
    Logger::getInstance().flush();
    return exit_code;
}

int Core::dispatch() {
    if (m_commands.active_command == "init") {
        return handleInit();
    } else if (m_commands.active_command == "list") {
        return handleList();
    } else if (m_commands.active_command == "select") {
        return handleSelect();
    } else if (m_commands.active_command == "filter") {
        return handleFilter();
    } else if (m_commands.active_command == "apply-job") {
        return handleApplyJob();
    } else if (m_commands.active_command.empty()) {
        return 0;
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

void Core::setupLogging() {
    const SieveConfig& config = m_config->getConfig();
    Logger& logger = Logger::getInstance();

    logger.initialize(config.log_directory);
    logger.setConsoleLogging(config.console_logging);
    logger.setConsoleLogLevel(m_commands.verbose
        ? LogLevel::DEBUG
        : Logger::parseLevel(config.console_log_level, LogLevel::INFO));
    logger.setFileLogLevel(Logger::parseLevel(config.file_log_level, LogLevel::DEBUG));
}

int Core::handleInit() {
    std::cout << "Initializing Sieve configuration..." << std::endl;

    const std::string configFile = m_commands.config_path;
    const std::string configDir = std::filesystem::path(configFile).parent_path().string();

    if (!configDir.empty() && !m_sys->directoryExists(configDir)) {
        if (!m_sys->createDirectory(configDir)) {
            std::cerr << "Error: Failed to create configuration directory '" << configDir << "'." << std::endl;
            return 1;
        }
        std::cout << "Created configuration directory: " << configDir << std::endl;
    }

    if (m_sys->fileExists(configFile)) {
        std::cout << "Configuration file '" << configFile << "' already exists. Skipping." << std::endl;
    } else {
        if (m_sys->writeFile(configFile, ConfigParser::defaultConfigText())) {
            std::cout << "Created default configuration file: " << configFile << std::endl;
        } else {
            std::cerr << "Error: Failed to write configuration file '" << configFile << "'." << std::endl;
            return 1;
        }
    }
    return 0;
}

int Core::handleList() {
    FileMap files;
    if (!loadListing(projectDirectory(), files)) {
        return 1;
    }

    for (const auto& [path, record] : files) {
        std::cout << std::setw(10) << formatSize(record.size) << "  " << path << "\n";
    }
    std::cout << files.size() << " files" << std::endl;
    return 0;
}

int Core::handleSelect() {
    const std::string directory = projectDirectory();

    SessionFile session(m_commands.session_file, *m_sys);
    session.load();

    FileMap files;
    if (!loadListing(directory, files)) {
        return 1;
    }

    SelectionReconciler reconciler(&session, reconcilerOptions(m_config->getConfig()));
    reconciler.reconcile(files, session.getIncludedFiles(), session.getExcludedFiles());

    for (const auto& path : m_commands.toggle_paths) {
        if (!reconciler.toggleInclude(path)) {
            std::cerr << "Warning: no file matches '" << path << "'" << std::endl;
        }
    }
    for (const auto& path : m_commands.exclude_paths) {
        if (!reconciler.toggleExclude(path)) {
            std::cerr << "Warning: no file matches '" << path << "'" << std::endl;
        }
    }
    if (!m_commands.include_paths.empty()) {
        size_t changed = reconciler.bulkSet(true, m_commands.include_paths);
        std::cout << "Included " << changed << " files" << std::endl;
    }
    if (!m_commands.deselect_paths.empty()) {
        size_t changed = reconciler.bulkSet(false, m_commands.deselect_paths);
        std::cout << "Deselected " << changed << " files" << std::endl;
    }

    std::vector<std::string> apply_paths = m_commands.apply_paths;
    if (!m_commands.paths_file.empty()) {
        std::vector<std::string> from_file = to_lines(m_sys->readFile(m_commands.paths_file));
        apply_paths.insert(apply_paths.end(), from_file.begin(), from_file.end());
    }
    if (!apply_paths.empty()) {
        SelectionResult result = reconciler.applyFromPaths(apply_paths, !m_commands.no_merge);
        std::cout << "Matched " << result.matched << " of " << apply_paths.size() << " paths" << std::endl;
    }
    if (!m_commands.replace_paths.empty()) {
        SelectionResult result = reconciler.replaceAllFromPaths(m_commands.replace_paths);
        std::cout << "Selection replaced with " << result.matched << " files" << std::endl;
    }

    for (size_t i = 0; i < m_commands.undo_steps; ++i) {
        if (!reconciler.undo()) {
            std::cerr << "Warning: nothing left to undo" << std::endl;
            break;
        }
    }

    for (const auto& warning : reconciler.getPathWarnings()) {
        std::cerr << "Warning: " << warning << std::endl;
    }

    printSelectionSummary(reconciler);

    if (session.isDirty()) {
        if (!session.save()) {
            std::cerr << "Error: Failed to write session '" << session.getPath() << "'." << std::endl;
            return 1;
        }
        std::cout << "Session saved: " << session.getPath() << std::endl;
    }
    return 0;
}

int Core::handleFilter() {
    const std::string directory = projectDirectory();

    std::vector<std::string> included;
    std::vector<std::string> excluded;
    if (!m_commands.session_file.empty()) {
        SessionFile session(m_commands.session_file, *m_sys);
        session.load();
        included = session.getIncludedFiles();
        excluded = session.getExcludedFiles();
    }

    FileMap files;
    if (!loadListing(directory, files)) {
        return 1;
    }

    SelectionReconciler reconciler(nullptr, reconcilerOptions(m_config->getConfig()));
    reconciler.reconcile(files, included, excluded);

    std::optional<FilterMode> mode = FileFilterEngine::parseMode(m_commands.mode);
    if (!mode) {
        std::cerr << "Error: unknown filter mode '" << m_commands.mode << "'" << std::endl;
        return 1;
    }

    RegexPatterns patterns;
    patterns.title = m_commands.title_regex;
    patterns.content = m_commands.content_regex;
    patterns.negative_title = m_commands.negative_title_regex;
    patterns.negative_content = m_commands.negative_content_regex;

    ContentMap contents;
    if (m_commands.load_contents) {
        for (const auto& [path, record] : reconciler.getManagedFiles()) {
            std::string text;
            if (m_sys->readTextFile(directory + "/" + path, MAX_CONTENT_BYTES, text)) {
                contents[record.comparable_path] = std::move(text);
            }
        }
        LOG_DEBUG("Core", "Loaded contents of " + std::to_string(contents.size()) + " files");
    }

    const SieveConfig& config = m_config->getConfig();
    FileFilterEngine engine(config.regex_max_length, config.content_line_max_length);
    FilterResult result = engine.filter(reconciler.getManagedFiles(), contents,
                                        m_commands.search_term, *mode, patterns);
    FileFilterEngine::sortForDisplay(result.files);

    if (result.title_error) std::cerr << "Title regex: " << *result.title_error << std::endl;
    if (result.content_error) std::cerr << "Content regex: " << *result.content_error << std::endl;
    if (result.negative_title_error) std::cerr << "Negative title regex: " << *result.negative_title_error << std::endl;
    if (result.negative_content_error) std::cerr << "Negative content regex: " << *result.negative_content_error << std::endl;

    for (const auto& record : result.files) {
        std::cout << "[" << selectionMarker(record) << "] " << record.path << "\n";
    }
    std::cout << result.files.size() << " of " << files.size() << " files shown" << std::endl;
    return 0;
}

int Core::handleApplyJob() {
    const std::string directory = projectDirectory();
    const SieveConfig& config = m_config->getConfig();

    SessionFile session(m_commands.session_file, *m_sys);
    session.load();

    JobRecord initial = JobRecord::fromJson(nlohmann::json::parse(m_sys->readFile(m_commands.job_file)));
    std::string job_id = initial.id.empty()
        ? std::filesystem::path(m_commands.job_file).stem().string()
        : initial.id;

    FileMap files;
    if (!loadListing(directory, files)) {
        return 1;
    }

    SelectionReconciler reconciler(&session, reconcilerOptions(config));
    reconciler.reconcile(files, session.getIncludedFiles(), session.getExcludedFiles());

    PollerOptions options;
    options.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
    options.max_polls = config.max_polls;
    options.merge_with_existing = !m_commands.no_merge;

    EventLoop loop;
    RelevantFilesPoller poller(loop, std::make_shared<FileJobSource>(m_commands.job_file, *m_sys),
                               reconciler, options);
    poller.start(job_id, directory);
    loop.runUntilIdle();

    if (poller.getState() != JobPollState::COMPLETED) {
        std::cerr << "Error: job " << job_id << " " << RelevantFilesPoller::stateName(poller.getState());
        if (!poller.getError().empty()) {
            std::cerr << ": " << poller.getError();
        }
        std::cerr << std::endl;
        return 1;
    }

    for (const auto& warning : poller.getLastResult().warnings) {
        std::cerr << "Warning: " << warning << std::endl;
    }
    std::cout << "Matched " << poller.getLastResult().matched << " files from job " << job_id << std::endl;
    printSelectionSummary(reconciler);

    if (session.isDirty() && !session.save()) {
        std::cerr << "Error: Failed to write session '" << session.getPath() << "'." << std::endl;
        return 1;
    }
    return 0;
}

std::shared_ptr<ListingClient> Core::createListingClient() const {
    const SieveConfig& config = m_config->getConfig();

    if (config.listing_backend == "http") {
        auto client = std::make_shared<HttpListingClient>(config.server_url, config.endpoint);
        client->setTimeouts(config.connection_timeout_seconds, config.read_timeout_seconds);
        LOG_DEBUG("Core", "Using listing server " + config.server_url + config.endpoint);
        return client;
    }

    return std::make_shared<LocalListingClient>(config.excluded_directories);
}

bool Core::loadListing(const std::string& directory, FileMap& files) {
    const SieveConfig& config = m_config->getConfig();

    RetryPolicy policy;
    policy.max_retries = config.max_retries;
    policy.unsuccessful_base_delay = std::chrono::milliseconds(config.empty_result_base_delay_ms);
    policy.exception_base_delay = std::chrono::milliseconds(config.error_base_delay_ms);

    EventLoop loop;
    DirectoryLoader loader(loop, createListingClient(), policy);
    loader.setListingOptions(config.include_stats, config.pattern);
    loader.load(directory);
    loop.runUntilIdle();

    const DirectoryLoadState& state = loader.getState();
    if (!state.error.empty()) {
        std::cerr << "Error: " << state.error << std::endl;
        return false;
    }

    files = state.raw_files;
    return true;
}

std::string Core::projectDirectory() const {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(m_commands.directory, ec);
    if (ec) {
        return m_commands.directory;
    }
    return absolute.lexically_normal().string();
}

void Core::printSelectionSummary(const SelectionReconciler& reconciler) const {
    std::vector<std::string> included = reconciler.getIncludedPaths();
    std::vector<std::string> excluded = reconciler.getExcludedPaths();

    for (const auto& path : included) {
        std::cout << "[x] " << path << "\n";
    }
    for (const auto& path : excluded) {
        std::cout << "[-] " << path << "\n";
    }
    std::cout << included.size() << " included, " << excluded.size() << " excluded of "
              << reconciler.getManagedFiles().size() << " files" << std::endl;
}

} // namespace Sieve
