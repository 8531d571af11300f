// =================================================================
// include/Sieve/Logger.hpp
// =================================================================
// Header for component logging with console and rotating file output.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace Sieve {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger shared by the loader, the reconciler and the CLI
 *
 * Entries go to the console (colored, INFO and above by default) and to a
 * rotating log file (DEBUG and above by default). The logger initializes
 * itself with defaults on first use.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".sieve/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    void setConsoleLogLevel(LogLevel level);
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of one directory listing attempt
     * @param directory Normalized directory that was listed
     * @param processed_files Entries turned into file records
     * @param skipped_files Entries dropped because they were not under the directory
     * @param duration_ms Time spent in the listing call
     */
    void logListingLoad(const std::string& directory, size_t processed_files,
                        size_t skipped_files, long duration_ms);

    /**
     * @brief Log statistics of a managed map rebuild
     * @param total_files Records in the rebuilt map
     * @param included_files Records marked included
     * @param excluded_files Records marked force-excluded
     * @param unmatched_entries Session entries that matched no record
     */
    void logReconcile(size_t total_files, size_t included_files,
                      size_t excluded_files, size_t unmatched_entries);

    /**
     * @brief Log a user-driven selection change
     * @param operation Operation name (toggle, bulk, apply, replace, undo, redo)
     * @param included_count Size of the included list afterwards
     * @param excluded_count Size of the excluded list afterwards
     */
    void logSelectionChange(const std::string& operation, size_t included_count, size_t excluded_count);

    void logSessionStart(const std::string& command, const std::string& directory);
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parse a level name as written in the configuration file
     * @param name Level name (debug, info, warning, error, critical)
     * @param fallback Level returned for unknown names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Start a new file once the current one reaches the size limit
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Sieve::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Sieve::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Sieve::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Sieve::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Sieve::Logger::getInstance().critical(component, message)

} // namespace Sieve
