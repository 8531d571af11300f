// =================================================================
// include/Sieve/SysInteraction.hpp
// =================================================================
// Defines the interface for file-system operations used by the CLI:
// session and job files, configuration and file contents.

#pragma once

#include <string>

namespace Sieve {

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    std::string readFile(const std::string& file_path);

    /**
     * @brief Writes content to a file, overwriting it.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @return True on success, false on failure.
     */
    bool writeFile(const std::string& file_path, const std::string& content);

    /**
     * @brief Checks if a file exists.
     */
    bool fileExists(const std::string& file_path);

    /**
     * @brief Checks if a directory exists.
     */
    bool directoryExists(const std::string& dir_path);

    /**
     * @brief Creates a directory and any missing parents.
     */
    bool createDirectory(const std::string& dir_path);

    /**
     * @brief Reads a file only if it is small enough and looks like text.
     * @param max_bytes Larger files are skipped.
     * @param content Receives the file content.
     * @return False for unreadable, oversized or binary files.
     */
    bool readTextFile(const std::string& file_path, size_t max_bytes, std::string& content);
};

} // namespace Sieve
