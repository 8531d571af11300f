// =================================================================
// include/Sieve/PathNormalizer.hpp
// =================================================================
// Header for the pure path helpers shared by every component.

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace Sieve {

/**
 * @brief Stateless conversions between raw path strings and the
 *        canonical forms used for keys and comparisons
 *
 * None of these functions touch the filesystem.
 */
class PathNormalizer {
public:
    /**
     * @brief Unify separators to '/' and collapse repeated slashes
     * @param path Raw path
     * @param add_trailing_slash Append '/' if the result does not end with one
     * @return Formatted path; empty input stays empty
     */
    static std::string normalizePath(const std::string& path, bool add_trailing_slash = false);

    /**
     * @brief Build the comparison key of a path
     *
     * Trims whitespace, unifies separators, collapses repeated slashes and
     * strips a single leading "./" followed by a single leading "/".
     *
     * @param path Raw path in any representation
     * @return Comparable path, empty for empty input
     */
    static std::string normalizeForComparison(const std::string& path);

    /**
     * @brief Express an absolute path relative to a base directory
     * @param absolute_path Path reported by a directory listing
     * @param base_directory Project directory
     * @return Relative path, or std::nullopt when the path is not strictly
     *         inside the base directory
     */
    static std::optional<std::string> makeRelative(const std::string& absolute_path,
                                                   const std::string& base_directory);

    /**
     * @brief Check for a Unix root or a Windows drive prefix
     */
    static bool isAbsolute(const std::string& path);

    static std::string baseName(const std::string& path);
    static std::string directoryName(const std::string& path);

    /**
     * @brief Split a path into its non-empty segments
     */
    static std::vector<std::string> splitSegments(const std::string& path);

    static std::string toLower(const std::string& text);
    static std::string trim(const std::string& text);
};

} // namespace Sieve
