// =================================================================
// include/Sieve/GlobPattern.hpp
// =================================================================
// Header for glob matching used by the local directory listing.

#pragma once

#include <string>
#include <vector>
#include <regex>

namespace Sieve {

/**
 * @brief One glob pattern compiled to a regular expression
 *
 * Supported syntax:
 * - Wildcards: *, **, ?
 * - Character classes: [abc], [a-z], [!abc]
 * - Negation: !pattern
 * - Directory-only patterns: pattern/
 * - Anchored patterns: /pattern
 * - Comment lines: # comment
 *
 * A pattern without '/' matches a file name at any depth. A pattern with
 * '/' is matched against the whole relative path.
 */
class GlobPattern {
public:
    explicit GlobPattern(const std::string& pattern);

    /**
     * @brief Check if a relative path matches this pattern
     * @param path Path relative to the listing root, '/' separated
     * @param is_directory True if the path names a directory
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    bool isNegation() const { return m_is_negation; }
    bool isDirectoryOnly() const { return m_directory_only; }
    bool isEmpty() const { return m_is_empty; }
    const std::string& getPattern() const { return m_original_pattern; }

private:
    std::string m_original_pattern;
    bool m_is_negation = false;
    bool m_directory_only = false;
    bool m_is_anchored = false;
    bool m_has_separator = false;
    bool m_is_empty = false;
    std::regex m_regex;

    void compile(const std::string& pattern);

    /**
     * @brief Translate the glob body to an ECMAScript regex body
     */
    std::string globToRegex(const std::string& glob) const;
};

/**
 * @brief Ordered list of glob patterns where later patterns override earlier ones
 */
class GlobPatternSet {
public:
    void addPattern(const std::string& pattern);

    /**
     * @brief Load one pattern per line from a file
     * @param file_path Pattern file, silently skipped when missing
     * @return Number of patterns loaded
     */
    size_t loadFromFile(const std::string& file_path);

    /**
     * @brief Evaluate the set against a path
     * @return true if the last matching pattern is a positive one
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    size_t size() const { return m_patterns.size(); }
    bool empty() const { return m_patterns.empty(); }
    void clear() { m_patterns.clear(); }

private:
    std::vector<GlobPattern> m_patterns;
};

} // namespace Sieve
