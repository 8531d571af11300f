// =================================================================
// include/Sieve/FileFilterEngine.hpp
// =================================================================
// Header for narrowing the managed files by mode, search term and regexes.

#pragma once

#include "Sieve/FileRecord.hpp"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace Sieve {

enum class FilterMode {
    ALL,        ///< No mode filtering
    SELECTED,   ///< Only visibly included files
    REGEX       ///< Apply the regex patterns
};

/**
 * @brief The four independent pattern slots; an empty slot is inactive
 */
struct RegexPatterns {
    std::string title;
    std::string content;
    std::string negative_title;
    std::string negative_content;

    bool empty() const {
        return title.empty() && content.empty() && negative_title.empty() && negative_content.empty();
    }
};

struct FilterResult {
    std::vector<FileRecord> files;
    std::optional<std::string> title_error;
    std::optional<std::string> content_error;
    std::optional<std::string> negative_title_error;
    std::optional<std::string> negative_content_error;

    bool hasErrors() const {
        return title_error || content_error || negative_title_error || negative_content_error;
    }
};

/**
 * @brief Stateless filter pipeline over a managed file map
 *
 * Stages run in order mode, search term, regex and each only narrows the
 * output of the previous one. Regexes are ECMAScript and case-insensitive.
 * A malformed pattern disables its own slot and reports an error; the
 * other slots still apply.
 *
 * Content patterns only run when the content map is non-empty. A file
 * without an entry counts as "content unknown": a positive content pattern
 * drops it and a negative content pattern keeps it.
 *
 * Content patterns are matched one line at a time, so `^` and `$` anchor to
 * line boundaries. Lines longer than the configured cap are not searched
 * and the slot reports that they were skipped.
 */
class FileFilterEngine {
public:
    /**
     * @param regex_max_length Longest accepted pattern
     * @param content_line_max_length Longest content line a pattern runs over
     */
    explicit FileFilterEngine(size_t regex_max_length = 500, size_t content_line_max_length = 4096);

    /**
     * @brief Run the pipeline
     * @param files Managed map
     * @param contents File contents keyed by comparable path or path
     * @param search_term Case-insensitive substring, empty disables the stage
     * @param mode Mode filter
     * @param patterns Regex slots, used only in REGEX mode
     */
    FilterResult filter(const FileMap& files,
                        const ContentMap& contents,
                        const std::string& search_term,
                        FilterMode mode,
                        const RegexPatterns& patterns) const;

    /**
     * @brief Check a pattern without filtering anything
     * @return Error message, or std::nullopt if the pattern is usable or blank
     */
    std::optional<std::string> validatePattern(const std::string& pattern) const;

    /**
     * @brief Order files directory by directory, then by full path
     */
    static void sortForDisplay(std::vector<FileRecord>& files);

    static std::optional<FilterMode> parseMode(const std::string& name);
    static std::string modeName(FilterMode mode);

private:
    size_t m_regex_max_length;
    size_t m_content_line_max_length;

    std::optional<std::regex> compile(const std::string& pattern,
                                      std::optional<std::string>& error) const;

    /**
     * @brief Search each line of a text, skipping lines over the cap
     * @param error Set when a line was skipped or the matcher gave up on one
     * @return True if any searched line matches
     */
    bool searchLines(const std::string& text, const std::regex& pattern,
                     std::optional<std::string>& error) const;

    static const std::string* findContent(const ContentMap& contents, const FileRecord& record);
    static bool containsIgnoreCase(const std::string& haystack, const std::string& needle_lower);
};

} // namespace Sieve
