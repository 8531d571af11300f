// =================================================================
// src/Sieve/FileFilterEngine.cpp
// =================================================================
// Implementation for the file filter pipeline.

#include "Sieve/FileFilterEngine.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/PathNormalizer.hpp"
#include <algorithm>

namespace Sieve {

FileFilterEngine::FileFilterEngine(size_t regex_max_length, size_t content_line_max_length)
    : m_regex_max_length(regex_max_length),
      m_content_line_max_length(content_line_max_length) {}

FilterResult FileFilterEngine::filter(const FileMap& files,
                                      const ContentMap& contents,
                                      const std::string& search_term,
                                      FilterMode mode,
                                      const RegexPatterns& patterns) const {
    FilterResult result;

    for (const auto& [key, record] : files) {
        if (mode == FilterMode::SELECTED && !(record.included && !record.force_excluded)) {
            continue;
        }
        result.files.push_back(record);
    }

    std::string term = PathNormalizer::toLower(PathNormalizer::trim(search_term));
    if (!term.empty()) {
        std::vector<FileRecord> matched;
        for (auto& record : result.files) {
            if (containsIgnoreCase(record.path, term) ||
                containsIgnoreCase(record.comparable_path, term)) {
                matched.push_back(std::move(record));
            }
        }
        result.files = std::move(matched);
    }

    if (mode != FilterMode::REGEX || patterns.empty()) {
        return result;
    }

    auto title = compile(patterns.title, result.title_error);
    auto negative_title = compile(patterns.negative_title, result.negative_title_error);
    std::optional<std::regex> content;
    std::optional<std::regex> negative_content;
    if (!contents.empty()) {
        content = compile(patterns.content, result.content_error);
        negative_content = compile(patterns.negative_content, result.negative_content_error);
    } else {
        // Still report a bad content pattern even though it cannot run
        result.content_error = validatePattern(patterns.content);
        result.negative_content_error = validatePattern(patterns.negative_content);
    }

    std::vector<FileRecord> kept;
    for (auto& record : result.files) {
        if (title && !std::regex_search(record.path, *title)) {
            continue;
        }
        if (negative_title && std::regex_search(record.path, *negative_title)) {
            continue;
        }

        const std::string* text = (content || negative_content) ? findContent(contents, record) : nullptr;
        if (content && (!text || !searchLines(*text, *content, result.content_error))) {
            continue;
        }
        if (negative_content && text && searchLines(*text, *negative_content, result.negative_content_error)) {
            continue;
        }

        kept.push_back(std::move(record));
    }
    result.files = std::move(kept);

    if (result.hasErrors()) {
        LOG_DEBUG("FileFilterEngine", "Some regex slots reported errors");
    }
    return result;
}

std::optional<std::string> FileFilterEngine::validatePattern(const std::string& pattern) const {
    std::optional<std::string> error;
    compile(pattern, error);
    return error;
}

void FileFilterEngine::sortForDisplay(std::vector<FileRecord>& files) {
    std::stable_sort(files.begin(), files.end(), [](const FileRecord& a, const FileRecord& b) {
        std::vector<std::string> a_parts = PathNormalizer::splitSegments(a.path);
        std::vector<std::string> b_parts = PathNormalizer::splitSegments(b.path);
        size_t min_parts = std::min(a_parts.size(), b_parts.size());

        // Directory segments only; the last shared index is compared as a full path below
        for (size_t i = 0; i + 1 < min_parts; ++i) {
            if (a_parts[i] != b_parts[i]) {
                return a_parts[i] < b_parts[i];
            }
        }
        return a.path < b.path;
    });
}

std::optional<FilterMode> FileFilterEngine::parseMode(const std::string& name) {
    std::string lower = PathNormalizer::toLower(PathNormalizer::trim(name));
    if (lower == "all") return FilterMode::ALL;
    if (lower == "selected") return FilterMode::SELECTED;
    if (lower == "regex") return FilterMode::REGEX;
    return std::nullopt;
}

std::string FileFilterEngine::modeName(FilterMode mode) {
    switch (mode) {
        case FilterMode::ALL: return "all";
        case FilterMode::SELECTED: return "selected";
        case FilterMode::REGEX: return "regex";
        default: return "unknown";
    }
}

std::optional<std::regex> FileFilterEngine::compile(const std::string& pattern,
                                                    std::optional<std::string>& error) const {
    error.reset();
    if (PathNormalizer::trim(pattern).empty()) {
        return std::nullopt;
    }

    if (pattern.size() > m_regex_max_length) {
        error = "Regex pattern is too long (max " + std::to_string(m_regex_max_length) + " characters)";
        return std::nullopt;
    }

    try {
        return std::regex(pattern, std::regex_constants::ECMAScript | std::regex_constants::icase);
    } catch (const std::regex_error& e) {
        error = std::string("Invalid regex: ") + e.what();
        LOG_DEBUG("FileFilterEngine", "Rejected pattern '" + pattern + "': " + e.what());
        return std::nullopt;
    }
}

bool FileFilterEngine::searchLines(const std::string& text, const std::regex& pattern,
                                   std::optional<std::string>& error) const {
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }

        if (end - start > m_content_line_max_length) {
            if (!error) {
                error = "Skipped content lines longer than " +
                        std::to_string(m_content_line_max_length) + " characters";
            }
        } else {
            try {
                if (std::regex_search(text.begin() + start, text.begin() + end, pattern)) {
                    return true;
                }
            } catch (const std::regex_error& e) {
                // error_complexity / error_stack: treat the line as not matching
                if (!error) {
                    error = std::string("Regex matching failed: ") + e.what();
                }
                LOG_DEBUG("FileFilterEngine", std::string("Regex gave up on a content line: ") + e.what());
            }
        }

        if (end == text.size()) {
            break;
        }
        start = end + 1;
    }
    return false;
}

const std::string* FileFilterEngine::findContent(const ContentMap& contents, const FileRecord& record) {
    auto it = contents.find(record.comparable_path);
    if (it == contents.end()) {
        it = contents.find(record.path);
    }
    return it != contents.end() ? &it->second : nullptr;
}

bool FileFilterEngine::containsIgnoreCase(const std::string& haystack, const std::string& needle_lower) {
    if (haystack.empty()) {
        return false;
    }
    return PathNormalizer::toLower(haystack).find(needle_lower) != std::string::npos;
}

} // namespace Sieve
