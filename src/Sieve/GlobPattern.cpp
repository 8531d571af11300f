// =================================================================
// src/Sieve/GlobPattern.cpp
// =================================================================
// Implementation for glob matching.

#include "Sieve/GlobPattern.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/PathNormalizer.hpp"
#include <fstream>

namespace Sieve {

GlobPattern::GlobPattern(const std::string& pattern)
    : m_original_pattern(pattern) {
    compile(pattern);
}

bool GlobPattern::matches(const std::string& path, bool is_directory) const {
    if (m_is_empty) {
        return false;
    }
    if (m_directory_only && !is_directory) {
        return false;
    }

    try {
        return std::regex_match(path, m_regex);
    } catch (const std::regex_error& e) {
        LOG_WARNING("GlobPattern", "Regex error in pattern '" + m_original_pattern + "': " + e.what());
        return false;
    }
}

void GlobPattern::compile(const std::string& pattern) {
    std::string working = PathNormalizer::trim(pattern);

    if (working.empty() || working[0] == '#') {
        m_is_empty = true;
        return;
    }

    if (working[0] == '!') {
        m_is_negation = true;
        working.erase(0, 1);
    }

    if (!working.empty() && working.back() == '/') {
        m_directory_only = true;
        working.pop_back();
    }

    if (!working.empty() && working[0] == '/') {
        m_is_anchored = true;
        working.erase(0, 1);
    }

    if (working.empty()) {
        m_is_empty = true;
        return;
    }

    m_has_separator = working.find('/') != std::string::npos;

    std::string body = globToRegex(working);
    std::string full;
    if (m_is_anchored || m_has_separator) {
        full = body;
    } else {
        // Bare names match the last path component at any depth
        full = "(?:.*/)?" + body;
    }

    try {
        m_regex = std::regex(full, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        LOG_WARNING("GlobPattern", "Failed to compile pattern '" + pattern + "': " + e.what());
        m_is_empty = true;
    }
}

std::string GlobPattern::globToRegex(const std::string& glob) const {
    std::string regex;
    bool in_class = false;

    for (size_t i = 0; i < glob.length(); ++i) {
        char c = glob[i];

        if (in_class) {
            if (c == ']') {
                in_class = false;
                regex += ']';
            } else if (c == '\\') {
                regex += "\\\\";
            } else {
                regex += c;
            }
            continue;
        }

        switch (c) {
            case '*':
                if (i + 1 < glob.length() && glob[i + 1] == '*') {
                    bool at_segment_start = (i == 0 || glob[i - 1] == '/');
                    if (at_segment_start && i + 2 < glob.length() && glob[i + 2] == '/') {
                        // "**/" spans zero or more whole directories
                        regex += "(?:.*/)?";
                        i += 2;
                    } else if (at_segment_start && i + 2 == glob.length()) {
                        regex += ".*";
                        i += 1;
                    } else {
                        regex += "[^/]*";
                        i += 1;
                    }
                } else {
                    regex += "[^/]*";
                }
                break;

            case '?':
                regex += "[^/]";
                break;

            case '[': {
                size_t close = glob.find(']', i + 1);
                if (close == std::string::npos) {
                    regex += "\\[";
                    break;
                }
                in_class = true;
                regex += '[';
                if (i + 1 < glob.length() && glob[i + 1] == '!') {
                    regex += '^';
                    ++i;
                }
                break;
            }

            case '\\':
                if (i + 1 < glob.length()) {
                    regex += '\\';
                    regex += glob[++i];
                } else {
                    regex += "\\\\";
                }
                break;

            case '.': case '^': case '$': case '+': case '{':
            case '}': case '|': case '(': case ')': case ']':
                regex += '\\';
                regex += c;
                break;

            default:
                regex += c;
                break;
        }
    }

    return regex;
}

// GlobPatternSet implementation

void GlobPatternSet::addPattern(const std::string& pattern) {
    GlobPattern glob(pattern);
    if (!glob.isEmpty()) {
        m_patterns.push_back(std::move(glob));
    }
}

size_t GlobPatternSet::loadFromFile(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return 0;
    }

    size_t loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        GlobPattern glob(line);
        if (!glob.isEmpty()) {
            m_patterns.push_back(std::move(glob));
            loaded++;
        }
    }
    return loaded;
}

bool GlobPatternSet::matches(const std::string& path, bool is_directory) const {
    bool matched = false;
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path, is_directory)) {
            matched = !pattern.isNegation();
        }
    }
    return matched;
}

} // namespace Sieve
