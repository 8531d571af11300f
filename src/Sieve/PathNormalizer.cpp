// =================================================================
// src/Sieve/PathNormalizer.cpp
// =================================================================
// Implementation for the pure path helpers.

#include "Sieve/PathNormalizer.hpp"
#include <algorithm>
#include <cctype>

namespace Sieve {

static bool hasDrivePrefix(const std::string& path) {
    return path.size() >= 3 &&
           std::isalpha(static_cast<unsigned char>(path[0])) &&
           path[1] == ':' &&
           (path[2] == '/' || path[2] == '\\');
}

std::string PathNormalizer::normalizePath(const std::string& path, bool add_trailing_slash) {
    if (path.empty()) {
        return path;
    }

    std::string result;
    result.reserve(path.size() + 1);
    for (char c : path) {
        char unified = (c == '\\') ? '/' : c;
        if (unified == '/' && !result.empty() && result.back() == '/') {
            continue;
        }
        result += unified;
    }

    if (add_trailing_slash && result.back() != '/') {
        result += '/';
    }
    return result;
}

std::string PathNormalizer::normalizeForComparison(const std::string& path) {
    std::string result = normalizePath(trim(path));
    if (result.empty()) {
        return result;
    }

    if (result.compare(0, 2, "./") == 0) {
        result.erase(0, 2);
    }
    if (!result.empty() && result[0] == '/') {
        result.erase(0, 1);
    }
    return result;
}

std::optional<std::string> PathNormalizer::makeRelative(const std::string& absolute_path,
                                                        const std::string& base_directory) {
    if (absolute_path.empty() || base_directory.empty()) {
        return std::nullopt;
    }

    std::string path = normalizePath(trim(absolute_path));
    std::string base = normalizePath(trim(base_directory), true);

    bool matches = false;
    if (hasDrivePrefix(path) && hasDrivePrefix(base)) {
        // Drive letters compare case-insensitively, the rest exactly
        matches = path.size() > base.size() &&
                  std::tolower(static_cast<unsigned char>(path[0])) ==
                      std::tolower(static_cast<unsigned char>(base[0])) &&
                  path.compare(1, base.size() - 1, base, 1, base.size() - 1) == 0;
    } else {
        matches = path.size() > base.size() && path.compare(0, base.size(), base) == 0;
    }

    if (!matches) {
        return std::nullopt;
    }

    std::string relative = path.substr(base.size());
    if (relative.empty()) {
        return std::nullopt;
    }
    return relative;
}

bool PathNormalizer::isAbsolute(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    return path[0] == '/' || path[0] == '\\' || hasDrivePrefix(path);
}

std::string PathNormalizer::baseName(const std::string& path) {
    std::string normalized = normalizePath(path);
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    size_t pos = normalized.find_last_of('/');
    if (pos == std::string::npos) {
        return normalized;
    }
    return normalized.substr(pos + 1);
}

std::string PathNormalizer::directoryName(const std::string& path) {
    std::string normalized = normalizePath(path);
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    size_t pos = normalized.find_last_of('/');
    if (pos == std::string::npos) {
        return "";
    }
    return normalized.substr(0, pos);
}

std::vector<std::string> PathNormalizer::splitSegments(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

std::string PathNormalizer::toLower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string PathNormalizer::trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

} // namespace Sieve
