// =================================================================
// src/Sieve/PathMatcher.cpp
// =================================================================
// Implementation for the path resolution cascade.

#include "Sieve/PathMatcher.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/PathNormalizer.hpp"

namespace Sieve {

PathMatcher::PathMatcher(const FileMap& files)
    : m_files(files) {
    for (const auto& [key, record] : m_files) {
        const std::string& comparable = record.comparable_path.empty()
            ? key
            : record.comparable_path;
        m_by_comparable.emplace(comparable, key);
        m_by_basename[PathNormalizer::baseName(comparable)].push_back(key);
    }
}

std::optional<PathMatch> PathMatcher::resolve(const std::string& input,
                                              const std::set<std::string>& already_matched) const {
    std::string comparable = PathNormalizer::normalizeForComparison(input);
    if (comparable.empty()) {
        return std::nullopt;
    }

    auto exact = m_by_comparable.find(comparable);
    if (exact != m_by_comparable.end()) {
        return PathMatch{exact->second, MatchStrategy::EXACT};
    }

    if (auto key = matchSuffix(comparable)) {
        return PathMatch{*key, MatchStrategy::SUFFIX};
    }

    // Containment compares against the input with its leading root kept, so
    // an absolute path from another machine still lines up on segments
    std::string with_root = PathNormalizer::normalizePath(PathNormalizer::trim(input));
    if (auto key = matchContainment(with_root)) {
        return PathMatch{*key, MatchStrategy::CONTAINMENT};
    }

    if (auto key = matchFileName(comparable, already_matched)) {
        return PathMatch{*key, MatchStrategy::FILE_NAME};
    }

    return std::nullopt;
}

BatchMatchResult PathMatcher::resolveAll(const std::vector<std::string>& inputs) const {
    BatchMatchResult result;
    std::set<std::string> matched;

    for (const auto& input : inputs) {
        if (PathNormalizer::trim(input).empty()) {
            continue;
        }

        auto match = resolve(input, matched);
        if (!match) {
            result.warnings.push_back("Path not found: " + input);
            LOG_WARNING("PathMatcher", "No file matches '" + input + "'");
            continue;
        }

        LOG_DEBUG("PathMatcher", "'" + input + "' -> " + match->key + " (" +
                  strategyName(match->strategy) + ")");

        if (matched.insert(match->key).second) {
            result.keys.push_back(match->key);
        }
    }

    return result;
}

std::string PathMatcher::strategyName(MatchStrategy strategy) {
    switch (strategy) {
        case MatchStrategy::EXACT: return "exact";
        case MatchStrategy::SUFFIX: return "suffix";
        case MatchStrategy::CONTAINMENT: return "containment";
        case MatchStrategy::FILE_NAME: return "file name";
        default: return "unknown";
    }
}

std::optional<std::string> PathMatcher::matchSuffix(const std::string& comparable) const {
    const std::string needle = "/" + comparable;
    std::optional<std::string> best_comparable;
    std::optional<std::string> best_key;

    for (const auto& [candidate, key] : m_by_comparable) {
        if (candidate.size() <= needle.size()) {
            continue;
        }
        if (candidate.compare(candidate.size() - needle.size(), needle.size(), needle) != 0) {
            continue;
        }
        // Map order makes the first of equal length the lexicographically smallest
        if (!best_comparable || candidate.size() < best_comparable->size()) {
            best_comparable = candidate;
            best_key = key;
        }
    }

    return best_key;
}

std::optional<std::string> PathMatcher::matchContainment(const std::string& comparable) const {
    std::optional<std::string> best_comparable;
    std::optional<std::string> best_key;

    for (const auto& [candidate, key] : m_by_comparable) {
        if (candidate.size() >= comparable.size()) {
            continue;
        }

        size_t pos = comparable.find(candidate);
        bool aligned = false;
        while (pos != std::string::npos) {
            bool starts_segment = (pos == 0 || comparable[pos - 1] == '/');
            size_t end = pos + candidate.size();
            bool ends_segment = (end == comparable.size() || comparable[end] == '/');
            if (starts_segment && ends_segment) {
                aligned = true;
                break;
            }
            pos = comparable.find(candidate, pos + 1);
        }

        if (aligned && (!best_comparable || candidate.size() > best_comparable->size())) {
            best_comparable = candidate;
            best_key = key;
        }
    }

    return best_key;
}

std::optional<std::string> PathMatcher::matchFileName(const std::string& comparable,
                                                      const std::set<std::string>& already_matched) const {
    auto bucket = m_by_basename.find(PathNormalizer::baseName(comparable));
    if (bucket == m_by_basename.end()) {
        return std::nullopt;
    }

    std::vector<std::string> candidates;
    for (const auto& key : bucket->second) {
        if (already_matched.count(key) == 0) {
            candidates.push_back(key);
        }
    }

    if (candidates.empty()) {
        return std::nullopt;
    }
    if (candidates.size() == 1) {
        return candidates.front();
    }

    std::vector<std::string> input_segments = PathNormalizer::splitSegments(comparable);
    std::optional<std::string> best_key;
    size_t best_score = 0;

    for (const auto& key : candidates) {
        const FileRecord& record = m_files.at(key);
        const std::string& candidate = record.comparable_path.empty()
            ? key
            : record.comparable_path;
        size_t score = trailingSegmentScore(input_segments, PathNormalizer::splitSegments(candidate));
        if (!best_key || score > best_score) {
            best_key = key;
            best_score = score;
        }
    }

    return best_key;
}

size_t PathMatcher::trailingSegmentScore(const std::vector<std::string>& input_segments,
                                         const std::vector<std::string>& candidate_segments) {
    size_t score = 0;
    auto input_it = input_segments.rbegin();
    auto candidate_it = candidate_segments.rbegin();

    while (input_it != input_segments.rend() && candidate_it != candidate_segments.rend() &&
           *input_it == *candidate_it) {
        score++;
        ++input_it;
        ++candidate_it;
    }
    return score;
}

} // namespace Sieve
