// =================================================================
// include/Sieve/PathMatcher.hpp
// =================================================================
// Header for resolving free-form path strings against known file records.

#pragma once

#include "Sieve/FileRecord.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Sieve {

/**
 * @brief Strategy that produced a match
 */
enum class MatchStrategy {
    EXACT,          ///< Comparable paths are equal
    SUFFIX,         ///< A record ends with "/" + input
    CONTAINMENT,    ///< The input contains a record's comparable path
    FILE_NAME       ///< Base names agree, disambiguated by trailing segments
};

struct PathMatch {
    std::string key;            ///< FileMap key of the matched record
    MatchStrategy strategy;
};

/**
 * @brief Result of resolving a batch of inputs
 */
struct BatchMatchResult {
    std::vector<std::string> keys;          ///< Matched keys in input order, no duplicates
    std::vector<std::string> warnings;      ///< One "Path not found: <input>" per unmatched input
};

/**
 * @brief Index over a file map that resolves paths by an ordered strategy cascade
 *
 * Strategies are tried in the order exact, suffix, containment, file name;
 * the first one that yields a record wins. Matching is case-sensitive.
 *
 * Suffix ties go to the shortest record path and containment ties to the
 * longest one, each broken lexicographically. The file-name strategy
 * scores candidates by the number of equal trailing segments and picks the
 * highest score; equal scores fall back to key order so repeated calls agree.
 */
class PathMatcher {
public:
    /**
     * @brief Build the indexes for a map
     * @param files Records to match against; must outlive the matcher
     */
    explicit PathMatcher(const FileMap& files);

    /**
     * @brief Resolve one input path
     * @param input Path in any representation (absolute, relative, bare name)
     * @param already_matched Keys claimed earlier in the same batch; skipped by
     *        the file-name strategy
     * @return The match, or std::nullopt when no strategy applies
     */
    std::optional<PathMatch> resolve(const std::string& input,
                                     const std::set<std::string>& already_matched = {}) const;

    /**
     * @brief Resolve a batch, collecting warnings for unmatched inputs
     */
    BatchMatchResult resolveAll(const std::vector<std::string>& inputs) const;

    static std::string strategyName(MatchStrategy strategy);

private:
    const FileMap& m_files;
    std::map<std::string, std::string> m_by_comparable;             ///< comparable path -> key
    std::map<std::string, std::vector<std::string>> m_by_basename;  ///< base name -> keys

    std::optional<std::string> matchSuffix(const std::string& comparable) const;
    std::optional<std::string> matchContainment(const std::string& comparable) const;
    std::optional<std::string> matchFileName(const std::string& comparable,
                                             const std::set<std::string>& already_matched) const;

    /**
     * @brief Count equal path segments walking backwards from the file name
     */
    static size_t trailingSegmentScore(const std::vector<std::string>& input_segments,
                                       const std::vector<std::string>& candidate_segments);
};

} // namespace Sieve
