// =================================================================
// include/Sieve/RelevantFilesParser.hpp
// =================================================================
// Header for extracting file paths from a finished relevant-files job.

#pragma once

#include "nlohmann/json.hpp"
#include <string>
#include <vector>

namespace Sieve {

/**
 * @brief Snapshot of a background job as reported by the job store
 */
struct JobRecord {
    std::string id;
    std::string status;             ///< "queued", "running", "completed", "failed", "canceled", ...
    std::string response;           ///< Raw response text
    std::string error_message;
    nlohmann::json metadata;        ///< Object, JSON string or null

    /**
     * @brief Build a record from the job store's JSON
     *
     * Reads id, status, response, errorMessage and metadata. Missing fields
     * stay empty.
     * @throws nlohmann::json::exception if a present field has the wrong type
     */
    static JobRecord fromJson(const nlohmann::json& json);

    bool isTerminal() const;
    bool isCompleted() const { return status == "completed"; }
};

/**
 * @brief Turns a job record into a list of candidate paths for PathMatcher
 *
 * Structured metadata is preferred: metadata.pathData, given either as an
 * object or as a JSON-encoded string, with a "paths" array or a
 * "result.paths" array. Without usable metadata the response text is
 * scanned, first for <file path="..."/> and <file>...</file> tags and then
 * line by line for things that look like source paths.
 */
class RelevantFilesParser {
public:
    /**
     * @param project_directory Absolute project root; absolute paths inside
     *        it are made relative. Empty disables the conversion.
     */
    explicit RelevantFilesParser(const std::string& project_directory = "");

    std::vector<std::string> extractPaths(const JobRecord& job) const;

    /**
     * @brief Paths from job metadata
     * @return Empty when the metadata carries no path data
     */
    std::vector<std::string> pathsFromMetadata(const nlohmann::json& metadata) const;

    /**
     * @brief Tags first, then line heuristics; heuristic results are normalized
     */
    std::vector<std::string> pathsFromResponseText(const std::string& text) const;

    std::vector<std::string> pathsFromTags(const std::string& text) const;
    std::vector<std::string> pathsFromLines(const std::string& text) const;

private:
    std::string m_project_directory;

    std::string relativize(const std::string& path) const;
    static std::vector<std::string> readPathArray(const nlohmann::json& node);
    static bool hasKnownExtension(const std::string& path);
};

} // namespace Sieve
