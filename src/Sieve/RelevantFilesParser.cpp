// =================================================================
// src/Sieve/RelevantFilesParser.cpp
// =================================================================
// Implementation for relevant-files job path extraction.

#include "Sieve/RelevantFilesParser.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/PathNormalizer.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace Sieve {

namespace {

const std::vector<std::string> KNOWN_EXTENSIONS = {
    ".js", ".jsx", ".ts", ".tsx", ".py", ".java", ".c", ".cpp", ".h", ".hpp",
    ".go", ".rb", ".php", ".html", ".css", ".scss", ".json", ".xml", ".yaml",
    ".yml", ".md", ".txt", ".sh", ".bat", ".ps1", ".sql", ".graphql", ".prisma",
    ".vue", ".svelte", ".dart", ".kt", ".swift", ".m", ".rs", ".toml"
};

const size_t MAX_PATH_LINE_LENGTH = 255;

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

JobRecord JobRecord::fromJson(const nlohmann::json& json) {
    JobRecord job;
    if (json.contains("id") && !json["id"].is_null()) {
        job.id = json["id"].is_string() ? json["id"].get<std::string>() : json["id"].dump();
    }
    if (json.contains("status") && !json["status"].is_null()) {
        job.status = json["status"].get<std::string>();
    }
    if (json.contains("response") && !json["response"].is_null()) {
        job.response = json["response"].get<std::string>();
    }
    if (json.contains("errorMessage") && !json["errorMessage"].is_null()) {
        job.error_message = json["errorMessage"].get<std::string>();
    }
    if (json.contains("metadata")) {
        job.metadata = json["metadata"];
    }
    return job;
}

bool JobRecord::isTerminal() const {
    return status == "completed" || status == "failed" || status == "canceled";
}

RelevantFilesParser::RelevantFilesParser(const std::string& project_directory)
    : m_project_directory(project_directory) {}

std::vector<std::string> RelevantFilesParser::extractPaths(const JobRecord& job) const {
    std::vector<std::string> paths = pathsFromMetadata(job.metadata);
    if (!paths.empty()) {
        LOG_DEBUG("RelevantFilesParser", "Job " + job.id + ": " + std::to_string(paths.size()) +
                  " paths from metadata");
        return paths;
    }

    paths = pathsFromResponseText(job.response);
    LOG_DEBUG("RelevantFilesParser", "Job " + job.id + ": " + std::to_string(paths.size()) +
              " paths from response text");
    return paths;
}

std::vector<std::string> RelevantFilesParser::pathsFromMetadata(const nlohmann::json& metadata) const {
    nlohmann::json meta = metadata;
    try {
        if (meta.is_string()) {
            meta = nlohmann::json::parse(meta.get<std::string>());
        }
        if (!meta.is_object() || !meta.contains("pathData")) {
            return {};
        }

        nlohmann::json path_data = meta["pathData"];
        if (path_data.is_string()) {
            path_data = nlohmann::json::parse(path_data.get<std::string>());
        }
        if (!path_data.is_object()) {
            return {};
        }

        std::vector<std::string> raw;
        if (path_data.contains("paths")) {
            raw = readPathArray(path_data["paths"]);
        } else if (path_data.contains("result") && path_data["result"].is_object() &&
                   path_data["result"].contains("paths")) {
            raw = readPathArray(path_data["result"]["paths"]);
        }

        std::vector<std::string> paths;
        for (const auto& path : raw) {
            std::string trimmed = PathNormalizer::trim(path);
            if (!trimmed.empty()) {
                paths.push_back(relativize(trimmed));
            }
        }
        return paths;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARNING("RelevantFilesParser", std::string("Unreadable path metadata: ") + e.what());
        return {};
    }
}

std::vector<std::string> RelevantFilesParser::pathsFromResponseText(const std::string& text) const {
    if (text.empty()) {
        return {};
    }

    std::vector<std::string> tagged = pathsFromTags(text);
    if (!tagged.empty()) {
        return tagged;
    }

    std::vector<std::string> paths;
    for (const auto& line_path : pathsFromLines(text)) {
        std::string comparable = PathNormalizer::normalizeForComparison(line_path);
        if (!comparable.empty()) {
            paths.push_back(comparable);
        }
    }
    return paths;
}

std::vector<std::string> RelevantFilesParser::pathsFromTags(const std::string& text) const {
    static const std::regex file_tag(
        R"re(<file(?:\s+path="([^"]+)"\s*/?|[^>]*)>(?:([^<]+)</file>)?)re");

    std::vector<std::string> paths;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), file_tag);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        std::string candidate;
        if (match[1].matched) {
            candidate = match[1].str();
        } else if (match[2].matched) {
            candidate = match[2].str();
        }

        candidate = PathNormalizer::trim(candidate);
        if (!candidate.empty()) {
            paths.push_back(relativize(candidate));
        }
    }
    return paths;
}

std::vector<std::string> RelevantFilesParser::pathsFromLines(const std::string& text) const {
    static const std::regex prose_prefix(
        "^(note|remember|important|tip|hint|warning|error|caution|attention|info):",
        std::regex_constants::ECMAScript | std::regex_constants::icase);
    static const std::regex list_marker(R"(^[\d\.\s-]+)");
    static const std::regex invalid_chars("[<>:\"|?*\\x00-\\x1F]");
    static const std::regex source_path(R"(^(?:(?:\.{1,2}/)?[\w-]+/)*[\w-]+\.\w+$)");

    std::vector<std::string> paths;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        std::string trimmed = PathNormalizer::trim(line);
        if (trimmed.empty() || startsWith(trimmed, "<") || startsWith(trimmed, "#") ||
            startsWith(trimmed, "//") || startsWith(trimmed, "/*") || startsWith(trimmed, "*")) {
            continue;
        }
        if (std::regex_search(trimmed, prose_prefix)) {
            continue;
        }

        std::string cleaned = PathNormalizer::trim(std::regex_replace(
            trimmed, list_marker, "", std::regex_constants::format_first_only));
        if (cleaned.empty()) {
            continue;
        }

        // More than two words reads as a sentence
        if (std::count(cleaned.begin(), cleaned.end(), ' ') >= 2) continue;
        if (cleaned.size() < 4 || cleaned.size() > MAX_PATH_LINE_LENGTH) continue;
        if (cleaned.find('/') == std::string::npos && cleaned.find('\\') == std::string::npos) continue;
        if (!hasKnownExtension(cleaned) && !endsWith(cleaned, "/")) continue;
        if (cleaned.find("</") != std::string::npos || cleaned.find("](") != std::string::npos) continue;
        if (cleaned.find(':') != std::string::npos && cleaned.find(":/") == std::string::npos) continue;

        // Drive letters are the one place a colon may appear
        std::string checked = cleaned;
        if (checked.size() > 2 && std::isalpha(static_cast<unsigned char>(checked[0])) && checked[1] == ':') {
            checked = checked.substr(2);
        }
        if (std::regex_search(checked, invalid_chars)) continue;

        if (!std::regex_match(cleaned, source_path) && !startsWith(cleaned, "/") &&
            !startsWith(cleaned, "./") && !startsWith(cleaned, "../")) {
            continue;
        }

        if (PathNormalizer::splitSegments(cleaned).size() < 2 && !startsWith(cleaned, "./")) {
            continue;
        }

        paths.push_back(relativize(cleaned));
    }

    return paths;
}

std::string RelevantFilesParser::relativize(const std::string& path) const {
    if (m_project_directory.empty() || !PathNormalizer::isAbsolute(path)) {
        return path;
    }

    auto relative = PathNormalizer::makeRelative(PathNormalizer::normalizePath(path),
                                                 PathNormalizer::normalizePath(m_project_directory));
    return relative ? *relative : path;
}

std::vector<std::string> RelevantFilesParser::readPathArray(const nlohmann::json& node) {
    std::vector<std::string> paths;
    if (!node.is_array()) {
        return paths;
    }
    for (const auto& entry : node) {
        if (entry.is_string()) {
            paths.push_back(entry.get<std::string>());
        }
    }
    return paths;
}

bool RelevantFilesParser::hasKnownExtension(const std::string& path) {
    std::string lower = PathNormalizer::toLower(path);
    for (const auto& extension : KNOWN_EXTENSIONS) {
        if (endsWith(lower, extension)) {
            return true;
        }
    }
    return false;
}

} // namespace Sieve
