// =================================================================
// src/Sieve/LocalListingClient.cpp
// =================================================================
// Implementation for the in-process directory listing.

#include "Sieve/LocalListingClient.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/PathNormalizer.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace Sieve {

LocalListingClient::LocalListingClient(const std::vector<std::string>& excluded_directories)
    : m_excluded_directories(excluded_directories) {}

void LocalListingClient::setIncludeDotfiles(bool include) {
    m_include_dotfiles = include;
}

void LocalListingClient::addIgnorePattern(const std::string& pattern) {
    m_ignore_patterns.addPattern(pattern);
}

ListingResponse LocalListingClient::listFiles(const ListingRequest& request,
                                              const CancellationToken& token) {
    if (token.isCancelled()) {
        throw ListingAbortedError("Listing request aborted before walking");
    }

    ListingResponse response = validateDirectory(request.directory);
    if (response.status != 200) {
        Logger::getInstance().warning("LocalListingClient", response.error, request.directory);
        return response;
    }

    fs::path root(request.directory);
    GlobPattern file_pattern(request.pattern.empty() ? "**/*" : request.pattern);

    std::vector<std::pair<std::string, std::optional<uint64_t>>> found;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("Cannot walk " + request.directory + ": " + ec.message());
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            Logger::getInstance().warning("LocalListingClient", "Stopped walking after an unreadable entry",
                                          ec.message());
            break;
        }
        if (token.isCancelled()) {
            throw ListingAbortedError("Listing request aborted while walking");
        }

        const fs::directory_entry& entry = *it;
        std::string name = entry.path().filename().string();
        std::string relative_path = getRelativePath(root, entry.path());

        if (entry.is_directory(ec)) {
            bool hidden = !m_include_dotfiles && !name.empty() && name[0] == '.';
            if (hidden || isExcludedDirectory(name) || m_ignore_patterns.matches(relative_path, true)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (!entry.is_regular_file(ec)) {
            continue;
        }
        if (!m_include_dotfiles && !name.empty() && name[0] == '.') {
            continue;
        }
        if (m_ignore_patterns.matches(relative_path, false)) {
            continue;
        }
        if (!file_pattern.matches(relative_path, false)) {
            continue;
        }

        std::optional<uint64_t> size;
        if (request.include_stats) {
            std::error_code size_ec;
            auto file_size = entry.file_size(size_ec);
            if (size_ec) {
                // Files whose stats fail are left out of a stats listing
                LOG_DEBUG("LocalListingClient", "Cannot stat " + relative_path + ": " + size_ec.message());
                continue;
            }
            size = static_cast<uint64_t>(file_size);
        }

        found.emplace_back(PathNormalizer::normalizePath(entry.path().string()), size);
    }

    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    response.has_files = true;
    for (const auto& file : found) {
        response.files.push_back(file.first);
        if (request.include_stats) {
            response.sizes.push_back(file.second);
        }
    }

    Logger::getInstance().debug("LocalListingClient",
                                "Listed " + std::to_string(response.files.size()) + " files",
                                request.directory);
    return response;
}

bool LocalListingClient::isExcludedDirectory(const std::string& name) const {
    return std::find(m_excluded_directories.begin(), m_excluded_directories.end(), name) !=
           m_excluded_directories.end();
}

ListingResponse LocalListingClient::validateDirectory(const std::string& directory) const {
    ListingResponse response;

    if (directory.empty()) {
        response.status = 400;
        response.error = "Directory is required";
        return response;
    }

    if (!PathNormalizer::isAbsolute(directory)) {
        response.status = 400;
        response.error = "Directory must be an absolute path";
        return response;
    }

    for (const auto& segment : PathNormalizer::splitSegments(directory)) {
        if (segment == "..") {
            response.status = 400;
            response.error = "Invalid directory path";
            return response;
        }
    }

    std::error_code ec;
    fs::file_status status = fs::status(directory, ec);
    if (ec || !fs::exists(status)) {
        if (ec == std::errc::permission_denied) {
            response.status = 403;
            response.error = "Permission denied accessing directory";
        } else {
            response.status = 404;
            response.error = "Directory not found";
        }
        return response;
    }

    if (!fs::is_directory(status)) {
        response.status = 400;
        response.error = "Path exists but is not a directory";
        return response;
    }

    fs::directory_iterator probe(directory, ec);
    if (ec) {
        response.status = (ec == std::errc::permission_denied) ? 403 : 500;
        response.error = (response.status == 403) ? "Permission denied accessing directory"
                                                  : "Failed to read directory: " + ec.message();
        return response;
    }

    return response;
}

std::string LocalListingClient::getRelativePath(const fs::path& root, const fs::path& path) const {
    return PathNormalizer::normalizePath(path.lexically_relative(root).generic_string());
}

} // namespace Sieve
