// =================================================================
// include/Sieve/LocalListingClient.hpp
// =================================================================
// Listing client that walks the local filesystem in-process.

#pragma once

#include "Sieve/ListingClient.hpp"
#include "Sieve/GlobPattern.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace Sieve {

/**
 * @brief Answers listing requests by walking a directory tree
 *
 * Replies with the same statuses a listing server would: 400 for a missing,
 * relative or traversing directory and for a path that is not a directory,
 * 404 when the directory does not exist and 403 when it cannot be read.
 * Files are reported as absolute, '/' separated paths in sorted order.
 */
class LocalListingClient : public ListingClient {
public:
    /**
     * @brief Construct a client
     * @param excluded_directories Directory names skipped at any depth
     */
    explicit LocalListingClient(const std::vector<std::string>& excluded_directories =
                                    {"node_modules", ".git", ".next", "dist", "build"});

    ListingResponse listFiles(const ListingRequest& request,
                              const CancellationToken& token) override;

    std::string getName() const override { return "local"; }

    /**
     * @brief Also list files and directories whose name starts with '.'
     */
    void setIncludeDotfiles(bool include);

    /**
     * @brief Add a gitignore-style pattern of paths to leave out
     */
    void addIgnorePattern(const std::string& pattern);

private:
    std::vector<std::string> m_excluded_directories;
    GlobPatternSet m_ignore_patterns;
    bool m_include_dotfiles = false;

    bool isExcludedDirectory(const std::string& name) const;

    /**
     * @brief Validate the requested directory
     * @return An error response, or a response with status 200 when usable
     */
    ListingResponse validateDirectory(const std::string& directory) const;

    std::string getRelativePath(const std::filesystem::path& root,
                                const std::filesystem::path& path) const;
};

} // namespace Sieve
