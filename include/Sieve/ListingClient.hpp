// =================================================================
// include/Sieve/ListingClient.hpp
// =================================================================
// Defines the abstract interface for fetching a directory listing.

#pragma once

#include "Sieve/Cancellation.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Sieve {

/**
 * @brief Body of a listing request
 */
struct ListingRequest {
    std::string directory;          ///< Absolute, normalized directory
    bool include_stats = true;      ///< Ask for per-file sizes
    std::string pattern = "**/*";   ///< Glob the files must match
};

/**
 * @brief Decoded listing reply
 *
 * A status other than 200, or a non-empty error, describes a failed listing.
 */
struct ListingResponse {
    int status = 200;
    std::vector<std::string> files;                 ///< Absolute paths
    std::vector<std::optional<uint64_t>> sizes;     ///< Parallel to files when stats were returned
    std::string error;
    bool has_files = false;                         ///< The body carried a files array

    bool isSuccess() const { return status == 200 && error.empty() && has_files; }
};

/**
 * @brief Raised by a client when its request was cancelled
 */
class ListingAbortedError : public std::runtime_error {
public:
    explicit ListingAbortedError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Source of directory listings
 *
 * Implementations throw std::runtime_error when the transport fails and
 * ListingAbortedError when the token is cancelled. Failures reported by the
 * far end come back as a ListingResponse with a status and an error text.
 */
class ListingClient {
public:
    virtual ~ListingClient() = default;

    /**
     * @brief Fetch the listing for one directory
     * @param request Directory, stats flag and pattern
     * @param token Cancellation token of the owning load
     */
    virtual ListingResponse listFiles(const ListingRequest& request,
                                      const CancellationToken& token) = 0;

    /**
     * @brief Short name used in log messages
     */
    virtual std::string getName() const = 0;
};

} // namespace Sieve
