// =================================================================
// include/Sieve/HttpListingClient.hpp
// =================================================================
// Listing client that talks to a list-files HTTP endpoint.

#pragma once

#include "Sieve/ListingClient.hpp"
#include <string>

namespace Sieve {

/**
 * @brief Posts listing requests as JSON and decodes the JSON reply
 *
 * Request body: {"directory", "includeStats", "pattern"}.
 * Reply body: {"files": [...], "stats": [{"size": n}, ...]} or {"error": "..."}.
 */
class HttpListingClient : public ListingClient {
public:
    /**
     * @brief Construct a client for one server
     * @param server_url Base URL, e.g. http://localhost:3000
     * @param endpoint Path of the listing endpoint
     */
    HttpListingClient(const std::string& server_url, const std::string& endpoint = "/api/list-files");

    ListingResponse listFiles(const ListingRequest& request,
                              const CancellationToken& token) override;

    std::string getName() const override { return "http"; }

    void setTimeouts(int connection_timeout_seconds, int read_timeout_seconds);

    /**
     * @brief Decode a reply body for a given status
     *
     * Non-JSON bodies on error statuses become the error text, or
     * "HTTP error <status>" when empty. A 200 body with neither files nor
     * error becomes "Invalid response from server".
     */
    static ListingResponse decodeResponse(int status, const std::string& body);

private:
    std::string m_server_url;
    std::string m_endpoint;
    int m_connection_timeout_seconds = 10;
    int m_read_timeout_seconds = 60;
};

} // namespace Sieve
