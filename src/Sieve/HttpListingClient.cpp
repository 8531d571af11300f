// =================================================================
// src/Sieve/HttpListingClient.cpp
// =================================================================
// Implementation for the HTTP listing client.

#include "Sieve/HttpListingClient.hpp"
#include "Sieve/Logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <stdexcept>

namespace Sieve {

HttpListingClient::HttpListingClient(const std::string& server_url, const std::string& endpoint)
    : m_server_url(server_url), m_endpoint(endpoint) {
    LOG_DEBUG("HttpListingClient", "Configured listing endpoint " + m_server_url + m_endpoint);
}

void HttpListingClient::setTimeouts(int connection_timeout_seconds, int read_timeout_seconds) {
    m_connection_timeout_seconds = connection_timeout_seconds;
    m_read_timeout_seconds = read_timeout_seconds;
}

ListingResponse HttpListingClient::listFiles(const ListingRequest& request,
                                             const CancellationToken& token) {
    if (token.isCancelled()) {
        throw ListingAbortedError("Listing request aborted before sending");
    }

    httplib::Client client(m_server_url.c_str());
    client.set_connection_timeout(m_connection_timeout_seconds);
    client.set_read_timeout(m_read_timeout_seconds);

    nlohmann::json request_body = {
        {"directory", request.directory},
        {"includeStats", request.include_stats},
        {"pattern", request.pattern}
    };

    httplib::Headers headers = {{"Accept", "application/json"}};

    auto res = client.Post(m_endpoint.c_str(), headers, request_body.dump(), "application/json");

    if (!res) {
        throw std::runtime_error("Failed to connect to listing server at " + m_server_url +
                                 " (" + httplib::to_string(res.error()) + ")");
    }

    // The reply is discarded when the load was superseded while waiting
    if (token.isCancelled()) {
        throw ListingAbortedError("Listing request aborted");
    }

    return decodeResponse(res->status, res->body);
}

ListingResponse HttpListingClient::decodeResponse(int status, const std::string& body) {
    ListingResponse response;
    response.status = status;

    if (status != 200) {
        try {
            auto json = nlohmann::json::parse(body);
            if (json.is_object() && json.contains("error") && json["error"].is_string()) {
                response.error = json["error"].get<std::string>();
            } else {
                response.error = "Unknown API error";
            }
        } catch (const nlohmann::json::exception&) {
            response.error = body.empty() ? "HTTP error " + std::to_string(status) : body;
        }
        return response;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed listing response: ") + e.what());
    }

    if (json.is_object() && json.contains("files") && json["files"].is_array()) {
        response.has_files = true;
        for (const auto& file : json["files"]) {
            response.files.push_back(file.is_string() ? file.get<std::string>() : std::string());
        }

        // Stats are only trusted when they line up with the files
        if (json.contains("stats") && json["stats"].is_array() &&
            json["stats"].size() == response.files.size()) {
            for (const auto& stat : json["stats"]) {
                if (stat.is_object() && stat.contains("size") && stat["size"].is_number_unsigned()) {
                    response.sizes.push_back(stat["size"].get<uint64_t>());
                } else {
                    response.sizes.push_back(std::nullopt);
                }
            }
        }
    } else if (json.is_object() && json.contains("error")) {
        response.error = json["error"].is_string() ? json["error"].get<std::string>() : json["error"].dump();
    } else {
        response.error = "Invalid response from server";
    }

    return response;
}

} // namespace Sieve
