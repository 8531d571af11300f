// =================================================================
// tests/HttpListingClientTest.cpp
// =================================================================
// Unit tests for HttpListingClient against a local httplib server.

#include "Sieve/HttpListingClient.hpp"
#include "Sieve/Logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <cassert>

using namespace Sieve;

class HttpListingClientTest {
public:
    void testDecodeSuccess() {
        std::cout << "Testing successful response decoding..." << std::endl;

        std::string body = R"({
            "files": ["/proj/a.ts", "/proj/b.ts", 5],
            "stats": [{"size": 10}, {"size": "big"}, {}]
        })";
        ListingResponse response = HttpListingClient::decodeResponse(200, body);

        assert(response.isSuccess());
        assert(response.files.size() == 3);
        assert(response.files[2].empty());
        assert(response.sizes.size() == 3);
        assert(response.sizes[0] && *response.sizes[0] == 10);
        assert(!response.sizes[1]);

        // Misaligned stats are dropped
        ListingResponse misaligned = HttpListingClient::decodeResponse(
            200, R"({"files": ["/proj/a.ts"], "stats": []})");
        assert(misaligned.isSuccess());
        assert(misaligned.sizes.empty());

        std::cout << "✓ Successful response decoding test passed" << std::endl;
    }

    void testDecodeErrors() {
        std::cout << "Testing error response decoding..." << std::endl;

        ListingResponse not_found = HttpListingClient::decodeResponse(404, R"({"error": "/proj"})");
        assert(not_found.status == 404);
        assert(not_found.error == "/proj");
        assert(!not_found.isSuccess());

        assert(HttpListingClient::decodeResponse(500, "{}").error == "Unknown API error");
        assert(HttpListingClient::decodeResponse(502, "Bad Gateway").error == "Bad Gateway");
        assert(HttpListingClient::decodeResponse(503, "").error == "HTTP error 503");

        ListingResponse error_body = HttpListingClient::decodeResponse(200, R"({"error": "disk gone"})");
        assert(!error_body.isSuccess());
        assert(error_body.error == "disk gone");

        ListingResponse no_files = HttpListingClient::decodeResponse(200, R"({"files": null})");
        assert(no_files.error == "Invalid response from server");

        bool threw = false;
        try {
            HttpListingClient::decodeResponse(200, "<html>");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ Error response decoding test passed" << std::endl;
    }

    void testRoundTripWithServer() {
        std::cout << "Testing request against local server..." << std::endl;

        httplib::Server server;
        nlohmann::json received;
        server.Post("/api/list-files", [&received](const httplib::Request& req, httplib::Response& res) {
            received = nlohmann::json::parse(req.body);
            nlohmann::json reply = {
                {"files", nlohmann::json::array({received["directory"].get<std::string>() + "/src/a.ts"})},
                {"stats", nlohmann::json::array({nlohmann::json{{"size", 42}}})}
            };
            res.set_content(reply.dump(), "application/json");
        });

        int port = server.bind_to_any_port("127.0.0.1");
        assert(port > 0);
        std::thread server_thread([&server]() { server.listen_after_bind(); });
        while (!server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        HttpListingClient client("http://127.0.0.1:" + std::to_string(port));
        client.setTimeouts(2, 5);

        ListingRequest request;
        request.directory = "/proj";
        request.include_stats = true;
        request.pattern = "src/**";
        ListingResponse response = client.listFiles(request, CancellationToken());

        server.stop();
        server_thread.join();

        assert(received["directory"] == "/proj");
        assert(received["includeStats"] == true);
        assert(received["pattern"] == "src/**");
        assert(response.isSuccess());
        assert(response.files == std::vector<std::string>{"/proj/src/a.ts"});
        assert(response.sizes.size() == 1 && *response.sizes[0] == 42);

        std::cout << "✓ Local server test passed" << std::endl;
    }

    void testTransportFailures() {
        std::cout << "Testing transport failures..." << std::endl;

        HttpListingClient client("http://127.0.0.1:1");
        client.setTimeouts(1, 1);

        ListingRequest request;
        request.directory = "/proj";

        bool threw = false;
        try {
            client.listFiles(request, CancellationToken());
        } catch (const ListingAbortedError&) {
            assert(false && "Connection failures are not aborts");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        CancellationSource source;
        source.cancel();
        bool aborted = false;
        try {
            client.listFiles(request, source.token());
        } catch (const ListingAbortedError&) {
            aborted = true;
        }
        assert(aborted);

        std::cout << "✓ Transport failure test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running HttpListingClient unit tests..." << std::endl;

        testDecodeSuccess();
        testDecodeErrors();
        testRoundTripWithServer();
        testTransportFailures();

        std::cout << "All HttpListingClient tests passed!" << std::endl;
    }
};

int main() {
    Logger::getInstance().setConsoleLogLevel(LogLevel::CRITICAL);

    try {
        HttpListingClientTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All HttpListingClient component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
