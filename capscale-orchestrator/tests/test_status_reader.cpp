/**
 * @file test_status_reader.cpp
 * @brief Unit tests for StatusReader and management endpoint paths
 */

#include <catch2/catch.hpp>
#include "../src/status_reader.hpp"
#include "test_support.hpp"

using namespace capscale;
using namespace capscale::testing;

TEST_CASE("ManagementEndpoint paths", "[status_reader]") {
    ManagementEndpoint endpoint;
    auto coordinates = test_coordinates();

    REQUIRE(endpoint.api_version == "2023-11-01");
    REQUIRE(endpoint.resource_path(coordinates) == kTestResourcePath);
    REQUIRE(endpoint.action_path(coordinates, "resume") ==
            std::string(kTestResourceId) + "/resume?api-version=2023-11-01");

    SECTION("API version is configurable") {
        endpoint.api_version = "2022-07-01-preview";
        REQUIRE(endpoint.resource_path(coordinates) ==
                std::string(kTestResourceId) + "?api-version=2022-07-01-preview");
    }

    SECTION("Bearer headers carry the explicit token") {
        auto headers = bearer_headers(test_credentials());
        REQUIRE(headers.at("Authorization") == "Bearer test-token-abcdef123456");
        REQUIRE(headers.at("Content-Type") == "application/json");
    }
}

TEST_CASE("StatusReader - successful read", "[status_reader]") {
    MockTransport transport;
    transport.script_status("F8", "Active");
    StatusReader reader(transport, ManagementEndpoint());

    auto snapshot = reader.read(test_coordinates(), test_credentials());

    REQUIRE(snapshot.sku == Sku::F8);
    REQUIRE(snapshot.state == LifecycleState::ACTIVE);
    REQUIRE(snapshot.location == "westeurope");
    REQUIRE(snapshot.coordinates == test_coordinates());

    REQUIRE(transport.requests.size() == 1);
    const auto& request = transport.requests.front();
    REQUIRE(request.method == "GET");
    REQUIRE(request.path == kTestResourcePath);
    REQUIRE(request.body.empty());
    REQUIRE(request.headers.at("Authorization") == "Bearer test-token-abcdef123456");
}

TEST_CASE("StatusReader - failures are never defaulted", "[status_reader]") {
    MockTransport transport;
    StatusReader reader(transport, ManagementEndpoint());

    SECTION("Non-success status carries code and body") {
        transport.script_get(json_response(403, R"({"error":{"code":"AuthorizationFailed"}})"));

        try {
            reader.read(test_coordinates(), test_credentials());
            FAIL("Expected ApiError");
        } catch (const ApiError& e) {
            REQUIRE(e.kind() == ErrorKind::STATUS_FETCH_FAILED);
            REQUIRE(e.status_code() == 403);
            REQUIRE(e.response_body().find("AuthorizationFailed") != std::string::npos);
            std::string message = e.what();
            REQUIRE(message.find("HTTP 403") != std::string::npos);
            REQUIRE(message.find("analytics") != std::string::npos);
        }
    }

    SECTION("Transport error") {
        transport.fail_transport = true;

        try {
            reader.read(test_coordinates(), test_credentials());
            FAIL("Expected ApiError");
        } catch (const ApiError& e) {
            REQUIRE(e.kind() == ErrorKind::STATUS_FETCH_FAILED);
            REQUIRE(e.status_code() == 0);
            REQUIRE(std::string(e.what()).find("CURL error") != std::string::npos);
        }
    }

    SECTION("Body that is not JSON") {
        transport.script_get(json_response(200, "<html>gateway</html>"));
        REQUIRE_THROWS_AS(reader.read(test_coordinates(), test_credentials()), ApiError);
    }

    SECTION("JSON without the capacity fields") {
        transport.script_get(json_response(200, R"({"name":"analytics"})"));

        try {
            reader.read(test_coordinates(), test_credentials());
            FAIL("Expected ApiError");
        } catch (const ApiError& e) {
            REQUIRE(e.kind() == ErrorKind::STATUS_FETCH_FAILED);
            REQUIRE(e.status_code() == 200);
            REQUIRE(e.response_body() == R"({"name":"analytics"})");
        }
    }
}
