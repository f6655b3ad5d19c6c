/**
 * @file test_operation_result.cpp
 * @brief Unit tests for the run result and its serialized form
 */

#include <catch2/catch.hpp>
#include "../src/operation_result.hpp"

using namespace capscale;

TEST_CASE("Operation names", "[operation_result]") {
    REQUIRE(operation_to_string(Operation::SCALE) == "scale");
    REQUIRE(parse_operation("STOP") == Operation::STOP);
    REQUIRE(parse_operation("start") == Operation::START);
    REQUIRE_FALSE(parse_operation("resize").has_value());
}

TEST_CASE("OperationResult - successful run", "[operation_result]") {
    OperationResult result;
    result.capacity_name = "analytics";
    result.subscription_id = "sub-123";
    result.resource_group = "rg-analytics";
    result.region = "westeurope";
    result.previous_sku = "F2";
    result.current_sku = "F64";
    result.target_sku = "F64";
    result.state = "Active";
    result.success = true;
    result.message = "Scaled from F2 to F64";
    result.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(1706688900));

    REQUIRE(result.exit_code() == 0);

    nlohmann::json j = result.to_json();
    REQUIRE(j["capacityName"] == "analytics");
    REQUIRE(j["subscriptionId"] == "sub-123");
    REQUIRE(j["resourceGroup"] == "rg-analytics");
    REQUIRE(j["region"] == "westeurope");
    REQUIRE(j["operation"] == "scale");
    REQUIRE(j["previousSku"] == "F2");
    REQUIRE(j["currentSku"] == "F64");
    REQUIRE(j["targetSku"] == "F64");
    REQUIRE(j["state"] == "Active");
    REQUIRE(j["success"] == true);
    REQUIRE(j["timestamp"] == "2024-01-31T08:15:00Z");
    REQUIRE(j["message"] == "Scaled from F2 to F64");
    REQUIRE_FALSE(j.contains("error"));
    REQUIRE_FALSE(j.contains("errorKind"));
}

TEST_CASE("OperationResult - failed run", "[operation_result]") {
    OperationResult result;
    result.success = true;

    SECTION("set_error marks failure and keeps HTTP details") {
        result.set_error(ErrorKind::RESIZE_REJECTED, "Resize rejected", 409, "conflict");

        REQUIRE_FALSE(result.success);
        REQUIRE(result.error);
        REQUIRE(result.exit_code() == 1);

        nlohmann::json j = result.to_json();
        REQUIRE(j["success"] == false);
        REQUIRE(j["error"] == true);
        REQUIRE(j["errorKind"] == "ResizeRejected");
        REQUIRE(j["message"] == "Resize rejected");
        REQUIRE(j["httpStatus"] == 409);
        REQUIRE(j["responseBody"] == "conflict");
    }

    SECTION("HTTP fields are omitted when the failure is not from the API") {
        result.set_error(ErrorKind::SCALING_FAILED, "quota");

        nlohmann::json j = result.to_json();
        REQUIRE_FALSE(j.contains("httpStatus"));
        REQUIRE_FALSE(j.contains("responseBody"));
    }

    SECTION("Invalid input exits with 2") {
        result.set_error(ErrorKind::INVALID_IDENTIFIER, "bad id");
        REQUIRE(result.exit_code() == 2);

        result.set_error(ErrorKind::INVALID_ARGUMENT, "bad sku");
        REQUIRE(result.exit_code() == 2);
    }
}

TEST_CASE("Error kind names", "[operation_result]") {
    REQUIRE(error_kind_to_string(ErrorKind::CANNOT_SCALE_WHILE_STOPPED) == "CannotScaleWhileStopped");
    REQUIRE(error_kind_to_string(ErrorKind::START_TIMEOUT_BEFORE_SCALE) == "StartTimeoutBeforeScale");
    REQUIRE(error_kind_to_string(ErrorKind::POST_SCALE_VERIFICATION_FAILED) == "PostScaleVerificationFailed");
    REQUIRE(error_kind_to_string(ErrorKind::STATUS_FETCH_FAILED) == "StatusFetchFailed");
    REQUIRE(error_kind_to_string(ErrorKind::TIMEOUT) == "Timeout");
}
