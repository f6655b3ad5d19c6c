/**
 * @file test_capacity_types.cpp
 * @brief Unit tests for SKU, lifecycle state and capacity document handling
 */

#include <catch2/catch.hpp>
#include "../src/capacity_types.hpp"
#include "test_support.hpp"

using namespace capscale;
using json = nlohmann::json;

TEST_CASE("SKU enumeration", "[capacity_types]") {
    SECTION("All ten supported SKUs round-trip through their names") {
        REQUIRE(supported_skus().size() == 10);
        for (Sku sku : supported_skus()) {
            auto parsed = parse_sku(sku_to_string(sku));
            REQUIRE(parsed.has_value());
            REQUIRE(*parsed == sku);
        }
    }

    SECTION("Parsing is case-insensitive") {
        REQUIRE(parse_sku("f64") == Sku::F64);
        REQUIRE(parse_sku("F1024") == Sku::F1024);
    }

    SECTION("Values outside the enumeration are rejected") {
        REQUIRE_FALSE(parse_sku("F3").has_value());
        REQUIRE_FALSE(parse_sku("F2048").has_value());
        REQUIRE_FALSE(parse_sku("P1").has_value());
        REQUIRE_FALSE(parse_sku("").has_value());
        REQUIRE_FALSE(parse_sku("Unknown").has_value());
    }
}

TEST_CASE("Lifecycle state families", "[capacity_types]") {
    REQUIRE(state_family(parse_lifecycle_state("Active")) == StateFamily::RUNNING);
    REQUIRE(state_family(parse_lifecycle_state("Running")) == StateFamily::RUNNING);

    REQUIRE(state_family(parse_lifecycle_state("Paused")) == StateFamily::STOPPED);
    REQUIRE(state_family(parse_lifecycle_state("Suspended")) == StateFamily::STOPPED);

    REQUIRE(state_family(parse_lifecycle_state("Starting")) == StateFamily::TRANSITIONAL);
    REQUIRE(state_family(parse_lifecycle_state("Resuming")) == StateFamily::TRANSITIONAL);
    REQUIRE(state_family(parse_lifecycle_state("PreparingForRunning")) == StateFamily::TRANSITIONAL);
    REQUIRE(state_family(parse_lifecycle_state("Updating")) == StateFamily::TRANSITIONAL);
    REQUIRE(state_family(parse_lifecycle_state("Pausing")) == StateFamily::TRANSITIONAL);

    REQUIRE(state_family(parse_lifecycle_state("Failed")) == StateFamily::FAILURE);
    REQUIRE(state_family(parse_lifecycle_state("Error")) == StateFamily::FAILURE);

    SECTION("Matching ignores case") {
        REQUIRE(parse_lifecycle_state("active") == LifecycleState::ACTIVE);
        REQUIRE(parse_lifecycle_state("PAUSED") == LifecycleState::PAUSED);
    }

    SECTION("Unknown states map to the UNKNOWN variant") {
        REQUIRE(parse_lifecycle_state("Hibernating") == LifecycleState::UNKNOWN);
        REQUIRE(state_family(LifecycleState::UNKNOWN) == StateFamily::UNRECOGNIZED);
    }
}

TEST_CASE("Provisioning state parsing", "[capacity_types]") {
    REQUIRE(parse_provisioning_state("Succeeded") == ProvisioningState::SUCCEEDED);
    REQUIRE(parse_provisioning_state("failed") == ProvisioningState::FAILED);
    REQUIRE(parse_provisioning_state("Canceled") == ProvisioningState::FAILED);
    REQUIRE(parse_provisioning_state("Updating") == ProvisioningState::IN_PROGRESS);
    REQUIRE(parse_provisioning_state("Provisioning") == ProvisioningState::IN_PROGRESS);
    REQUIRE(parse_provisioning_state("") == ProvisioningState::UNKNOWN);
}

TEST_CASE("parse_capacity_document", "[capacity_types]") {
    auto coordinates = testing::test_coordinates();

    SECTION("Reads SKU, state, location, properties and tags") {
        json document = json::parse(testing::capacity_document("F8", "Active"));
        auto snapshot = parse_capacity_document(coordinates, document);

        REQUIRE(snapshot.coordinates == coordinates);
        REQUIRE(snapshot.sku == Sku::F8);
        REQUIRE(snapshot.sku_name == "F8");
        REQUIRE(snapshot.sku_tier == "Fabric");
        REQUIRE(snapshot.state == LifecycleState::ACTIVE);
        REQUIRE(snapshot.state_name == "Active");
        REQUIRE(snapshot.provisioning_state == ProvisioningState::SUCCEEDED);
        REQUIRE(snapshot.location == "westeurope");
        REQUIRE(snapshot.properties == document["properties"]);
        REQUIRE(snapshot.tags == document["tags"]);
        REQUIRE(snapshot.is_running());
        REQUIRE_FALSE(snapshot.is_stopped());
        REQUIRE(snapshot.has_sku(Sku::F8));
        REQUIRE_FALSE(snapshot.has_sku(Sku::F16));
    }

    SECTION("Unsupported SKU names are kept raw and never match a target") {
        json document = json::parse(testing::capacity_document("F3000", "Active"));
        auto snapshot = parse_capacity_document(coordinates, document);

        REQUIRE(snapshot.sku == Sku::UNKNOWN);
        REQUIRE(snapshot.sku_name == "F3000");
        REQUIRE_FALSE(snapshot.has_sku(Sku::UNKNOWN));
    }

    SECTION("Missing state and tier fall back to defaults") {
        json document = {
            {"location", "eastus"},
            {"sku", {{"name", "F2"}}},
            {"properties", json::object()}
        };
        auto snapshot = parse_capacity_document(coordinates, document);

        REQUIRE(snapshot.sku_tier == "Fabric");
        REQUIRE(snapshot.state_name == "Unknown");
        REQUIRE(snapshot.family() == StateFamily::UNRECOGNIZED);
        REQUIRE(snapshot.provisioning_state == ProvisioningState::UNKNOWN);
        REQUIRE(snapshot.tags.is_null());
    }

    SECTION("Documents without the fields a resize must echo are rejected") {
        json no_location = json::parse(testing::capacity_document("F2", "Active"));
        no_location.erase("location");
        REQUIRE_THROWS_AS(parse_capacity_document(coordinates, no_location), std::invalid_argument);

        json no_properties = json::parse(testing::capacity_document("F2", "Active"));
        no_properties.erase("properties");
        REQUIRE_THROWS_AS(parse_capacity_document(coordinates, no_properties), std::invalid_argument);

        json no_sku = json::parse(testing::capacity_document("F2", "Active"));
        no_sku.erase("sku");
        REQUIRE_THROWS_AS(parse_capacity_document(coordinates, no_sku), std::invalid_argument);

        REQUIRE_THROWS_AS(parse_capacity_document(coordinates, json::array()), std::invalid_argument);
    }

    SECTION("Mistyped fields are rejected") {
        json document = json::parse(testing::capacity_document("F2", "Active"));
        document["location"] = 42;
        REQUIRE_THROWS_AS(parse_capacity_document(coordinates, document), std::invalid_argument);
    }
}
