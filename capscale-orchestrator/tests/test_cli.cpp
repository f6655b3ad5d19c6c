/**
 * @file test_cli.cpp
 * @brief Tests for command-line handling and the capscale executable
 */

#include <catch2/catch.hpp>
#include "../src/cli.hpp"
#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace capscale;

namespace {

constexpr const char* kResourceId =
    "/subscriptions/sub-123/resourceGroups/rg-analytics/providers/Microsoft.Fabric/capacities/analytics";

bool parse(const std::vector<std::string>& words, CLIArgs& args) {
    std::vector<const char*> argv = {"capscale"};
    for (const auto& word : words) {
        argv.push_back(word.c_str());
    }
    return parse_args(static_cast<int>(argv.size()), argv.data(), args);
}

struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    ss << stream.rdbuf();
    return ss.str();
}

// Runs the executable with no credentials in the environment and an empty HOME
CommandResult run_capscale(const std::string& arguments) {
    auto dir = std::filesystem::temp_directory_path() / "capscale_cli_test";
    std::filesystem::create_directories(dir);
    auto stdout_file = dir / "stdout.txt";
    auto stderr_file = dir / "stderr.txt";

    std::string command = "env -u CAPSCALE_ACCESS_TOKEN -u CAPSCALE_MANAGEMENT_URL HOME='" +
                          dir.string() + "' '" + CAPSCALE_CLI_PATH + "' " + arguments +
                          " >'" + stdout_file.string() + "' 2>'" + stderr_file.string() + "'";

    CommandResult result;
    int status = std::system(command.c_str());
    result.exit_code = WEXITSTATUS(status);
    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);
    return result;
}

} // namespace

TEST_CASE("parse_args - options", "[cli]") {
    CLIArgs args;

    SECTION("Every override is captured") {
        REQUIRE(parse({"--resource-id", kResourceId, "--operation", "scale", "--target-sku", "F64",
                       "--wait", "false", "--timeout", "20", "--management-url", "https://m.example.test",
                       "--api-version", "2024-01-01", "--log-level", "DEBUG", "--log-format", "text",
                       "--log-file", "/tmp/capscale.log", "--debug-http"}, args));

        REQUIRE(*args.resource_id == kResourceId);
        REQUIRE(*args.operation == "scale");
        REQUIRE(*args.target_sku == "F64");
        REQUIRE(*args.wait_for_completion == false);
        REQUIRE(*args.timeout_minutes == 20);
        REQUIRE(*args.management_url == "https://m.example.test");
        REQUIRE(*args.api_version == "2024-01-01");
        REQUIRE(*args.log_level == "DEBUG");
        REQUIRE(*args.log_json == false);
        REQUIRE(*args.log_file == "/tmp/capscale.log");
        REQUIRE(args.debug_http);
        REQUIRE_FALSE(args.help);
    }

    SECTION("Unset options stay unset") {
        REQUIRE(parse({"--no-wait"}, args));
        REQUIRE(*args.wait_for_completion == false);
        REQUIRE_FALSE(args.resource_id.has_value());
        REQUIRE_FALSE(args.timeout_minutes.has_value());
        REQUIRE(args.config_path.empty());
    }

    SECTION("Help stops parsing") {
        REQUIRE(parse({"--help", "--bogus"}, args));
        REQUIRE(args.help);
    }

    SECTION("Unusable command lines") {
        REQUIRE_FALSE(parse({"--bogus"}, args));
        REQUIRE_FALSE(parse({"--resource-id"}, args));
        REQUIRE_FALSE(parse({"--wait", "maybe"}, args));
        REQUIRE_FALSE(parse({"--timeout", "10m"}, args));
        REQUIRE_FALSE(parse({"--timeout", "4294967306"}, args));
        REQUIRE_FALSE(parse({"--log-format", "xml"}, args));
    }
}

TEST_CASE("build_run_config - file plus overrides", "[cli]") {
    auto path = std::filesystem::temp_directory_path() / "capscale_test_cli_config.json";
    {
        std::ofstream file(path);
        file << R"({
            "resource_id": "/subscriptions/from-file/resourceGroups/rg/providers/Microsoft.Fabric/capacities/cap",
            "target_sku": "F8",
            "timeout_minutes": 15,
            "logging": {"level": "WARN", "json": false}
        })";
    }

    CLIArgs args;
    args.config_path = path.string();

    SECTION("File values are used when no flag overrides them") {
        RunConfig config = build_run_config(args);
        REQUIRE(config.target_sku == "F8");
        REQUIRE(config.timeout_minutes == 15);
        REQUIRE(config.logging.level == "WARN");
        REQUIRE_FALSE(config.logging.json);
        REQUIRE(config.wait_for_completion);
    }

    SECTION("Flags win over the file") {
        REQUIRE(parse({"--target-sku", "F64", "--timeout", "30", "--no-wait", "--log-format", "json"}, args));

        RunConfig config = build_run_config(args);
        REQUIRE(config.resource_id.find("from-file") != std::string::npos);
        REQUIRE(config.target_sku == "F64");
        REQUIRE(config.timeout_minutes == 30);
        REQUIRE_FALSE(config.wait_for_completion);
        REQUIRE(config.logging.json);
        REQUIRE(config.logging.level == "WARN");
    }

    SECTION("No file means defaults plus flags") {
        CLIArgs bare;
        REQUIRE(parse({"--operation", "stop"}, bare));

        RunConfig config = build_run_config(bare);
        REQUIRE(config.operation == "stop");
        REQUIRE(config.timeout_minutes == 10);
    }

    SECTION("Missing file") {
        args.config_path = "/nonexistent/capscale.json";
        REQUIRE_THROWS_AS(build_run_config(args), ConfigParseError);
    }

    std::filesystem::remove(path);
}

TEST_CASE("capscale executable - exit codes and result output", "[cli]") {
    SECTION("Help exits with 0") {
        auto result = run_capscale("--help");
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
        REQUIRE(result.stderr_output.find("--resource-id") != std::string::npos);
    }

    SECTION("Unknown option exits with 2") {
        auto result = run_capscale("--bogus");
        REQUIRE(result.exit_code == 2);
        REQUIRE(result.stderr_output.find("Unknown option") != std::string::npos);
    }

    SECTION("Invalid entry parameters exit with 2") {
        auto result = run_capscale(std::string("--resource-id '") + kResourceId + "' --target-sku F3");
        REQUIRE(result.exit_code == 2);
        REQUIRE(result.stderr_output.find("Unsupported target SKU") != std::string::npos);
    }

    SECTION("Malformed identifier exits with 2 and still prints the result") {
        auto result = run_capscale("--resource-id /subscriptions/sub-123 --target-sku F64");
        REQUIRE(result.exit_code == 2);

        auto j = nlohmann::json::parse(result.stdout_output);
        REQUIRE(j["success"] == false);
        REQUIRE(j["errorKind"] == "InvalidIdentifier");
    }

    SECTION("Operation failure exits with 1 and prints the result") {
        auto result = run_capscale(std::string("--resource-id '") + kResourceId + "' --target-sku F64");
        REQUIRE(result.exit_code == 1);

        auto j = nlohmann::json::parse(result.stdout_output);
        REQUIRE(j["success"] == false);
        REQUIRE(j["error"] == true);
        REQUIRE(j["errorKind"] == "CredentialsUnavailable");
        REQUIRE(j["capacityName"] == "analytics");
        REQUIRE(j["operation"] == "scale");
        REQUIRE(j["targetSku"] == "F64");
        REQUIRE(result.stderr_output.find("CredentialsUnavailable") != std::string::npos);
    }
}
