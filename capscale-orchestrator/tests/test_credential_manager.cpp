/**
 * @file test_credential_manager.cpp
 * @brief Unit tests for CredentialManager
 */

#include <catch2/catch.hpp>
#include "../src/credential_manager.hpp"
#include "../src/errors.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>

using namespace capscale;
using capscale::testing::set_env;
using capscale::testing::unset_env;

namespace {

std::string base64url_encode(const std::string& input) {
    static const char* alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string output;
    int buffer = 0;
    int bits = 0;
    for (unsigned char c : input) {
        buffer = ((buffer << 8) | c) & 0xFFFF;
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            output.push_back(alphabet[(buffer >> bits) & 0x3F]);
        }
    }
    if (bits > 0) {
        output.push_back(alphabet[(buffer << (6 - bits)) & 0x3F]);
    }
    return output;
}

// Unsigned JWT with the given payload claims
std::string make_jwt(const nlohmann::json& claims) {
    return base64url_encode(R"({"alg":"RS256","typ":"JWT"})") + "." +
           base64url_encode(claims.dump()) + ".c2lnbmF0dXJl";
}

long long epoch_seconds_from_now(long long offset) {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count() + offset;
}

void clear_credential_env() {
    unset_env("CAPSCALE_ACCESS_TOKEN");
    unset_env("CAPSCALE_MANAGEMENT_URL");
}

} // namespace

TEST_CASE("CredentialManager - Explicit credentials", "[credential_manager]") {
    SECTION("Valid credentials via constructor") {
        ManagementCredentials creds("https://management.example.test", "opaque-token-value-123");
        CredentialManager manager(creds);

        REQUIRE(manager.has_credentials());
        REQUIRE(manager.get_source() == CredentialSource::EXPLICIT);

        auto loaded = manager.get_credentials();
        REQUIRE(loaded.management_url == "https://management.example.test");
        REQUIRE(loaded.access_token == "opaque-token-value-123");
        REQUIRE_FALSE(manager.get_token_info().has_value());
    }

    SECTION("Empty credentials") {
        ManagementCredentials empty;
        CredentialManager manager(empty);

        REQUIRE_FALSE(manager.has_credentials());
        REQUIRE(manager.get_source() == CredentialSource::EXPLICIT);
        REQUIRE_THROWS_AS(manager.get_credentials(), CapacityError);

        try {
            manager.get_credentials();
        } catch (const CapacityError& e) {
            REQUIRE(e.kind() == ErrorKind::CREDENTIALS_UNAVAILABLE);
        }
    }

    SECTION("Token without URL is not usable") {
        ManagementCredentials creds("", "opaque-token-value-123");
        CredentialManager manager(creds);
        REQUIRE_FALSE(manager.has_credentials());
    }
}

TEST_CASE("CredentialManager - Environment variables", "[credential_manager]") {
    clear_credential_env();

    SECTION("Load from environment") {
        set_env("CAPSCALE_ACCESS_TOKEN", "env-token-0123456789");
        set_env("CAPSCALE_MANAGEMENT_URL", "https://management.env.test");

        CredentialManager manager;

        REQUIRE(manager.has_credentials());
        REQUIRE(manager.get_source() == CredentialSource::ENVIRONMENT);

        auto creds = manager.get_credentials();
        REQUIRE(creds.management_url == "https://management.env.test");
        REQUIRE(creds.access_token == "env-token-0123456789");
    }

    SECTION("Management URL defaults to the public endpoint") {
        set_env("CAPSCALE_ACCESS_TOKEN", "env-token-0123456789");

        CredentialManager manager;

        REQUIRE(manager.get_credentials().management_url == kDefaultManagementUrl);
    }

    clear_credential_env();
}

TEST_CASE("CredentialManager - Config file", "[credential_manager]") {
    clear_credential_env();

    const char* original_home = std::getenv("HOME");
    std::string saved_home = original_home ? original_home : "";

    auto home = std::filesystem::temp_directory_path() / "capscale_credential_test_home";
    std::filesystem::remove_all(home);
    std::filesystem::create_directories(home / ".capscale");
    set_env("HOME", home.string().c_str());

    SECTION("Load from ~/.capscale/credentials.json") {
        std::ofstream file(home / ".capscale" / "credentials.json");
        file << R"({"management_url": "https://management.file.test", "access_token": "file-token-abcdefgh"})";
        file.close();

        CredentialManager manager;

        REQUIRE(manager.get_source() == CredentialSource::CONFIG_FILE);
        auto creds = manager.get_credentials();
        REQUIRE(creds.management_url == "https://management.file.test");
        REQUIRE(creds.access_token == "file-token-abcdefgh");
    }

    SECTION("Environment takes priority over the file") {
        std::ofstream file(home / ".capscale" / "credentials.json");
        file << R"({"access_token": "file-token-abcdefgh"})";
        file.close();
        set_env("CAPSCALE_ACCESS_TOKEN", "env-token-0123456789");

        CredentialManager manager;

        REQUIRE(manager.get_source() == CredentialSource::ENVIRONMENT);
        REQUIRE(manager.get_credentials().access_token == "env-token-0123456789");
    }

    SECTION("Malformed file yields no credentials") {
        std::ofstream file(home / ".capscale" / "credentials.json");
        file << R"({"access_token": 12345)";
        file.close();

        CredentialManager manager;

        REQUIRE(manager.get_source() == CredentialSource::NONE);
        REQUIRE_FALSE(manager.has_credentials());
    }

    SECTION("Non-string token yields no credentials") {
        std::ofstream file(home / ".capscale" / "credentials.json");
        file << R"({"access_token": 12345})";
        file.close();

        CredentialManager manager;

        REQUIRE(manager.get_source() == CredentialSource::NONE);
    }

    if (saved_home.empty()) {
        unset_env("HOME");
    } else {
        set_env("HOME", saved_home.c_str());
    }
    clear_credential_env();
    std::filesystem::remove_all(home);
}

TEST_CASE("CredentialManager - Token masking", "[credential_manager]") {
    REQUIRE(CredentialManager::mask_token("") == "<empty>");
    REQUIRE(CredentialManager::mask_token("short") == "****");
    REQUIRE(CredentialManager::mask_token("12345678") == "****");
    REQUIRE(CredentialManager::mask_token("eyJhbGciOiJSUzI1NiJ9.payload.sig") == "eyJh....sig");
}

TEST_CASE("CredentialManager - JWT inspection", "[credential_manager]") {
    SECTION("Reads exp, iat and aud claims") {
        long long exp = epoch_seconds_from_now(3600);
        long long iat = epoch_seconds_from_now(-60);
        std::string token = make_jwt({
            {"aud", "https://management.azure.com/"},
            {"exp", exp},
            {"iat", iat}
        });

        auto info = CredentialManager::parse_jwt(token);

        REQUIRE(info.has_value());
        REQUIRE(std::chrono::duration_cast<std::chrono::seconds>(
                    info->expires_at.time_since_epoch()).count() == exp);
        REQUIRE(info->issued_at.has_value());
        REQUIRE(info->audience == "https://management.azure.com/");
        REQUIRE_FALSE(info->expires_within(std::chrono::seconds(60)));
        REQUIRE(info->expires_within(std::chrono::seconds(7200)));
        REQUIRE(info->seconds_until_expiry() > 3500);
    }

    SECTION("Opaque tokens and tokens without exp have no token info") {
        REQUIRE_FALSE(CredentialManager::parse_jwt("opaque-token-value").has_value());
        REQUIRE_FALSE(CredentialManager::parse_jwt("a.b").has_value());
        REQUIRE_FALSE(CredentialManager::parse_jwt(make_jwt({{"aud", "x"}})).has_value());
        REQUIRE_FALSE(CredentialManager::parse_jwt("header.!!!.sig").has_value());
    }

    SECTION("An expired token is rejected when credentials are requested") {
        std::string token = make_jwt({{"exp", epoch_seconds_from_now(-120)}});
        CredentialManager manager(ManagementCredentials("https://management.example.test", token));

        REQUIRE(manager.has_credentials());
        REQUIRE(manager.get_token_info().has_value());

        try {
            manager.get_credentials();
            FAIL("Expected CapacityError");
        } catch (const CapacityError& e) {
            REQUIRE(e.kind() == ErrorKind::CREDENTIALS_UNAVAILABLE);
            REQUIRE(std::string(e.what()).find("expired") != std::string::npos);
        }
    }

    SECTION("Out-of-range exp claims are clamped to the far future") {
        std::string token = make_jwt({{"exp", 10000000000000000000ULL}, {"iat", 9000000000000000000LL}});

        auto info = CredentialManager::parse_jwt(token);
        REQUIRE(info.has_value());
        REQUIRE_FALSE(info->expires_within(std::chrono::hours(24 * 365)));
        REQUIRE(info->seconds_until_expiry() > 0);

        CredentialManager manager(ManagementCredentials("https://management.example.test", token));
        REQUIRE(manager.get_credentials().access_token == token);
    }

    SECTION("Non-integer exp claims give no token info") {
        REQUIRE_FALSE(CredentialManager::parse_jwt(make_jwt({{"exp", 1e300}})).has_value());
        REQUIRE_FALSE(CredentialManager::parse_jwt(make_jwt({{"exp", "1700000000"}})).has_value());

        std::string token = make_jwt({{"exp", 1e300}});
        CredentialManager manager(ManagementCredentials("https://management.example.test", token));
        REQUIRE(manager.get_credentials().access_token == token);
    }

    SECTION("Negative exp claims count as expired") {
        std::string token = make_jwt({{"exp", -5000000000000000000LL}});
        CredentialManager manager(ManagementCredentials("https://management.example.test", token));

        REQUIRE_THROWS_AS(manager.get_credentials(), CapacityError);
    }

    SECTION("A valid token passes through unchanged") {
        std::string token = make_jwt({{"exp", epoch_seconds_from_now(600)}});
        CredentialManager manager(ManagementCredentials("https://management.example.test", token));

        REQUIRE(manager.get_credentials().access_token == token);
    }
}

TEST_CASE("CredentialManager - Lifecycle", "[credential_manager]") {
    CredentialManager manager(ManagementCredentials("https://management.example.test", "first-token-123456"));

    SECTION("to_string never exposes the token") {
        std::string text = manager.to_string();
        REQUIRE(text.find("first-token-123456") == std::string::npos);
        REQUIRE(text.find("firs...3456") != std::string::npos);
        REQUIRE(text.find("EXPLICIT") != std::string::npos);
    }

    SECTION("update_credentials replaces the token") {
        manager.update_credentials(ManagementCredentials("https://management.example.test", "second-token-654321"));
        REQUIRE(manager.get_credentials().access_token == "second-token-654321");
    }

    SECTION("clear removes everything") {
        manager.clear();
        REQUIRE_FALSE(manager.has_credentials());
        REQUIRE(manager.get_source() == CredentialSource::NONE);
        REQUIRE_THROWS_AS(manager.get_credentials(), CapacityError);
    }
}
