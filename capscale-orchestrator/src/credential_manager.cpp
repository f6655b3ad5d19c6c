/**
 * @file credential_manager.cpp
 * @brief Implementation of CredentialManager
 */

#include "credential_manager.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace capscale {

namespace {

// Decode base64url (JWT segments are unpadded base64url)
std::optional<std::string> base64url_decode(const std::string& input) {
    std::string decoded;
    int buffer = 0;
    int bits = 0;

    for (char c : input) {
        int value;
        if (c >= 'A' && c <= 'Z') value = c - 'A';
        else if (c >= 'a' && c <= 'z') value = c - 'a' + 26;
        else if (c >= '0' && c <= '9') value = c - '0' + 52;
        else if (c == '-' || c == '+') value = 62;
        else if (c == '_' || c == '/') value = 63;
        else if (c == '=') break;
        else return std::nullopt;

        buffer = ((buffer << 6) | value) & 0xFFFF;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }

    return decoded;
}

// NumericDate claim as a time point, clamped so later arithmetic stays in range
std::optional<std::chrono::system_clock::time_point> claim_time(const json& claim) {
    if (!claim.is_number_integer()) {
        return std::nullopt;
    }

    const long long latest = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::duration::max()).count() / 2;

    long long seconds = 0;
    if (claim.is_number_unsigned()) {
        auto value = claim.get<unsigned long long>();
        seconds = value > static_cast<unsigned long long>(latest) ? latest : static_cast<long long>(value);
    } else {
        seconds = std::min(std::max(claim.get<long long>(), 0LL), latest);
    }
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // namespace

bool TokenInfo::expires_within(std::chrono::seconds threshold) const {
    auto now = std::chrono::system_clock::now();
    return (expires_at - now) <= threshold;
}

long long TokenInfo::seconds_until_expiry() const {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(expires_at - now).count();
}

CredentialManager::CredentialManager(const ManagementCredentials& credentials)
    : credentials_(credentials), source_(CredentialSource::EXPLICIT) {
    if (credentials_.is_valid()) {
        token_info_ = parse_jwt(credentials_.access_token);
    }
}

CredentialManager::CredentialManager()
    : source_(CredentialSource::NONE) {
    if (load_from_environment()) {
        source_ = CredentialSource::ENVIRONMENT;
    } else if (load_from_file()) {
        source_ = CredentialSource::CONFIG_FILE;
    }

    if (credentials_.is_valid()) {
        token_info_ = parse_jwt(credentials_.access_token);
    }
}

CredentialManager::~CredentialManager() {
    credentials_.access_token.clear();
}

ManagementCredentials CredentialManager::get_credentials() const {
    if (!credentials_.is_valid()) {
        throw CapacityError(ErrorKind::CREDENTIALS_UNAVAILABLE,
            "No management credentials available. Set CAPSCALE_ACCESS_TOKEN "
            "(and optionally CAPSCALE_MANAGEMENT_URL), or provide "
            "~/.capscale/credentials.json.");
    }
    if (token_info_ && token_info_->expires_within(std::chrono::seconds(0))) {
        throw CapacityError(ErrorKind::CREDENTIALS_UNAVAILABLE,
            "Access token expired " + std::to_string(-token_info_->seconds_until_expiry()) +
            " seconds ago. Obtain a new token before running.");
    }
    return credentials_;
}

bool CredentialManager::has_credentials() const {
    return credentials_.is_valid();
}

void CredentialManager::clear() {
    credentials_.management_url.clear();
    credentials_.access_token.clear();
    token_info_ = std::nullopt;
    source_ = CredentialSource::NONE;
}

void CredentialManager::update_credentials(const ManagementCredentials& new_credentials) {
    credentials_ = new_credentials;
    token_info_ = credentials_.is_valid()
        ? parse_jwt(credentials_.access_token)
        : std::nullopt;
}

std::string CredentialManager::to_string() const {
    std::ostringstream oss;
    oss << "CredentialManager{";
    oss << "source=";
    switch (source_) {
        case CredentialSource::EXPLICIT: oss << "EXPLICIT"; break;
        case CredentialSource::ENVIRONMENT: oss << "ENVIRONMENT"; break;
        case CredentialSource::CONFIG_FILE: oss << "CONFIG_FILE"; break;
        case CredentialSource::NONE: oss << "NONE"; break;
    }
    oss << ", url=" << credentials_.management_url;
    oss << ", token=" << mask_token(credentials_.access_token);
    if (token_info_) {
        oss << ", expires_in=" << token_info_->seconds_until_expiry() << "s";
    }
    oss << "}";
    return oss.str();
}

bool CredentialManager::load_from_environment() {
    const char* token = std::getenv("CAPSCALE_ACCESS_TOKEN");
    const char* url = std::getenv("CAPSCALE_MANAGEMENT_URL");

    if (!token || std::string(token).empty()) {
        return false;
    }

    credentials_.access_token = token;
    credentials_.management_url = (url && *url) ? url : kDefaultManagementUrl;
    return true;
}

bool CredentialManager::load_from_file() {
    const char* home = std::getenv("HOME");
    if (!home) {
        home = std::getenv("USERPROFILE");  // Windows
    }
    if (!home) {
        return false;
    }

    std::string config_path = std::string(home) + "/.capscale/credentials.json";
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return false;
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return false;
    }

    std::string token;
    std::string url;
    if (j.contains("access_token") && j["access_token"].is_string()) {
        token = j["access_token"].get<std::string>();
    }
    if (j.contains("management_url") && j["management_url"].is_string()) {
        url = j["management_url"].get<std::string>();
    }
    if (token.empty()) {
        return false;
    }

    credentials_.access_token = token;
    credentials_.management_url = url.empty() ? kDefaultManagementUrl : url;
    return true;
}

std::optional<TokenInfo> CredentialManager::parse_jwt(const std::string& token) {
    size_t dot1 = token.find('.');
    if (dot1 == std::string::npos) {
        return std::nullopt;
    }
    size_t dot2 = token.find('.', dot1 + 1);
    if (dot2 == std::string::npos) {
        return std::nullopt;
    }

    auto payload = base64url_decode(token.substr(dot1 + 1, dot2 - dot1 - 1));
    if (!payload) {
        return std::nullopt;
    }

    json claims = json::parse(*payload, nullptr, false);
    if (claims.is_discarded() || !claims.is_object()) {
        return std::nullopt;
    }

    auto exp_it = claims.find("exp");
    if (exp_it == claims.end()) {
        return std::nullopt;
    }
    auto expires_at = claim_time(*exp_it);
    if (!expires_at) {
        return std::nullopt;
    }

    TokenInfo info;
    info.expires_at = *expires_at;

    auto iat_it = claims.find("iat");
    if (iat_it != claims.end()) {
        info.issued_at = claim_time(*iat_it);
    }

    auto aud_it = claims.find("aud");
    if (aud_it != claims.end() && aud_it->is_string()) {
        info.audience = aud_it->get<std::string>();
    }

    return info;
}

std::string CredentialManager::mask_token(const std::string& token) {
    if (token.empty()) {
        return "<empty>";
    }
    if (token.length() <= 8) {
        return "****";
    }
    return token.substr(0, 4) + "..." + token.substr(token.length() - 4);
}

} // namespace capscale
