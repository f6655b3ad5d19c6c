/**
 * @file credential_manager.hpp
 * @brief Bearer credential management for the management endpoint
 *
 * The CredentialManager handles:
 * - Loading credentials from multiple sources (explicit, environment, file)
 * - Token expiry inspection from the JWT "exp" claim
 * - Secure handling (tokens are only ever logged masked)
 *
 * Credential Sources (in priority order):
 * 1. Explicit credentials passed to constructor
 * 2. Environment variables: CAPSCALE_ACCESS_TOKEN, CAPSCALE_MANAGEMENT_URL
 * 3. Configuration file: ~/.capscale/credentials.json
 *
 * How the token itself is obtained (platform identity, CLI login) is outside
 * this component; it only carries the result into each API call.
 */

#ifndef CAPSCALE_CREDENTIAL_MANAGER_HPP
#define CAPSCALE_CREDENTIAL_MANAGER_HPP

#include <string>
#include <chrono>
#include <optional>

namespace capscale {

constexpr const char* kDefaultManagementUrl = "https://management.azure.com";

/**
 * @brief Credentials for one management endpoint
 */
struct ManagementCredentials {
    std::string management_url;   ///< Management endpoint base URL
    std::string access_token;     ///< Bearer token scoped to the endpoint

    ManagementCredentials() = default;
    ManagementCredentials(const std::string& url, const std::string& token)
        : management_url(url), access_token(token) {}

    bool is_valid() const {
        return !management_url.empty() && !access_token.empty();
    }
};

/**
 * @brief Source from which credentials were loaded
 */
enum class CredentialSource {
    EXPLICIT,       ///< Passed directly to constructor
    ENVIRONMENT,    ///< Loaded from environment variables
    CONFIG_FILE,    ///< Loaded from ~/.capscale/credentials.json
    NONE            ///< No credentials available
};

/**
 * @brief Token metadata decoded from the JWT payload
 */
struct TokenInfo {
    std::chrono::system_clock::time_point expires_at;
    std::optional<std::chrono::system_clock::time_point> issued_at;
    std::string audience;

    /**
     * @brief Check if token is expired or will expire within the threshold
     */
    bool expires_within(std::chrono::seconds threshold) const;

    /**
     * @brief Get time until expiry in seconds (negative if expired)
     */
    long long seconds_until_expiry() const;
};

/**
 * @brief Manages the management-endpoint bearer credential
 */
class CredentialManager {
public:
    /**
     * @brief Create credential manager with explicit credentials (highest priority)
     */
    explicit CredentialManager(const ManagementCredentials& credentials);

    /**
     * @brief Create credential manager that discovers credentials from environment/file
     */
    CredentialManager();

    ~CredentialManager();

    /**
     * @brief Get current credentials
     * @throws CapacityError (CREDENTIALS_UNAVAILABLE) if none are loaded or the token has expired
     */
    ManagementCredentials get_credentials() const;

    bool has_credentials() const;

    /// Endpoint of the loaded credentials, without the expiry check of get_credentials()
    const std::string& management_url() const { return credentials_.management_url; }

    CredentialSource get_source() const { return source_; }

    /**
     * @brief Get decoded token metadata, if the token is a JWT carrying "exp"
     */
    std::optional<TokenInfo> get_token_info() const { return token_info_; }

    /**
     * @brief Clear stored credentials
     */
    void clear();

    /**
     * @brief Replace credentials (e.g., after the caller obtained a new token)
     */
    void update_credentials(const ManagementCredentials& new_credentials);

    /**
     * @brief Get a sanitized string representation for logging
     */
    std::string to_string() const;

    /**
     * @brief Mask token for safe logging (show first/last 4 chars)
     */
    static std::string mask_token(const std::string& token);

    /**
     * @brief Decode JWT payload claims (exp, iat, aud)
     * @return TokenInfo if the token is a JWT with a numeric "exp", std::nullopt otherwise
     */
    static std::optional<TokenInfo> parse_jwt(const std::string& token);

private:
    ManagementCredentials credentials_;
    CredentialSource source_;
    std::optional<TokenInfo> token_info_;

    bool load_from_environment();
    bool load_from_file();
};

} // namespace capscale

#endif // CAPSCALE_CREDENTIAL_MANAGER_HPP
