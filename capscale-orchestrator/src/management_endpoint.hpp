/**
 * @file management_endpoint.hpp
 * @brief Request paths and headers for the capacity management API
 */

#ifndef CAPSCALE_MANAGEMENT_ENDPOINT_HPP
#define CAPSCALE_MANAGEMENT_ENDPOINT_HPP

#include "capacity_types.hpp"
#include "credential_manager.hpp"
#include <map>
#include <string>

namespace capscale {

constexpr const char* kDefaultApiVersion = "2023-11-01";

/**
 * @brief Versioned path builder for one capacity provider API
 *
 * Paths are relative to the transport base URL.
 */
struct ManagementEndpoint {
    std::string api_version = kDefaultApiVersion;

    /// GET / PUT target
    std::string resource_path(const ResourceCoordinates& coordinates) const;

    /// POST target for an action sub-path such as "resume" or "suspend"
    std::string action_path(const ResourceCoordinates& coordinates, const std::string& action) const;
};

/**
 * @brief Authorization and content headers for a management call
 */
std::map<std::string, std::string> bearer_headers(const ManagementCredentials& credentials);

} // namespace capscale

#endif // CAPSCALE_MANAGEMENT_ENDPOINT_HPP
