#include "management_endpoint.hpp"
#include "resource_locator.hpp"

namespace capscale {

std::string ManagementEndpoint::resource_path(const ResourceCoordinates& coordinates) const {
    return format_resource_id(coordinates) + "?api-version=" + api_version;
}

std::string ManagementEndpoint::action_path(const ResourceCoordinates& coordinates,
                                            const std::string& action) const {
    return format_resource_id(coordinates) + "/" + action + "?api-version=" + api_version;
}

std::map<std::string, std::string> bearer_headers(const ManagementCredentials& credentials) {
    return {
        {"Authorization", "Bearer " + credentials.access_token},
        {"Content-Type", "application/json"}
    };
}

} // namespace capscale
