/**
 * @file resource_locator.hpp
 * @brief Parses capacity resource identifiers into coordinates
 */

#ifndef CAPSCALE_RESOURCE_LOCATOR_HPP
#define CAPSCALE_RESOURCE_LOCATOR_HPP

#include "capacity_types.hpp"
#include "errors.hpp"
#include <string>

namespace capscale {

/// Shape every capacity identifier must have
constexpr const char* kResourceIdShape =
    "/subscriptions/{subscriptionId}/resourceGroups/{resourceGroup}"
    "/providers/{provider}/capacities/{capacityName}";

/**
 * @brief Resolve an identifier into subscription, resource group, provider and name
 *
 * Segment keywords are matched case-insensitively and one trailing slash is
 * tolerated. The extracted values are not validated further; the management
 * API is authoritative for GUID and name syntax.
 *
 * @param resource_id Full resource identifier
 * @return Extracted coordinates
 * @throws InvalidIdentifierError if the identifier does not have the expected shape
 */
ResourceCoordinates parse_resource_id(const std::string& resource_id);

/**
 * @brief Build the canonical identifier for a set of coordinates
 */
std::string format_resource_id(const ResourceCoordinates& coordinates);

} // namespace capscale

#endif // CAPSCALE_RESOURCE_LOCATOR_HPP
