/**
 * @file capacity_types.hpp
 * @brief Data model for a managed analytics capacity
 *
 * SKUs, lifecycle states and provisioning states are closed enumerations.
 * Values the management API reports outside the known sets map to an UNKNOWN
 * variant; the raw text is always kept on the snapshot for messages and output.
 *
 * Lifecycle state families:
 *   RUNNING       Active, Running
 *   STOPPED       Paused, Suspended
 *   TRANSITIONAL  Starting, Resuming, PreparingForRunning, Pausing, Suspending,
 *                 Scaling, Updating, Provisioning
 *   FAILURE       Failed, Error
 *   UNRECOGNIZED  anything else
 */

#ifndef CAPSCALE_CAPACITY_TYPES_HPP
#define CAPSCALE_CAPACITY_TYPES_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace capscale {

/**
 * @brief Capacity size selector
 */
enum class Sku {
    F2,
    F4,
    F8,
    F16,
    F32,
    F64,
    F128,
    F256,
    F512,
    F1024,
    UNKNOWN     ///< Reported by the API but outside the supported set
};

/**
 * @brief Lifecycle state as reported in properties.state
 */
enum class LifecycleState {
    ACTIVE,
    RUNNING,
    PAUSED,
    SUSPENDED,
    STARTING,
    RESUMING,
    PREPARING_FOR_RUNNING,
    PAUSING,
    SUSPENDING,
    SCALING,
    UPDATING,
    PROVISIONING,
    FAILED,
    ERROR,
    UNKNOWN
};

enum class StateFamily {
    RUNNING,
    STOPPED,
    TRANSITIONAL,
    FAILURE,
    UNRECOGNIZED
};

/**
 * @brief Status of the most recent control-plane operation
 */
enum class ProvisioningState {
    SUCCEEDED,
    FAILED,
    IN_PROGRESS,
    UNKNOWN
};

std::string sku_to_string(Sku sku);

/**
 * @brief Parse a user-supplied SKU (case-insensitive)
 * @return std::nullopt if the value is not one of the supported SKUs
 */
std::optional<Sku> parse_sku(const std::string& value);

/**
 * @brief All supported SKUs in ascending size order
 */
const std::vector<Sku>& supported_skus();

std::string lifecycle_state_to_string(LifecycleState state);
LifecycleState parse_lifecycle_state(const std::string& value);
StateFamily state_family(LifecycleState state);
std::string state_family_to_string(StateFamily family);

std::string provisioning_state_to_string(ProvisioningState state);
ProvisioningState parse_provisioning_state(const std::string& value);

/**
 * @brief Coordinates of a capacity resource in the management hierarchy
 */
struct ResourceCoordinates {
    std::string subscription_id;
    std::string resource_group;
    std::string provider;        ///< Provider namespace, e.g. "Microsoft.Fabric"
    std::string name;

    bool operator==(const ResourceCoordinates& other) const {
        return subscription_id == other.subscription_id &&
               resource_group == other.resource_group &&
               provider == other.provider &&
               name == other.name;
    }
};

/**
 * @brief Point-in-time view of a capacity resource
 *
 * location, properties and tags are carried verbatim into resize requests.
 */
struct CapacitySnapshot {
    ResourceCoordinates coordinates;

    Sku sku = Sku::UNKNOWN;
    std::string sku_name;              ///< Raw SKU name from the API
    std::string sku_tier;              ///< Raw SKU tier, e.g. "Fabric"

    LifecycleState state = LifecycleState::UNKNOWN;
    std::string state_name;            ///< Raw lifecycle state from the API

    ProvisioningState provisioning_state = ProvisioningState::UNKNOWN;
    std::string provisioning_state_name;

    std::string location;
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json tags;               ///< null when the resource has no tags

    StateFamily family() const { return state_family(state); }
    bool is_running() const { return family() == StateFamily::RUNNING; }
    bool is_stopped() const { return family() == StateFamily::STOPPED; }

    /// True if the reported SKU name equals the target SKU
    bool has_sku(Sku target) const;
};

/**
 * @brief Build a snapshot from a management API capacity document
 * @throws std::invalid_argument if required fields are missing or mistyped
 */
CapacitySnapshot parse_capacity_document(const ResourceCoordinates& coordinates,
                                         const nlohmann::json& document);

} // namespace capscale

#endif // CAPSCALE_CAPACITY_TYPES_HPP
