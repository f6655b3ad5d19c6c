#include "capacity_types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace capscale {

namespace {

std::string to_lower(const std::string& value) {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string string_field(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("Field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

} // namespace

std::string sku_to_string(Sku sku) {
    switch (sku) {
        case Sku::F2: return "F2";
        case Sku::F4: return "F4";
        case Sku::F8: return "F8";
        case Sku::F16: return "F16";
        case Sku::F32: return "F32";
        case Sku::F64: return "F64";
        case Sku::F128: return "F128";
        case Sku::F256: return "F256";
        case Sku::F512: return "F512";
        case Sku::F1024: return "F1024";
        case Sku::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

const std::vector<Sku>& supported_skus() {
    static const std::vector<Sku> skus = {
        Sku::F2, Sku::F4, Sku::F8, Sku::F16, Sku::F32,
        Sku::F64, Sku::F128, Sku::F256, Sku::F512, Sku::F1024
    };
    return skus;
}

std::optional<Sku> parse_sku(const std::string& value) {
    std::string wanted = to_lower(value);
    for (Sku sku : supported_skus()) {
        if (to_lower(sku_to_string(sku)) == wanted) {
            return sku;
        }
    }
    return std::nullopt;
}

std::string lifecycle_state_to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::ACTIVE: return "Active";
        case LifecycleState::RUNNING: return "Running";
        case LifecycleState::PAUSED: return "Paused";
        case LifecycleState::SUSPENDED: return "Suspended";
        case LifecycleState::STARTING: return "Starting";
        case LifecycleState::RESUMING: return "Resuming";
        case LifecycleState::PREPARING_FOR_RUNNING: return "PreparingForRunning";
        case LifecycleState::PAUSING: return "Pausing";
        case LifecycleState::SUSPENDING: return "Suspending";
        case LifecycleState::SCALING: return "Scaling";
        case LifecycleState::UPDATING: return "Updating";
        case LifecycleState::PROVISIONING: return "Provisioning";
        case LifecycleState::FAILED: return "Failed";
        case LifecycleState::ERROR: return "Error";
        case LifecycleState::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

LifecycleState parse_lifecycle_state(const std::string& value) {
    static const LifecycleState known[] = {
        LifecycleState::ACTIVE, LifecycleState::RUNNING, LifecycleState::PAUSED,
        LifecycleState::SUSPENDED, LifecycleState::STARTING, LifecycleState::RESUMING,
        LifecycleState::PREPARING_FOR_RUNNING, LifecycleState::PAUSING,
        LifecycleState::SUSPENDING, LifecycleState::SCALING, LifecycleState::UPDATING,
        LifecycleState::PROVISIONING, LifecycleState::FAILED, LifecycleState::ERROR
    };

    std::string wanted = to_lower(value);
    for (LifecycleState state : known) {
        if (to_lower(lifecycle_state_to_string(state)) == wanted) {
            return state;
        }
    }
    return LifecycleState::UNKNOWN;
}

StateFamily state_family(LifecycleState state) {
    switch (state) {
        case LifecycleState::ACTIVE:
        case LifecycleState::RUNNING:
            return StateFamily::RUNNING;

        case LifecycleState::PAUSED:
        case LifecycleState::SUSPENDED:
            return StateFamily::STOPPED;

        case LifecycleState::STARTING:
        case LifecycleState::RESUMING:
        case LifecycleState::PREPARING_FOR_RUNNING:
        case LifecycleState::PAUSING:
        case LifecycleState::SUSPENDING:
        case LifecycleState::SCALING:
        case LifecycleState::UPDATING:
        case LifecycleState::PROVISIONING:
            return StateFamily::TRANSITIONAL;

        case LifecycleState::FAILED:
        case LifecycleState::ERROR:
            return StateFamily::FAILURE;

        case LifecycleState::UNKNOWN:
            return StateFamily::UNRECOGNIZED;
    }
    return StateFamily::UNRECOGNIZED;
}

std::string state_family_to_string(StateFamily family) {
    switch (family) {
        case StateFamily::RUNNING: return "running";
        case StateFamily::STOPPED: return "stopped";
        case StateFamily::TRANSITIONAL: return "transitional";
        case StateFamily::FAILURE: return "failure";
        case StateFamily::UNRECOGNIZED: return "unrecognized";
    }
    return "unrecognized";
}

std::string provisioning_state_to_string(ProvisioningState state) {
    switch (state) {
        case ProvisioningState::SUCCEEDED: return "Succeeded";
        case ProvisioningState::FAILED: return "Failed";
        case ProvisioningState::IN_PROGRESS: return "InProgress";
        case ProvisioningState::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

ProvisioningState parse_provisioning_state(const std::string& value) {
    std::string lowered = to_lower(value);
    if (lowered.empty()) {
        return ProvisioningState::UNKNOWN;
    }
    if (lowered == "succeeded") {
        return ProvisioningState::SUCCEEDED;
    }
    // Canceled is terminal and leaves the requested change unapplied
    if (lowered == "failed" || lowered == "canceled" || lowered == "cancelled") {
        return ProvisioningState::FAILED;
    }
    return ProvisioningState::IN_PROGRESS;
}

bool CapacitySnapshot::has_sku(Sku target) const {
    return sku != Sku::UNKNOWN && sku == target;
}

CapacitySnapshot parse_capacity_document(const ResourceCoordinates& coordinates,
                                         const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Capacity document is not a JSON object");
    }

    CapacitySnapshot snapshot;
    snapshot.coordinates = coordinates;

    auto sku_it = document.find("sku");
    if (sku_it == document.end() || !sku_it->is_object()) {
        throw std::invalid_argument("Capacity document has no 'sku' object");
    }
    snapshot.sku_name = string_field(*sku_it, "name");
    if (snapshot.sku_name.empty()) {
        throw std::invalid_argument("Capacity document has no 'sku.name'");
    }
    snapshot.sku_tier = string_field(*sku_it, "tier");
    if (snapshot.sku_tier.empty()) {
        snapshot.sku_tier = "Fabric";
    }
    snapshot.sku = parse_sku(snapshot.sku_name).value_or(Sku::UNKNOWN);

    snapshot.location = string_field(document, "location");
    if (snapshot.location.empty()) {
        throw std::invalid_argument("Capacity document has no 'location'");
    }

    auto props_it = document.find("properties");
    if (props_it == document.end() || !props_it->is_object()) {
        throw std::invalid_argument("Capacity document has no 'properties' object");
    }
    snapshot.properties = *props_it;

    snapshot.state_name = string_field(*props_it, "state");
    if (snapshot.state_name.empty()) {
        snapshot.state_name = "Unknown";
    }
    snapshot.state = parse_lifecycle_state(snapshot.state_name);

    snapshot.provisioning_state_name = string_field(*props_it, "provisioningState");
    snapshot.provisioning_state = parse_provisioning_state(snapshot.provisioning_state_name);

    auto tags_it = document.find("tags");
    if (tags_it != document.end() && tags_it->is_object()) {
        snapshot.tags = *tags_it;
    }

    return snapshot;
}

} // namespace capscale
