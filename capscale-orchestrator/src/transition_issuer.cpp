#include "transition_issuer.hpp"
#include <sstream>

namespace capscale {

namespace {

std::string rejection_message(const std::string& what, const std::string& capacity,
                              const client::HttpResponse& response) {
    std::ostringstream oss;
    oss << what << " request for capacity '" << capacity
        << "' was rejected: HTTP " << response.status_code;
    if (!response.body.empty()) {
        oss << ": " << response.body;
    }
    return oss.str();
}

} // namespace

TransitionRequest make_resize_request(const CapacitySnapshot& base, Sku target) {
    TransitionRequest request;
    request.coordinates = base.coordinates;
    request.target_sku = target;

    nlohmann::json body;
    body["location"] = base.location;
    body["sku"] = {
        {"name", sku_to_string(target)},
        {"tier", base.sku_tier.empty() ? std::string("Fabric") : base.sku_tier}
    };
    body["properties"] = base.properties;
    if (base.tags.is_object()) {
        body["tags"] = base.tags;
    }
    request.body = std::move(body);

    return request;
}

TransitionIssuer::TransitionIssuer(client::HttpTransport& transport, const ManagementEndpoint& endpoint)
    : transport_(transport), endpoint_(endpoint) {}

int TransitionIssuer::resume(const ResourceCoordinates& coordinates,
                             const ManagementCredentials& credentials) const {
    return post_action(coordinates, "resume", ErrorKind::RESUME_REJECTED, credentials);
}

int TransitionIssuer::suspend(const ResourceCoordinates& coordinates,
                              const ManagementCredentials& credentials) const {
    return post_action(coordinates, "suspend", ErrorKind::SUSPEND_REJECTED, credentials);
}

int TransitionIssuer::post_action(const ResourceCoordinates& coordinates,
                                  const std::string& action,
                                  ErrorKind rejection_kind,
                                  const ManagementCredentials& credentials) const {
    client::HttpRequest request;
    request.method = "POST";
    request.path = endpoint_.action_path(coordinates, action);
    request.headers = bearer_headers(credentials);

    client::HttpResponse response;
    try {
        response = transport_.send(request);
    } catch (const client::HttpClientError& e) {
        throw ApiError(rejection_kind,
                       "Failed to send " + action + " request for capacity '" +
                       coordinates.name + "': " + e.what(),
                       e.status_code());
    }

    if (!response.is_success()) {
        throw ApiError(rejection_kind,
                       rejection_message(action, coordinates.name, response),
                       response.status_code, response.body);
    }

    return response.status_code;
}

int TransitionIssuer::resize(const CapacitySnapshot& base, Sku target,
                             const ManagementCredentials& credentials) const {
    if (target == Sku::UNKNOWN) {
        throw CapacityError(ErrorKind::INVALID_ARGUMENT, "Cannot resize to an unknown SKU");
    }

    TransitionRequest transition = make_resize_request(base, target);

    client::HttpRequest request;
    request.method = "PUT";
    request.path = endpoint_.resource_path(transition.coordinates);
    request.body = transition.body.dump();
    request.headers = bearer_headers(credentials);

    client::HttpResponse response;
    try {
        response = transport_.send(request);
    } catch (const client::HttpClientError& e) {
        throw ApiError(ErrorKind::RESIZE_REJECTED,
                       "Failed to send resize request for capacity '" +
                       base.coordinates.name + "': " + e.what(),
                       e.status_code());
    }

    if (!response.is_success()) {
        throw ApiError(ErrorKind::RESIZE_REJECTED,
                       rejection_message("Resize to " + sku_to_string(target),
                                         base.coordinates.name, response),
                       response.status_code, response.body);
    }

    return response.status_code;
}

} // namespace capscale
