/**
 * @file transition_issuer.hpp
 * @brief Sends state-changing requests (resume, suspend, resize) for a capacity
 *
 * Requests are issued once. The issuer never waits for the change to complete
 * and never retries; a synchronous rejection is reported as an ApiError with
 * the HTTP status and body attached.
 */

#ifndef CAPSCALE_TRANSITION_ISSUER_HPP
#define CAPSCALE_TRANSITION_ISSUER_HPP

#include "api/http_client.hpp"
#include "capacity_types.hpp"
#include "credential_manager.hpp"
#include "errors.hpp"
#include "management_endpoint.hpp"
#include <nlohmann/json.hpp>

namespace capscale {

/**
 * @brief Full-representation replace of a capacity with a new SKU
 */
struct TransitionRequest {
    ResourceCoordinates coordinates;
    Sku target_sku;
    nlohmann::json body;
};

/**
 * @brief Build the resize request from the most recent snapshot
 *
 * The management API replaces the whole resource on PUT, so location,
 * properties and tags are copied from the snapshot unchanged and only the
 * SKU name is replaced.
 */
TransitionRequest make_resize_request(const CapacitySnapshot& base, Sku target);

class TransitionIssuer {
public:
    TransitionIssuer(client::HttpTransport& transport, const ManagementEndpoint& endpoint);

    /**
     * @brief POST the resume action (no body)
     * @return Accepted HTTP status code
     * @throws ApiError (RESUME_REJECTED)
     */
    int resume(const ResourceCoordinates& coordinates,
               const ManagementCredentials& credentials) const;

    /**
     * @brief POST the suspend action (no body)
     * @return Accepted HTTP status code
     * @throws ApiError (SUSPEND_REJECTED)
     */
    int suspend(const ResourceCoordinates& coordinates,
                const ManagementCredentials& credentials) const;

    /**
     * @brief PUT the capacity with a new SKU
     *
     * @param base Snapshot read immediately before this call
     * @return Accepted HTTP status code
     * @throws ApiError (RESIZE_REJECTED)
     */
    int resize(const CapacitySnapshot& base, Sku target,
               const ManagementCredentials& credentials) const;

private:
    client::HttpTransport& transport_;
    ManagementEndpoint endpoint_;

    int post_action(const ResourceCoordinates& coordinates,
                    const std::string& action,
                    ErrorKind rejection_kind,
                    const ManagementCredentials& credentials) const;
};

} // namespace capscale

#endif // CAPSCALE_TRANSITION_ISSUER_HPP
