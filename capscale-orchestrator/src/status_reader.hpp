/**
 * @file status_reader.hpp
 * @brief Reads the observable state of a capacity from the management endpoint
 */

#ifndef CAPSCALE_STATUS_READER_HPP
#define CAPSCALE_STATUS_READER_HPP

#include "api/http_client.hpp"
#include "capacity_types.hpp"
#include "credential_manager.hpp"
#include "errors.hpp"
#include "management_endpoint.hpp"

namespace capscale {

class StatusReader {
public:
    StatusReader(client::HttpTransport& transport, const ManagementEndpoint& endpoint);

    /**
     * @brief Fetch the current snapshot of a capacity
     *
     * @param coordinates Capacity to read
     * @param credentials Bearer credential for this call
     * @return Snapshot built from the API document
     * @throws ApiError (STATUS_FETCH_FAILED) on transport error, non-2xx status
     *         or an unusable response document. Status code and body are attached.
     */
    CapacitySnapshot read(const ResourceCoordinates& coordinates,
                          const ManagementCredentials& credentials) const;

private:
    client::HttpTransport& transport_;
    ManagementEndpoint endpoint_;
};

} // namespace capscale

#endif // CAPSCALE_STATUS_READER_HPP
