#include "status_reader.hpp"
#include <sstream>

namespace capscale {

StatusReader::StatusReader(client::HttpTransport& transport, const ManagementEndpoint& endpoint)
    : transport_(transport), endpoint_(endpoint) {}

CapacitySnapshot StatusReader::read(const ResourceCoordinates& coordinates,
                                    const ManagementCredentials& credentials) const {
    client::HttpRequest request;
    request.method = "GET";
    request.path = endpoint_.resource_path(coordinates);
    request.headers = bearer_headers(credentials);

    client::HttpResponse response;
    try {
        response = transport_.send(request);
    } catch (const client::HttpClientError& e) {
        throw ApiError(ErrorKind::STATUS_FETCH_FAILED,
                       "Failed to read status of capacity '" + coordinates.name + "': " + e.what(),
                       e.status_code());
    }

    if (!response.is_success()) {
        std::ostringstream oss;
        oss << "Failed to read status of capacity '" << coordinates.name
            << "': HTTP " << response.status_code;
        if (!response.body.empty()) {
            oss << ": " << response.body;
        }
        throw ApiError(ErrorKind::STATUS_FETCH_FAILED, oss.str(),
                       response.status_code, response.body);
    }

    try {
        nlohmann::json document = nlohmann::json::parse(response.body);
        return parse_capacity_document(coordinates, document);
    } catch (const nlohmann::json::exception& e) {
        throw ApiError(ErrorKind::STATUS_FETCH_FAILED,
                       "Unreadable status document for capacity '" + coordinates.name + "': " + e.what(),
                       response.status_code, response.body);
    } catch (const std::invalid_argument& e) {
        throw ApiError(ErrorKind::STATUS_FETCH_FAILED,
                       "Unexpected status document for capacity '" + coordinates.name + "': " + e.what(),
                       response.status_code, response.body);
    }
}

} // namespace capscale
