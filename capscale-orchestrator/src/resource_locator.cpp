#include "resource_locator.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace capscale {

namespace {

bool keyword_matches(const std::string& segment, const char* keyword) {
    std::string expected(keyword);
    return segment.size() == expected.size() &&
           std::equal(segment.begin(), segment.end(), expected.begin(),
                      [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                      });
}

// Segments between slashes; the leading slash yields no segment
std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 1;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            slash = path.size();
        }
        segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

} // namespace

ResourceCoordinates parse_resource_id(const std::string& resource_id) {
    auto invalid = [&resource_id]() {
        return InvalidIdentifierError(
            "Invalid resource identifier '" + resource_id + "'. Expected format: " +
            kResourceIdShape);
    };

    if (resource_id.empty() || resource_id.front() != '/') {
        throw invalid();
    }

    std::vector<std::string> segments = split_path(resource_id);
    if (segments.size() == 9 && segments.back().empty()) {
        segments.pop_back();
    }
    if (segments.size() != 8) {
        throw invalid();
    }

    const char* keywords[] = {"subscriptions", "resourceGroups", "providers", "capacities"};
    for (size_t i = 0; i < 4; ++i) {
        if (!keyword_matches(segments[2 * i], keywords[i]) || segments[2 * i + 1].empty()) {
            throw invalid();
        }
    }

    ResourceCoordinates coordinates;
    coordinates.subscription_id = segments[1];
    coordinates.resource_group = segments[3];
    coordinates.provider = segments[5];
    coordinates.name = segments[7];
    return coordinates;
}

std::string format_resource_id(const ResourceCoordinates& coordinates) {
    return "/subscriptions/" + coordinates.subscription_id +
           "/resourceGroups/" + coordinates.resource_group +
           "/providers/" + coordinates.provider +
           "/capacities/" + coordinates.name;
}

} // namespace capscale
