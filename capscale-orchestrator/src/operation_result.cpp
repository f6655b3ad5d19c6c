#include "operation_result.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace capscale {

std::string operation_to_string(Operation operation) {
    switch (operation) {
        case Operation::SCALE: return "scale";
        case Operation::START: return "start";
        case Operation::STOP: return "stop";
    }
    return "unknown";
}

std::optional<Operation> parse_operation(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "scale") return Operation::SCALE;
    if (lowered == "start") return Operation::START;
    if (lowered == "stop") return Operation::STOP;
    return std::nullopt;
}

void OperationResult::set_error(ErrorKind kind, const std::string& error_message,
                                int status_code, const std::string& body) {
    success = false;
    error = true;
    error_kind = kind;
    message = error_message;
    http_status = status_code;
    response_body = body;
}

int OperationResult::exit_code() const {
    if (success && !error) {
        return 0;
    }
    switch (error_kind) {
        case ErrorKind::INVALID_IDENTIFIER:
        case ErrorKind::INVALID_ARGUMENT:
            return 2;
        default:
            return 1;
    }
}

nlohmann::json OperationResult::to_json() const {
    nlohmann::json j;
    j["capacityName"] = capacity_name;
    j["subscriptionId"] = subscription_id;
    j["resourceGroup"] = resource_group;
    j["region"] = region;
    j["operation"] = operation_to_string(operation);
    j["previousSku"] = previous_sku;
    j["currentSku"] = current_sku;
    j["targetSku"] = target_sku;
    j["state"] = state;
    j["timestamp"] = format_utc_timestamp(timestamp);
    j["success"] = success;

    if (!message.empty()) {
        j["message"] = message;
    }

    if (error) {
        j["error"] = true;
        j["errorKind"] = error_kind_to_string(error_kind);
        if (http_status != 0) {
            j["httpStatus"] = http_status;
        }
        if (!response_body.empty()) {
            j["responseBody"] = response_body;
        }
    }

    return j;
}

std::string format_utc_timestamp(std::chrono::system_clock::time_point time) {
    auto time_t_value = std::chrono::system_clock::to_time_t(time);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_value);
#else
    gmtime_r(&time_t_value, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace capscale
