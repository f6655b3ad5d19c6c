/**
 * @file operation_result.hpp
 * @brief Externally observable outcome of one orchestration run
 *
 * The same value drives the JSON printed for the caller and the process
 * exit status, so both always agree.
 */

#ifndef CAPSCALE_OPERATION_RESULT_HPP
#define CAPSCALE_OPERATION_RESULT_HPP

#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace capscale {

/**
 * @brief Lifecycle operation requested for the capacity
 */
enum class Operation {
    SCALE,      ///< Resize to a target SKU, resuming first if needed
    START,      ///< Resume a paused capacity
    STOP        ///< Suspend a running capacity
};

std::string operation_to_string(Operation operation);

/**
 * @brief Parse "scale", "start" or "stop" (case-insensitive)
 */
std::optional<Operation> parse_operation(const std::string& value);

struct OperationResult {
    std::string capacity_name;
    std::string subscription_id;
    std::string resource_group;
    std::string region;

    Operation operation = Operation::SCALE;
    std::string previous_sku;
    std::string current_sku;
    std::string target_sku;
    std::string state;

    bool success = false;
    bool error = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string message;

    int http_status = 0;           ///< Set when the failure came from an API response
    std::string response_body;

    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    /**
     * @brief Mark the result as failed with a classified error
     */
    void set_error(ErrorKind kind, const std::string& error_message,
                   int status_code = 0, const std::string& body = "");

    /**
     * @brief Process exit status: 0 success, 2 invalid input, 1 any other failure
     */
    int exit_code() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Format a time point as UTC ISO-8601 ("2024-01-31T08:15:00Z")
 */
std::string format_utc_timestamp(std::chrono::system_clock::time_point time);

} // namespace capscale

#endif // CAPSCALE_OPERATION_RESULT_HPP
