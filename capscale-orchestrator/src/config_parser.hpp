#ifndef CAPSCALE_CONFIG_PARSER_HPP
#define CAPSCALE_CONFIG_PARSER_HPP

#include "logger.hpp"
#include "management_endpoint.hpp"
#include "orchestrator.hpp"
#include <stdexcept>
#include <string>

namespace capscale {

/**
 * @brief Exception thrown when a run configuration is unreadable or invalid
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Logging section of a run configuration
 */
struct LoggingSettings {
    std::string level = "INFO";
    bool json = true;
    std::string file;                ///< Empty disables file logging
};

/**
 * @brief Everything one invocation needs, as read from file and CLI
 *
 * Values are kept as the user wrote them; build_operation_request() and
 * friends validate and convert.
 */
struct RunConfig {
    std::string resource_id;
    std::string operation = "scale";
    std::string target_sku;
    bool wait_for_completion = true;
    int timeout_minutes = 10;

    std::string management_url;      ///< Empty means "use the credential source's URL"
    std::string api_version = kDefaultApiVersion;
    int http_timeout_ms = 30000;

    int poll_interval_seconds = 30;
    int stopped_poll_interval_seconds = 60;
    int settle_delay_seconds = 30;

    LoggingSettings logging;
};

/**
 * @brief Parses a run configuration from a JSON string
 *
 * Unknown keys are ignored. String values may reference environment
 * variables as ${VAR} or $VAR.
 *
 * @param json_string JSON configuration
 * @param base Values for keys the document does not set
 * @throws ConfigParseError if JSON is invalid or a value has the wrong type
 */
RunConfig parse_run_config_from_string(const std::string& json_string,
                                       const RunConfig& base = RunConfig());

/**
 * @brief Parses a run configuration from a JSON file
 *
 * @throws ConfigParseError if the file cannot be read or is invalid
 */
RunConfig parse_run_config_from_file(const std::string& file_path,
                                     const RunConfig& base = RunConfig());

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Validate entry parameters and convert them into a request
 *
 * @throws ConfigParseError on missing resource id, unknown operation,
 *         unsupported or missing target SKU, or a non-positive timeout
 */
OperationRequest build_operation_request(const RunConfig& config);

/**
 * @brief Convert poll and settle settings
 *
 * @throws ConfigParseError if an interval is not positive or the settle delay is negative
 */
OrchestratorConfig build_orchestrator_config(const RunConfig& config);

/**
 * @brief Convert the logging section
 *
 * @throws ConfigParseError on an unknown level name
 */
LoggerConfig build_logger_config(const RunConfig& config);

} // namespace capscale

#endif // CAPSCALE_CONFIG_PARSER_HPP
