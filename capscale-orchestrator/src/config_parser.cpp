#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace capscale {

namespace {

std::string read_string(const json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    if (!j[key].is_string()) {
        throw ConfigParseError(std::string("Field '") + key + "' must be a string");
    }
    return expand_environment_variables(j[key].get<std::string>());
}

bool read_bool(const json& j, const char* key, bool fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    if (j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    if (j[key].is_string()) {
        std::string value = expand_environment_variables(j[key].get<std::string>());
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
    }
    throw ConfigParseError(std::string("Field '") + key + "' must be a boolean");
}

int read_int(const json& j, const char* key, int fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    if (j[key].is_number_unsigned()) {
        auto value = j[key].get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw ConfigParseError(std::string("Field '") + key + "' is out of range");
        }
        return static_cast<int>(value);
    }
    if (j[key].is_number_integer()) {
        auto value = j[key].get<std::int64_t>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            throw ConfigParseError(std::string("Field '") + key + "' is out of range");
        }
        return static_cast<int>(value);
    }
    if (j[key].is_string()) {
        std::string value = expand_environment_variables(j[key].get<std::string>());
        try {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed == value.size()) {
                return parsed;
            }
        } catch (const std::exception&) {
            // fall through to the type error below
        }
    }
    throw ConfigParseError(std::string("Field '") + key + "' must be an integer");
}

} // namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                pos = start + 1;   // Unterminated ${, leave as-is
                continue;
            }
            pos++; // Skip '}'
        }

        if (var_name.empty()) {
            pos = start + 1;       // Lone '$'
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

RunConfig parse_run_config_from_string(const std::string& json_string, const RunConfig& base) {
    RunConfig config = base;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Run configuration must be a JSON object");
        }

        config.resource_id = read_string(j, "resource_id", config.resource_id);
        config.operation = read_string(j, "operation", config.operation);
        config.target_sku = read_string(j, "target_sku", config.target_sku);
        config.wait_for_completion = read_bool(j, "wait_for_completion", config.wait_for_completion);
        config.timeout_minutes = read_int(j, "timeout_minutes", config.timeout_minutes);

        config.management_url = read_string(j, "management_url", config.management_url);
        config.api_version = read_string(j, "api_version", config.api_version);
        config.http_timeout_ms = read_int(j, "http_timeout_ms", config.http_timeout_ms);

        config.poll_interval_seconds =
            read_int(j, "poll_interval_seconds", config.poll_interval_seconds);
        config.stopped_poll_interval_seconds =
            read_int(j, "stopped_poll_interval_seconds", config.stopped_poll_interval_seconds);
        config.settle_delay_seconds =
            read_int(j, "settle_delay_seconds", config.settle_delay_seconds);

        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (!logging.is_object()) {
                throw ConfigParseError("Field 'logging' must be an object");
            }
            config.logging.level = read_string(logging, "level", config.logging.level);
            config.logging.json = read_bool(logging, "json", config.logging.json);
            config.logging.file = read_string(logging, "file", config.logging.file);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path, const RunConfig& base) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    return parse_run_config_from_string(buffer.str(), base);
}

OperationRequest build_operation_request(const RunConfig& config) {
    OperationRequest request;

    if (config.resource_id.empty()) {
        throw ConfigParseError("A resource identifier is required (--resource-id or 'resource_id')");
    }
    request.resource_id = config.resource_id;

    auto operation = parse_operation(config.operation);
    if (!operation) {
        throw ConfigParseError("Unknown operation '" + config.operation +
                               "'. Expected one of: scale, start, stop");
    }
    request.operation = *operation;

    if (!config.target_sku.empty()) {
        auto sku = parse_sku(config.target_sku);
        if (!sku) {
            throw ConfigParseError("Unsupported target SKU '" + config.target_sku +
                                   "'. Expected one of: F2, F4, F8, F16, F32, F64, F128, "
                                   "F256, F512, F1024");
        }
        request.target_sku = *sku;
    } else if (request.operation == Operation::SCALE) {
        throw ConfigParseError("A target SKU is required for the scale operation (--target-sku)");
    }

    if (config.timeout_minutes <= 0) {
        throw ConfigParseError("Timeout must be a positive number of minutes, got " +
                               std::to_string(config.timeout_minutes));
    }
    request.timeout = std::chrono::minutes(config.timeout_minutes);
    request.wait_for_completion = config.wait_for_completion;

    return request;
}

OrchestratorConfig build_orchestrator_config(const RunConfig& config) {
    if (config.poll_interval_seconds <= 0) {
        throw ConfigParseError("poll_interval_seconds must be positive");
    }
    if (config.stopped_poll_interval_seconds <= 0) {
        throw ConfigParseError("stopped_poll_interval_seconds must be positive");
    }
    if (config.settle_delay_seconds < 0) {
        throw ConfigParseError("settle_delay_seconds must not be negative");
    }

    OrchestratorConfig orchestrator_config;
    orchestrator_config.settle_delay = std::chrono::seconds(config.settle_delay_seconds);
    orchestrator_config.wait_policy.poll_interval = std::chrono::seconds(config.poll_interval_seconds);
    orchestrator_config.wait_policy.stopped_poll_interval =
        std::chrono::seconds(config.stopped_poll_interval_seconds);
    return orchestrator_config;
}

LoggerConfig build_logger_config(const RunConfig& config) {
    const std::string& level = config.logging.level;
    if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
        throw ConfigParseError("Unknown log level '" + level +
                               "'. Expected one of: DEBUG, INFO, WARN, ERROR");
    }

    LoggerConfig logger_config;
    logger_config.min_level = string_to_level(level);
    logger_config.enable_json = config.logging.json;
    logger_config.enable_console = true;
    logger_config.enable_file = !config.logging.file.empty();
    if (logger_config.enable_file) {
        logger_config.log_file_path = config.logging.file;
    }
    return logger_config;
}

} // namespace capscale
