/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace capscale {

namespace {

// Upper bound for API response bodies copied into a log line
constexpr size_t kMaxBodyChars = 2000;

std::string truncate_body(const std::string& body) {
    if (body.size() <= kMaxBodyChars) {
        return body;
    }
    return body.substr(0, kMaxBodyChars) + "...[truncated]";
}

} // namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

std::map<std::string, std::string> Logger::base_fields(
    const RunContext& ctx,
    const std::string& event
) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    fields["capacity"] = ctx.capacity_name;
    fields["operation"] = ctx.operation;
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
    return fields;
}

void Logger::log_run_start(
    const RunContext& ctx,
    const std::string& resource_id,
    const std::string& target_sku,
    bool wait_for_completion,
    std::chrono::minutes timeout,
    const ManagementCredentials* credentials
) {
    auto fields = base_fields(ctx, "run_start");
    fields["resource_id"] = resource_id;
    fields["target_sku"] = target_sku;
    fields["wait_for_completion"] = wait_for_completion ? "true" : "false";
    fields["timeout_minutes"] = std::to_string(timeout.count());

    if (credentials && credentials->is_valid()) {
        fields["management_url"] = credentials->management_url;
        fields["access_token"] = CredentialManager::mask_token(credentials->access_token);
    } else {
        fields["credentials"] = "none";
    }

    log(LogLevel::INFO, "Starting capacity operation", fields);
}

void Logger::log_snapshot(
    const RunContext& ctx,
    const CapacitySnapshot& snapshot,
    const std::string& label
) {
    auto fields = base_fields(ctx, "snapshot");
    fields["label"] = label;
    fields["sku"] = snapshot.sku_name;
    fields["state"] = snapshot.state_name;
    fields["state_family"] = state_family_to_string(snapshot.family());
    fields["provisioning_state"] = snapshot.provisioning_state_name;
    fields["location"] = snapshot.location;

    log(LogLevel::INFO, "Capacity status read", fields);
}

void Logger::log_transition_issued(
    const RunContext& ctx,
    const std::string& action,
    int status_code,
    const std::string& target_sku
) {
    auto fields = base_fields(ctx, "transition_issued");
    fields["action"] = action;
    fields["status_code"] = std::to_string(status_code);
    if (!target_sku.empty()) {
        fields["target_sku"] = target_sku;
    }

    log(LogLevel::INFO, "Transition request accepted", fields);
}

void Logger::log_wait_start(
    const RunContext& ctx,
    WaitKind kind,
    std::chrono::seconds timeout,
    const std::string& target_sku
) {
    auto fields = base_fields(ctx, "wait_start");
    fields["wait_kind"] = wait_kind_to_string(kind);
    fields["timeout_seconds"] = std::to_string(timeout.count());
    if (!target_sku.empty()) {
        fields["target_sku"] = target_sku;
    }

    log(LogLevel::INFO, "Waiting for convergence", fields);
}

void Logger::log_poll(
    const RunContext& ctx,
    WaitKind kind,
    size_t poll_number,
    const CapacitySnapshot& snapshot,
    std::chrono::seconds elapsed,
    std::chrono::seconds next_interval
) {
    auto fields = base_fields(ctx, "poll");
    fields["wait_kind"] = wait_kind_to_string(kind);
    fields["poll"] = std::to_string(poll_number);
    fields["sku"] = snapshot.sku_name;
    fields["state"] = snapshot.state_name;
    fields["provisioning_state"] = snapshot.provisioning_state_name;
    fields["elapsed_seconds"] = std::to_string(elapsed.count());
    fields["next_poll_seconds"] = std::to_string(next_interval.count());

    log(LogLevel::DEBUG, "Polled capacity status", fields);
}

void Logger::log_wait_outcome(
    const RunContext& ctx,
    WaitKind kind,
    const WaitOutcome& outcome
) {
    auto fields = base_fields(ctx, "wait_outcome");
    fields["wait_kind"] = wait_kind_to_string(kind);
    fields["outcome"] = wait_status_to_string(outcome.status);
    fields["polls"] = std::to_string(outcome.polls);
    fields["elapsed_seconds"] = std::to_string(outcome.elapsed.count());
    if (!outcome.reason.empty()) {
        fields["reason"] = outcome.reason;
    }
    if (outcome.last_observed) {
        fields["last_state"] = outcome.last_observed->state_name;
        fields["last_sku"] = outcome.last_observed->sku_name;
    }

    LogLevel level = LogLevel::INFO;
    if (outcome.failed()) {
        level = LogLevel::ERROR;
    } else if (outcome.timed_out()) {
        level = LogLevel::WARN;
    }

    log(level, "Convergence wait finished", fields);
}

void Logger::log_run_complete(
    const RunContext& ctx,
    const OperationResult& result
) {
    auto fields = base_fields(ctx, "run_complete");
    fields["success"] = result.success ? "true" : "false";
    fields["previous_sku"] = result.previous_sku;
    fields["current_sku"] = result.current_sku;
    fields["target_sku"] = result.target_sku;
    fields["state"] = result.state;
    if (!result.message.empty()) {
        fields["result_message"] = result.message;
    }
    if (result.error) {
        fields["error_kind"] = error_kind_to_string(result.error_kind);
    }

    log(result.success ? LogLevel::INFO : LogLevel::ERROR, "Capacity operation completed", fields);
}

void Logger::log_error(
    const RunContext& ctx,
    const std::string& error_message,
    int status_code,
    const std::string& response_body
) {
    auto fields = base_fields(ctx, "error");
    fields["error_message"] = error_message;

    if (status_code != 0) {
        fields["status_code"] = std::to_string(status_code);
    }
    if (!response_body.empty()) {
        fields["response_body"] = truncate_body(response_body);
    }

    log(LogLevel::ERROR, "Capacity operation error", fields);
}

void Logger::log_warning(
    const RunContext& ctx,
    const std::string& warning_message
) {
    auto fields = base_fields(ctx, "warning");
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_info(
    const RunContext& ctx,
    const std::string& message
) {
    log(LogLevel::INFO, message, base_fields(ctx, "info"));
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace capscale
