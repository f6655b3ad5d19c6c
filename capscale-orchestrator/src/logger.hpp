/**
 * @file logger.hpp
 * @brief Structured logging for capacity orchestration with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (capacity, operation, phase)
 * - Token masking for credentials
 *
 * Log lines go to stderr and/or a file. stdout is left to the run result.
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef CAPSCALE_LOGGER_HPP
#define CAPSCALE_LOGGER_HPP

#include "capacity_types.hpp"
#include "credential_manager.hpp"
#include "operation_result.hpp"
#include "wait_outcome.hpp"
#include <string>
#include <map>
#include <memory>
#include <chrono>
#include <fstream>

namespace capscale {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Raw HTTP details, every poll
    INFO,    ///< Run start/end, transitions issued, wait outcomes
    WARN,    ///< Non-fatal issues (best-effort re-read failed, start-wait timed out)
    ERROR    ///< Terminal failures
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Run context attached to every event
 */
struct RunContext {
    std::string capacity_name;       ///< Capacity being managed
    std::string operation;           ///< scale, start, stop
    std::string phase;               ///< resolve, read, resume, resize, wait, verify

    RunContext() = default;

    RunContext(const std::string& name, const std::string& op)
        : capacity_name(name), operation(op) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("capscale.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   RunContext ctx("analytics-prod", "scale");
 *   logger.log_snapshot(ctx, snapshot, "initial");
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);

    const LoggerConfig& get_config() const { return config_; }

    /**
     * @brief Log the entry parameters of a run
     *
     * @param credentials Optional credentials (token will be masked)
     */
    void log_run_start(
        const RunContext& ctx,
        const std::string& resource_id,
        const std::string& target_sku,
        bool wait_for_completion,
        std::chrono::minutes timeout,
        const ManagementCredentials* credentials = nullptr
    );

    /**
     * @brief Log a capacity snapshot read from the management endpoint
     *
     * @param label Why it was read (initial, after_start, final, ...)
     */
    void log_snapshot(
        const RunContext& ctx,
        const CapacitySnapshot& snapshot,
        const std::string& label
    );

    /**
     * @brief Log an accepted state-changing request
     */
    void log_transition_issued(
        const RunContext& ctx,
        const std::string& action,
        int status_code,
        const std::string& target_sku = ""
    );

    void log_wait_start(
        const RunContext& ctx,
        WaitKind kind,
        std::chrono::seconds timeout,
        const std::string& target_sku = ""
    );

    /**
     * @brief Log one poll of a convergence wait (DEBUG)
     */
    void log_poll(
        const RunContext& ctx,
        WaitKind kind,
        size_t poll_number,
        const CapacitySnapshot& snapshot,
        std::chrono::seconds elapsed,
        std::chrono::seconds next_interval
    );

    void log_wait_outcome(
        const RunContext& ctx,
        WaitKind kind,
        const WaitOutcome& outcome
    );

    /**
     * @brief Log the final result of a run (ERROR level when it failed)
     */
    void log_run_complete(
        const RunContext& ctx,
        const OperationResult& result
    );

    /**
     * @brief Log error with context
     *
     * @param status_code HTTP status, 0 if not from an API response
     * @param response_body API response body, if any
     */
    void log_error(
        const RunContext& ctx,
        const std::string& error_message,
        int status_code = 0,
        const std::string& response_body = ""
    );

    void log_warning(
        const RunContext& ctx,
        const std::string& warning_message
    );

    void log_info(
        const RunContext& ctx,
        const std::string& message
    );

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::map<std::string, std::string> base_fields(const RunContext& ctx, const std::string& event) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace capscale

#endif // CAPSCALE_LOGGER_HPP
