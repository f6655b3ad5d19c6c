/**
 * @file errors.hpp
 * @brief Error taxonomy for capacity orchestration
 *
 * Components below the orchestrator throw CapacityError (or a subclass).
 * Each error carries its ErrorKind, and the HTTP status code and response
 * body when the failure originated at the management API boundary.
 * The Orchestrator converts them into a failed OperationResult.
 */

#ifndef CAPSCALE_ERRORS_HPP
#define CAPSCALE_ERRORS_HPP

#include <string>
#include <stdexcept>

namespace capscale {

/**
 * @brief Classified failure of an invocation
 */
enum class ErrorKind {
    NONE,
    INVALID_IDENTIFIER,
    INVALID_ARGUMENT,
    CREDENTIALS_UNAVAILABLE,
    STATUS_FETCH_FAILED,
    RESUME_REJECTED,
    SUSPEND_REJECTED,
    RESIZE_REJECTED,
    CANNOT_SCALE_WHILE_STOPPED,
    START_TIMEOUT_BEFORE_SCALE,
    SCALING_FAILED,
    STATE_FAILED,
    POST_SCALE_VERIFICATION_FAILED,
    TIMEOUT
};

/**
 * @brief Convert error kind to its external name (used in result JSON)
 */
inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::INVALID_IDENTIFIER: return "InvalidIdentifier";
        case ErrorKind::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorKind::CREDENTIALS_UNAVAILABLE: return "CredentialsUnavailable";
        case ErrorKind::STATUS_FETCH_FAILED: return "StatusFetchFailed";
        case ErrorKind::RESUME_REJECTED: return "ResumeRejected";
        case ErrorKind::SUSPEND_REJECTED: return "SuspendRejected";
        case ErrorKind::RESIZE_REJECTED: return "ResizeRejected";
        case ErrorKind::CANNOT_SCALE_WHILE_STOPPED: return "CannotScaleWhileStopped";
        case ErrorKind::START_TIMEOUT_BEFORE_SCALE: return "StartTimeoutBeforeScale";
        case ErrorKind::SCALING_FAILED: return "ScalingFailed";
        case ErrorKind::STATE_FAILED: return "StateFailed";
        case ErrorKind::POST_SCALE_VERIFICATION_FAILED: return "PostScaleVerificationFailed";
        case ErrorKind::TIMEOUT: return "Timeout";
    }
    return "Unknown";
}

/**
 * @brief Base exception for capacity orchestration errors
 */
class CapacityError : public std::runtime_error {
public:
    CapacityError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind), status_code_(0) {}

    CapacityError(ErrorKind kind, const std::string& message,
                  int status_code, const std::string& response_body)
        : std::runtime_error(message), kind_(kind),
          status_code_(status_code), response_body_(response_body) {}

    ErrorKind kind() const { return kind_; }

    /// HTTP status code, 0 when the failure did not come from an HTTP response
    int status_code() const { return status_code_; }

    const std::string& response_body() const { return response_body_; }

private:
    ErrorKind kind_;
    int status_code_;
    std::string response_body_;
};

/**
 * @brief Raised when a resource identifier does not have the capacity path shape
 */
class InvalidIdentifierError : public CapacityError {
public:
    explicit InvalidIdentifierError(const std::string& message)
        : CapacityError(ErrorKind::INVALID_IDENTIFIER, message) {}
};

/**
 * @brief Raised when a management API call is rejected or cannot be completed
 */
class ApiError : public CapacityError {
public:
    ApiError(ErrorKind kind, const std::string& message,
             int status_code = 0, const std::string& response_body = "")
        : CapacityError(kind, message, status_code, response_body) {}
};

} // namespace capscale

#endif // CAPSCALE_ERRORS_HPP
