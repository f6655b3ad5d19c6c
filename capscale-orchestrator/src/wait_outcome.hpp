/**
 * @file wait_outcome.hpp
 * @brief Terminal result of a convergence wait
 */

#ifndef CAPSCALE_WAIT_OUTCOME_HPP
#define CAPSCALE_WAIT_OUTCOME_HPP

#include "capacity_types.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace capscale {

enum class WaitKind {
    START,      ///< Until the capacity is in the running family
    STOP,       ///< Until the capacity is in the stopped family
    RESIZE      ///< Until the capacity reports the target SKU and is running
};

inline std::string wait_kind_to_string(WaitKind kind) {
    switch (kind) {
        case WaitKind::START: return "start";
        case WaitKind::STOP: return "stop";
        case WaitKind::RESIZE: return "resize";
    }
    return "unknown";
}

/**
 * @brief Converged | Failed(reason) | TimedOut(last observed)
 */
struct WaitOutcome {
    enum class Status {
        CONVERGED,
        FAILED,
        TIMED_OUT
    };

    Status status = Status::TIMED_OUT;
    std::string reason;                                ///< Set for FAILED and TIMED_OUT
    bool deadline_exceeded = false;                    ///< FAILED because the timeout elapsed
    std::optional<CapacitySnapshot> last_observed;     ///< Most recent poll, if any
    size_t polls = 0;
    std::chrono::seconds elapsed{0};

    bool converged() const { return status == Status::CONVERGED; }
    bool failed() const { return status == Status::FAILED; }
    bool timed_out() const { return status == Status::TIMED_OUT; }
};

inline std::string wait_status_to_string(WaitOutcome::Status status) {
    switch (status) {
        case WaitOutcome::Status::CONVERGED: return "Converged";
        case WaitOutcome::Status::FAILED: return "Failed";
        case WaitOutcome::Status::TIMED_OUT: return "TimedOut";
    }
    return "Unknown";
}

} // namespace capscale

#endif // CAPSCALE_WAIT_OUTCOME_HPP
