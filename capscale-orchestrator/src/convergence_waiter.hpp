/**
 * @file convergence_waiter.hpp
 * @brief Polls a capacity until it reaches a target state, fails, or times out
 *
 * State machine per wait:
 *
 *   Polling --> Converged
 *          \--> Failed
 *           \-> TimedOut
 *
 * The deadline is checked before every poll, so a wait can overrun its
 * timeout by at most one status read. Status read failures are not retried
 * and propagate to the caller as ApiError.
 *
 * Start waits never fail: failure-family and unrecognized states keep the
 * wait going until it converges or times out. A resize wait that runs out of
 * time reports Failed with deadline_exceeded set; start and stop waits report
 * TimedOut and leave the decision to the caller.
 */

#ifndef CAPSCALE_CONVERGENCE_WAITER_HPP
#define CAPSCALE_CONVERGENCE_WAITER_HPP

#include "capacity_types.hpp"
#include "clock.hpp"
#include "credential_manager.hpp"
#include "logger.hpp"
#include "status_reader.hpp"
#include "wait_outcome.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace capscale {

/**
 * @brief Poll cadence
 */
struct WaitPolicy {
    std::chrono::seconds poll_interval{30};           ///< Default delay between polls
    std::chrono::seconds stopped_poll_interval{60};   ///< Start-wait delay while still stopped
};

/**
 * @brief Verdict for a single observed snapshot
 */
struct PollDecision {
    bool terminal = false;
    WaitOutcome::Status status = WaitOutcome::Status::TIMED_OUT;   ///< Meaningful when terminal
    std::string reason;
    std::chrono::seconds next_interval{0};                         ///< Meaningful when not terminal
};

class ConvergenceWaiter {
public:
    /**
     * @param reader Status source for each poll
     * @param clock Time source and sleeper
     * @param policy Poll cadence
     * @param logger Logger instance (optional, uses default if nullptr)
     */
    ConvergenceWaiter(
        const StatusReader& reader,
        Clock& clock,
        const WaitPolicy& policy = WaitPolicy(),
        Logger* logger = nullptr
    );

    /**
     * @brief Wait until the capacity reports the target SKU and a running state
     */
    WaitOutcome wait_for_resize(
        const ResourceCoordinates& coordinates,
        const ManagementCredentials& credentials,
        Sku target,
        std::chrono::seconds timeout,
        const RunContext& ctx = RunContext()
    );

    /**
     * @brief Wait until the capacity is in the running family
     */
    WaitOutcome wait_for_start(
        const ResourceCoordinates& coordinates,
        const ManagementCredentials& credentials,
        std::chrono::seconds timeout,
        const RunContext& ctx = RunContext()
    );

    /**
     * @brief Wait until the capacity is in the stopped family
     */
    WaitOutcome wait_for_stop(
        const ResourceCoordinates& coordinates,
        const ManagementCredentials& credentials,
        std::chrono::seconds timeout,
        const RunContext& ctx = RunContext()
    );

    /**
     * @brief Classify one snapshot for the given kind of wait
     *
     * @param target Required for RESIZE, ignored otherwise
     */
    PollDecision evaluate(WaitKind kind, const CapacitySnapshot& snapshot,
                          std::optional<Sku> target = std::nullopt) const;

    const WaitPolicy& policy() const { return policy_; }

private:
    const StatusReader& reader_;
    Clock& clock_;
    WaitPolicy policy_;
    Logger* logger_;

    WaitOutcome run(
        WaitKind kind,
        const ResourceCoordinates& coordinates,
        const ManagementCredentials& credentials,
        std::optional<Sku> target,
        std::chrono::seconds timeout,
        const RunContext& ctx
    );

    PollDecision evaluate_resize(const CapacitySnapshot& snapshot, Sku target) const;
    PollDecision evaluate_start(const CapacitySnapshot& snapshot) const;
    PollDecision evaluate_stop(const CapacitySnapshot& snapshot) const;

    std::string timeout_reason(WaitKind kind, const std::optional<CapacitySnapshot>& last) const;
};

} // namespace capscale

#endif // CAPSCALE_CONVERGENCE_WAITER_HPP
