#include "convergence_waiter.hpp"
#include <sstream>

namespace capscale {

namespace {

PollDecision converged() {
    PollDecision decision;
    decision.terminal = true;
    decision.status = WaitOutcome::Status::CONVERGED;
    return decision;
}

PollDecision failed(const std::string& reason) {
    PollDecision decision;
    decision.terminal = true;
    decision.status = WaitOutcome::Status::FAILED;
    decision.reason = reason;
    return decision;
}

PollDecision keep_polling(std::chrono::seconds interval) {
    PollDecision decision;
    decision.terminal = false;
    decision.next_interval = interval;
    return decision;
}

} // namespace

ConvergenceWaiter::ConvergenceWaiter(
    const StatusReader& reader,
    Clock& clock,
    const WaitPolicy& policy,
    Logger* logger
)
    : reader_(reader),
      clock_(clock),
      policy_(policy),
      logger_(logger) {
    if (!logger_) {
        logger_ = &Logger::get_instance();
    }
}

WaitOutcome ConvergenceWaiter::wait_for_resize(
    const ResourceCoordinates& coordinates,
    const ManagementCredentials& credentials,
    Sku target,
    std::chrono::seconds timeout,
    const RunContext& ctx
) {
    return run(WaitKind::RESIZE, coordinates, credentials, target, timeout, ctx);
}

WaitOutcome ConvergenceWaiter::wait_for_start(
    const ResourceCoordinates& coordinates,
    const ManagementCredentials& credentials,
    std::chrono::seconds timeout,
    const RunContext& ctx
) {
    return run(WaitKind::START, coordinates, credentials, std::nullopt, timeout, ctx);
}

WaitOutcome ConvergenceWaiter::wait_for_stop(
    const ResourceCoordinates& coordinates,
    const ManagementCredentials& credentials,
    std::chrono::seconds timeout,
    const RunContext& ctx
) {
    return run(WaitKind::STOP, coordinates, credentials, std::nullopt, timeout, ctx);
}

WaitOutcome ConvergenceWaiter::run(
    WaitKind kind,
    const ResourceCoordinates& coordinates,
    const ManagementCredentials& credentials,
    std::optional<Sku> target,
    std::chrono::seconds timeout,
    const RunContext& ctx
) {
    logger_->log_wait_start(ctx, kind, timeout, target ? sku_to_string(*target) : "");

    WaitOutcome outcome;
    const Clock::time_point start = clock_.now();

    while (true) {
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(clock_.now() - start);
        outcome.elapsed = elapsed;

        if (elapsed >= timeout) {
            outcome.reason = timeout_reason(kind, outcome.last_observed);
            if (kind == WaitKind::RESIZE) {
                outcome.status = WaitOutcome::Status::FAILED;
                outcome.deadline_exceeded = true;
            } else {
                outcome.status = WaitOutcome::Status::TIMED_OUT;
            }
            break;
        }

        CapacitySnapshot snapshot = reader_.read(coordinates, credentials);
        outcome.polls++;

        PollDecision decision = evaluate(kind, snapshot, target);
        logger_->log_poll(ctx, kind, outcome.polls, snapshot, elapsed, decision.next_interval);
        outcome.last_observed = std::move(snapshot);

        if (decision.terminal) {
            outcome.status = decision.status;
            outcome.reason = decision.reason;
            break;
        }

        clock_.sleep_for(decision.next_interval);
    }

    logger_->log_wait_outcome(ctx, kind, outcome);
    return outcome;
}

PollDecision ConvergenceWaiter::evaluate(WaitKind kind, const CapacitySnapshot& snapshot,
                                         std::optional<Sku> target) const {
    switch (kind) {
        case WaitKind::RESIZE:
            if (!target) {
                throw CapacityError(ErrorKind::INVALID_ARGUMENT, "Resize wait requires a target SKU");
            }
            return evaluate_resize(snapshot, *target);
        case WaitKind::START:
            return evaluate_start(snapshot);
        case WaitKind::STOP:
            return evaluate_stop(snapshot);
    }
    return keep_polling(policy_.poll_interval);
}

PollDecision ConvergenceWaiter::evaluate_resize(const CapacitySnapshot& snapshot, Sku target) const {
    if (snapshot.family() == StateFamily::FAILURE) {
        return failed("Capacity entered " + snapshot.state_name +
                      " state while scaling to " + sku_to_string(target) +
                      "; this may indicate a quota limitation");
    }

    if (snapshot.provisioning_state == ProvisioningState::FAILED) {
        return failed("Provisioning state is " + snapshot.provisioning_state_name +
                      " while scaling to " + sku_to_string(target) +
                      "; this may indicate a quota limitation");
    }

    if (snapshot.has_sku(target) && snapshot.is_running()) {
        return converged();
    }

    return keep_polling(policy_.poll_interval);
}

PollDecision ConvergenceWaiter::evaluate_start(const CapacitySnapshot& snapshot) const {
    switch (snapshot.family()) {
        case StateFamily::RUNNING:
            return converged();
        case StateFamily::STOPPED:
            return keep_polling(policy_.stopped_poll_interval);
        case StateFamily::TRANSITIONAL:
        case StateFamily::FAILURE:
        case StateFamily::UNRECOGNIZED:
            return keep_polling(policy_.poll_interval);
    }
    return keep_polling(policy_.poll_interval);
}

PollDecision ConvergenceWaiter::evaluate_stop(const CapacitySnapshot& snapshot) const {
    switch (snapshot.family()) {
        case StateFamily::STOPPED:
            return converged();
        case StateFamily::FAILURE:
            return failed("Capacity entered " + snapshot.state_name + " state while pausing");
        case StateFamily::RUNNING:
        case StateFamily::TRANSITIONAL:
        case StateFamily::UNRECOGNIZED:
            return keep_polling(policy_.poll_interval);
    }
    return keep_polling(policy_.poll_interval);
}

std::string ConvergenceWaiter::timeout_reason(WaitKind kind,
                                              const std::optional<CapacitySnapshot>& last) const {
    std::string state = last ? last->state_name : "Unknown";
    std::string sku = last ? last->sku_name : "Unknown";

    std::ostringstream oss;
    switch (kind) {
        case WaitKind::RESIZE:
            oss << "timeout, last observed " << state << "/" << sku;
            break;
        case WaitKind::START:
            oss << "timeout waiting for a running state, last observed " << state;
            break;
        case WaitKind::STOP:
            oss << "timeout waiting for a paused state, last observed " << state;
            break;
    }
    return oss.str();
}

} // namespace capscale
