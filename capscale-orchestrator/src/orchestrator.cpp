/**
 * @file orchestrator.cpp
 * @brief Implementation of the capacity lifecycle orchestrator
 */

#include "orchestrator.hpp"
#include "resource_locator.hpp"
#include <sstream>

namespace capscale {

Orchestrator::Orchestrator(
    client::HttpTransport& transport,
    CredentialManager& credential_manager,
    Clock& clock,
    const ManagementEndpoint& endpoint,
    const OrchestratorConfig& config,
    Logger* logger
)
    : credential_manager_(credential_manager),
      clock_(clock),
      config_(config),
      logger_(logger ? logger : &Logger::get_instance()),
      reader_(transport, endpoint),
      issuer_(transport, endpoint),
      waiter_(reader_, clock, config.wait_policy, logger_) {}

OperationResult Orchestrator::run(const OperationRequest& request) {
    RunState state;
    state.ctx.operation = operation_to_string(request.operation);
    state.result.operation = request.operation;
    if (request.target_sku) {
        state.result.target_sku = sku_to_string(*request.target_sku);
    }

    try {
        validate_request(request);

        switch (request.operation) {
            case Operation::SCALE:
                run_scale(state, request);
                break;
            case Operation::START:
                run_start(state, request);
                break;
            case Operation::STOP:
                run_stop(state, request);
                break;
        }
    } catch (const CapacityError& e) {
        logger_->log_error(state.ctx, e.what(), e.status_code(), e.response_body());

        switch (e.kind()) {
            case ErrorKind::INVALID_IDENTIFIER:
            case ErrorKind::INVALID_ARGUMENT:
            case ErrorKind::CREDENTIALS_UNAVAILABLE:
            case ErrorKind::STATUS_FETCH_FAILED:
                break;
            default:
                refresh_after_failure(state);
                break;
        }

        state.result.set_error(e.kind(), e.what(), e.status_code(), e.response_body());
    }

    state.result.timestamp = std::chrono::system_clock::now();
    logger_->log_run_complete(state.ctx, state.result);
    return state.result;
}

void Orchestrator::validate_request(const OperationRequest& request) const {
    if (request.timeout.count() <= 0) {
        throw CapacityError(ErrorKind::INVALID_ARGUMENT,
            "Timeout must be a positive number of minutes, got " +
            std::to_string(request.timeout.count()));
    }

    if (request.operation == Operation::SCALE) {
        if (!request.target_sku || *request.target_sku == Sku::UNKNOWN) {
            throw CapacityError(ErrorKind::INVALID_ARGUMENT,
                "A target SKU (F2, F4, F8, F16, F32, F64, F128, F256, F512, F1024) "
                "is required for the scale operation");
        }
    }
}

CapacitySnapshot Orchestrator::begin(RunState& state, const OperationRequest& request) {
    state.ctx.phase = "resolve";
    state.coordinates = parse_resource_id(request.resource_id);

    state.ctx.capacity_name = state.coordinates.name;
    state.result.capacity_name = state.coordinates.name;
    state.result.subscription_id = state.coordinates.subscription_id;
    state.result.resource_group = state.coordinates.resource_group;

    state.credentials = credential_manager_.get_credentials();
    state.has_credentials = true;

    logger_->log_run_start(
        state.ctx,
        request.resource_id,
        state.result.target_sku,
        request.wait_for_completion,
        request.timeout,
        &state.credentials
    );

    CapacitySnapshot snapshot = read_snapshot(state, "initial");
    state.result.previous_sku = snapshot.sku_name;
    return snapshot;
}

void Orchestrator::run_scale(RunState& state, const OperationRequest& request) {
    const Sku target = *request.target_sku;
    const std::string target_name = sku_to_string(target);
    const auto timeout = std::chrono::duration_cast<std::chrono::seconds>(request.timeout);

    CapacitySnapshot snapshot = begin(state, request);

    if (snapshot.has_sku(target)) {
        state.result.success = true;
        state.result.message = "Capacity is already at target SKU " + target_name;
        logger_->log_info(state.ctx, state.result.message);
        return;
    }

    if (!snapshot.is_running()) {
        state.ctx.phase = "resume";
        int status = issuer_.resume(state.coordinates, state.credentials);
        logger_->log_transition_issued(state.ctx, "resume", status);

        if (!request.wait_for_completion) {
            throw CapacityError(ErrorKind::CANNOT_SCALE_WHILE_STOPPED,
                "Capacity '" + state.coordinates.name + "' is " + snapshot.state_name +
                ". Resume was requested, but scaling requires a running capacity and "
                "wait-for-completion is disabled. Re-run once the capacity is running.");
        }

        clock_.sleep_for(config_.settle_delay);

        state.ctx.phase = "wait";
        WaitOutcome started = waiter_.wait_for_start(
            state.coordinates, state.credentials, timeout / 2, state.ctx);

        if (!started.converged()) {
            std::ostringstream oss;
            oss << "Capacity '" << state.coordinates.name
                << "' did not reach a running state within " << (timeout / 2).count()
                << " seconds (" << started.reason << "); resize to " << target_name
                << " was not attempted";
            throw CapacityError(ErrorKind::START_TIMEOUT_BEFORE_SCALE, oss.str());
        }

        snapshot = read_snapshot(state, "after_start");
    }

    state.ctx.phase = "resize";
    int status = issuer_.resize(snapshot, target, state.credentials);
    logger_->log_transition_issued(state.ctx, "resize", status, target_name);

    if (!request.wait_for_completion) {
        state.result.state = "Scaling";
        state.result.success = true;
        state.result.message = "Resize from " + snapshot.sku_name + " to " + target_name +
                               " accepted; completion not confirmed";
        return;
    }

    state.ctx.phase = "wait";
    WaitOutcome scaled = waiter_.wait_for_resize(
        state.coordinates, state.credentials, target, timeout, state.ctx);

    if (!scaled.converged()) {
        refresh_after_failure(state);
        ErrorKind kind = scaled.deadline_exceeded ? ErrorKind::TIMEOUT : ErrorKind::SCALING_FAILED;
        throw CapacityError(kind,
            "Scaling capacity '" + state.coordinates.name + "' to " + target_name +
            " failed: " + scaled.reason);
    }

    state.ctx.phase = "verify";
    CapacitySnapshot final_snapshot = read_snapshot(state, "final");

    if (!final_snapshot.has_sku(target)) {
        throw CapacityError(ErrorKind::POST_SCALE_VERIFICATION_FAILED,
            "Capacity '" + state.coordinates.name + "' reported convergence to " + target_name +
            " but a subsequent read shows " + final_snapshot.sku_name + " (" +
            final_snapshot.state_name + ")");
    }

    state.result.success = true;
    state.result.message = "Scaled from " + state.result.previous_sku + " to " + target_name;
}

void Orchestrator::run_start(RunState& state, const OperationRequest& request) {
    const auto timeout = std::chrono::duration_cast<std::chrono::seconds>(request.timeout);

    CapacitySnapshot snapshot = begin(state, request);

    if (snapshot.is_running()) {
        state.result.success = true;
        state.result.message = "Capacity is already running";
        logger_->log_info(state.ctx, state.result.message);
        return;
    }

    state.ctx.phase = "resume";
    int status = issuer_.resume(state.coordinates, state.credentials);
    logger_->log_transition_issued(state.ctx, "resume", status);

    if (!request.wait_for_completion) {
        state.result.state = "Resuming";
        state.result.success = true;
        state.result.message = "Resume accepted; completion not confirmed";
        return;
    }

    clock_.sleep_for(config_.settle_delay);

    state.ctx.phase = "wait";
    WaitOutcome started = waiter_.wait_for_start(
        state.coordinates, state.credentials, timeout, state.ctx);

    if (!started.converged()) {
        refresh_after_failure(state);
        throw CapacityError(ErrorKind::TIMEOUT,
            "Capacity '" + state.coordinates.name + "' did not start: " + started.reason);
    }

    state.ctx.phase = "verify";
    CapacitySnapshot final_snapshot = read_snapshot(state, "final");
    if (!final_snapshot.is_running()) {
        throw CapacityError(ErrorKind::STATE_FAILED,
            "Capacity '" + state.coordinates.name + "' reported running but a subsequent read shows " +
            final_snapshot.state_name);
    }

    state.result.success = true;
    state.result.message = "Capacity resumed";
}

void Orchestrator::run_stop(RunState& state, const OperationRequest& request) {
    const auto timeout = std::chrono::duration_cast<std::chrono::seconds>(request.timeout);

    CapacitySnapshot snapshot = begin(state, request);

    if (snapshot.is_stopped()) {
        state.result.success = true;
        state.result.message = "Capacity is already paused";
        logger_->log_info(state.ctx, state.result.message);
        return;
    }

    state.ctx.phase = "suspend";
    int status = issuer_.suspend(state.coordinates, state.credentials);
    logger_->log_transition_issued(state.ctx, "suspend", status);

    if (!request.wait_for_completion) {
        state.result.state = "Pausing";
        state.result.success = true;
        state.result.message = "Suspend accepted; completion not confirmed";
        return;
    }

    state.ctx.phase = "wait";
    WaitOutcome stopped = waiter_.wait_for_stop(
        state.coordinates, state.credentials, timeout, state.ctx);

    if (stopped.failed()) {
        refresh_after_failure(state);
        throw CapacityError(ErrorKind::STATE_FAILED,
            "Pausing capacity '" + state.coordinates.name + "' failed: " + stopped.reason);
    }
    if (!stopped.converged()) {
        refresh_after_failure(state);
        throw CapacityError(ErrorKind::TIMEOUT,
            "Capacity '" + state.coordinates.name + "' did not pause: " + stopped.reason);
    }

    state.ctx.phase = "verify";
    CapacitySnapshot final_snapshot = read_snapshot(state, "final");
    if (!final_snapshot.is_stopped()) {
        throw CapacityError(ErrorKind::STATE_FAILED,
            "Capacity '" + state.coordinates.name + "' reported paused but a subsequent read shows " +
            final_snapshot.state_name);
    }

    state.result.success = true;
    state.result.message = "Capacity paused";
}

CapacitySnapshot Orchestrator::read_snapshot(RunState& state, const std::string& label) {
    CapacitySnapshot snapshot = reader_.read(state.coordinates, state.credentials);
    logger_->log_snapshot(state.ctx, snapshot, label);
    record_snapshot(state.result, snapshot);
    return snapshot;
}

void Orchestrator::record_snapshot(OperationResult& result, const CapacitySnapshot& snapshot) const {
    result.region = snapshot.location;
    result.current_sku = snapshot.sku_name;
    result.state = snapshot.state_name;
}

void Orchestrator::refresh_after_failure(RunState& state) {
    if (!state.has_credentials || state.refreshed_after_failure) {
        return;
    }
    state.refreshed_after_failure = true;

    try {
        read_snapshot(state, "after_failure");
    } catch (const CapacityError& e) {
        logger_->log_warning(state.ctx,
            std::string("Could not re-read capacity after failure: ") + e.what());
    }
}

} // namespace capscale
