/**
 * @file orchestrator.hpp
 * @brief Drives one capacity through a lifecycle operation
 *
 * The Orchestrator is responsible for:
 * - Resolving the capacity and reading its current state
 * - Deciding the sequence: ensure running, issue transition, wait, verify
 * - Classifying every failure into an ErrorKind
 * - Producing one OperationResult per run, successful or not
 *
 * Scale sequence:
 *   resolve -> read -> (already at target: done)
 *           -> [not running: resume -> settle -> start-wait(timeout/2) -> re-read]
 *           -> resize -> [no wait: done, state "Scaling"]
 *           -> resize-wait(timeout) -> re-read -> verify SKU
 *
 * Errors never escape run(): a failed run returns a result with error set,
 * after a best-effort re-read so it reflects the last known state.
 */

#ifndef CAPSCALE_ORCHESTRATOR_HPP
#define CAPSCALE_ORCHESTRATOR_HPP

#include "api/http_client.hpp"
#include "capacity_types.hpp"
#include "clock.hpp"
#include "convergence_waiter.hpp"
#include "credential_manager.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "management_endpoint.hpp"
#include "operation_result.hpp"
#include "status_reader.hpp"
#include "transition_issuer.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace capscale {

/**
 * @brief Entry parameters of one run
 */
struct OperationRequest {
    std::string resource_id;
    Operation operation = Operation::SCALE;
    std::optional<Sku> target_sku;          ///< Required for SCALE
    bool wait_for_completion = true;
    std::chrono::minutes timeout{10};
};

/**
 * @brief Orchestrator configuration
 */
struct OrchestratorConfig {
    std::chrono::seconds settle_delay;    ///< Pause after resume before polling (default: 30s)
    WaitPolicy wait_policy;

    OrchestratorConfig()
        : settle_delay(30) {}
};

/**
 * @brief Lifecycle orchestrator for a single capacity
 *
 * Usage Example:
 *   @code
 *   CredentialManager credentials;
 *   client::HttpClient http("https://management.azure.com");
 *   SystemClock clock;
 *
 *   Orchestrator orchestrator(http, credentials, clock);
 *
 *   OperationRequest request;
 *   request.resource_id = "/subscriptions/.../capacities/analytics";
 *   request.target_sku = Sku::F64;
 *
 *   OperationResult result = orchestrator.run(request);
 *   std::cout << result.to_json().dump(2) << std::endl;
 *   return result.exit_code();
 *   @endcode
 */
class Orchestrator {
public:
    /**
     * @param transport HTTP transport rooted at the management endpoint
     * @param credential_manager Source of the bearer credential
     * @param clock Time source for waits and the settle delay
     * @param endpoint API version (optional)
     * @param config Orchestrator configuration (optional)
     * @param logger Logger instance (optional, uses default if nullptr)
     */
    Orchestrator(
        client::HttpTransport& transport,
        CredentialManager& credential_manager,
        Clock& clock,
        const ManagementEndpoint& endpoint = ManagementEndpoint(),
        const OrchestratorConfig& config = OrchestratorConfig(),
        Logger* logger = nullptr
    );

    /**
     * @brief Execute one operation against one capacity
     *
     * @return Result describing the outcome; never throws CapacityError
     */
    OperationResult run(const OperationRequest& request);

private:
    /// Per-run state; nothing here survives between runs
    struct RunState {
        RunContext ctx;
        ResourceCoordinates coordinates;
        ManagementCredentials credentials;
        bool has_credentials = false;
        bool refreshed_after_failure = false;
        OperationResult result;
    };

    CredentialManager& credential_manager_;
    Clock& clock_;
    OrchestratorConfig config_;
    Logger* logger_;

    StatusReader reader_;
    TransitionIssuer issuer_;
    ConvergenceWaiter waiter_;

    void validate_request(const OperationRequest& request) const;
    CapacitySnapshot begin(RunState& state, const OperationRequest& request);

    void run_scale(RunState& state, const OperationRequest& request);
    void run_start(RunState& state, const OperationRequest& request);
    void run_stop(RunState& state, const OperationRequest& request);

    CapacitySnapshot read_snapshot(RunState& state, const std::string& label);
    void record_snapshot(OperationResult& result, const CapacitySnapshot& snapshot) const;
    void refresh_after_failure(RunState& state);
};

} // namespace capscale

#endif // CAPSCALE_ORCHESTRATOR_HPP
