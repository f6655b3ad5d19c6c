#include <iostream>
#include <string>
#include "api/http_client.hpp"
#include "cli.hpp"
#include "clock.hpp"
#include "config_parser.hpp"
#include "credential_manager.hpp"
#include "logger.hpp"
#include "orchestrator.hpp"

using namespace capscale;

int main(int argc, char* argv[]) {
    CLIArgs args;
    if (!parse_args(argc, argv, args)) {
        print_usage(std::cerr, argv[0]);
        return 2;
    }
    if (args.help) {
        print_usage(std::cerr, argv[0]);
        return 0;
    }

    RunConfig config;
    OperationRequest request;
    OrchestratorConfig orchestrator_config;
    try {
        config = build_run_config(args);
        request = build_operation_request(config);
        orchestrator_config = build_orchestrator_config(config);
        Logger::get_instance().configure(build_logger_config(config));
    } catch (const ConfigParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    try {
        CredentialManager credential_manager;

        std::string base_url = config.management_url;
        if (base_url.empty()) {
            base_url = credential_manager.has_credentials()
                ? credential_manager.management_url()
                : std::string(kDefaultManagementUrl);
        }

        client::HttpClient http(base_url, config.http_timeout_ms);
        http.set_debug(args.debug_http);

        ManagementEndpoint endpoint;
        endpoint.api_version = config.api_version;

        SystemClock clock;
        Orchestrator orchestrator(http, credential_manager, clock, endpoint, orchestrator_config);

        OperationResult result = orchestrator.run(request);

        std::cout << result.to_json().dump(2) << std::endl;
        Logger::get_instance().flush();

        if (result.error) {
            std::cerr << "Error: " << error_kind_to_string(result.error_kind) << ": "
                      << result.message << "\n";
        }
        return result.exit_code();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
