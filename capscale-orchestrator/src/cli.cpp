#include "cli.hpp"
#include <iostream>
#include <stdexcept>

namespace capscale {

namespace {

bool parse_bool(const std::string& value, bool& out) {
    if (value == "true" || value == "1" || value == "yes") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        out = false;
        return true;
    }
    return false;
}

} // namespace

void print_usage(std::ostream& out, const char* program_name) {
    out << "CapScale v1.0.0\n\n";
    out << "Usage: " << program_name << " [options]\n\n";
    out << "Target options:\n";
    out << "  --resource-id <id>          Capacity resource identifier\n";
    out << "                              /subscriptions/{sub}/resourceGroups/{rg}/providers/{provider}/capacities/{name}\n";
    out << "  --operation <op>            scale, start or stop (default: scale)\n";
    out << "  --target-sku <sku>          F2, F4, F8, F16, F32, F64, F128, F256, F512, F1024\n";
    out << "                              (required for scale)\n\n";
    out << "Behaviour options:\n";
    out << "  --wait <true|false>         Wait for the operation to complete (default: true)\n";
    out << "  --no-wait                   Same as --wait false\n";
    out << "  --timeout <minutes>         Overall wait timeout in minutes (default: 10)\n\n";
    out << "Endpoint options:\n";
    out << "  --management-url <url>      Management endpoint (default: credential source or\n";
    out << "                              https://management.azure.com)\n";
    out << "  --api-version <version>     API version (default: " << kDefaultApiVersion << ")\n\n";
    out << "Logging options:\n";
    out << "  --log-level <level>         DEBUG, INFO, WARN, ERROR (default: INFO)\n";
    out << "  --log-format <json|text>    Log line format (default: json)\n";
    out << "  --log-file <path>           Also append log lines to a file\n";
    out << "  --debug-http                Trace HTTP requests on stderr (tokens redacted)\n\n";
    out << "Other options:\n";
    out << "  --config <path>             JSON run configuration; flags override its values\n";
    out << "  --help                      Show this help message\n\n";
    out << "Credentials are read from CAPSCALE_ACCESS_TOKEN / CAPSCALE_MANAGEMENT_URL\n";
    out << "or ~/.capscale/credentials.json.\n\n";
    out << "The run result is printed as JSON on stdout. Exit status: 0 success,\n";
    out << "1 operation failed, 2 invalid parameters.\n\n";
    out << "Example:\n";
    out << "  " << program_name << " --resource-id /subscriptions/0000/resourceGroups/rg-analytics/"
        << "providers/Microsoft.Fabric/capacities/analytics \\\n";
    out << "      --target-sku F64 --timeout 20\n";
}

bool parse_args(int argc, const char* const argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--resource-id" && i + 1 < argc) {
            args.resource_id = argv[++i];
        } else if (arg == "--operation" && i + 1 < argc) {
            args.operation = argv[++i];
        } else if (arg == "--target-sku" && i + 1 < argc) {
            args.target_sku = argv[++i];
        } else if (arg == "--wait" && i + 1 < argc) {
            bool wait = true;
            if (!parse_bool(argv[++i], wait)) {
                std::cerr << "Error: --wait expects true or false\n\n";
                return false;
            }
            args.wait_for_completion = wait;
        } else if (arg == "--no-wait") {
            args.wait_for_completion = false;
        } else if (arg == "--timeout" && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                size_t consumed = 0;
                int minutes = std::stoi(value, &consumed);
                if (consumed != value.size()) {
                    throw std::invalid_argument(value);
                }
                args.timeout_minutes = minutes;
            } catch (const std::exception&) {
                std::cerr << "Error: --timeout expects an integer number of minutes, got '"
                          << value << "'\n\n";
                return false;
            }
        } else if (arg == "--management-url" && i + 1 < argc) {
            args.management_url = argv[++i];
        } else if (arg == "--api-version" && i + 1 < argc) {
            args.api_version = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-format" && i + 1 < argc) {
            std::string format = argv[++i];
            if (format != "json" && format != "text") {
                std::cerr << "Error: --log-format expects json or text\n\n";
                return false;
            }
            args.log_json = (format == "json");
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--debug-http") {
            args.debug_http = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

RunConfig build_run_config(const CLIArgs& args) {
    RunConfig config;
    if (!args.config_path.empty()) {
        config = parse_run_config_from_file(args.config_path);
    }

    if (args.resource_id) config.resource_id = *args.resource_id;
    if (args.operation) config.operation = *args.operation;
    if (args.target_sku) config.target_sku = *args.target_sku;
    if (args.wait_for_completion) config.wait_for_completion = *args.wait_for_completion;
    if (args.timeout_minutes) config.timeout_minutes = *args.timeout_minutes;
    if (args.management_url) config.management_url = *args.management_url;
    if (args.api_version) config.api_version = *args.api_version;
    if (args.log_level) config.logging.level = *args.log_level;
    if (args.log_json) config.logging.json = *args.log_json;
    if (args.log_file) config.logging.file = *args.log_file;

    return config;
}

} // namespace capscale
