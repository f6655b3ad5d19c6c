/**
 * @file cli.hpp
 * @brief Command-line argument handling for the capscale executable
 */

#ifndef CAPSCALE_CLI_HPP
#define CAPSCALE_CLI_HPP

#include "config_parser.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace capscale {

/**
 * @brief Parsed command line
 *
 * Every override is optional so that a value given on the command line can be
 * told apart from one left at its default; only set values replace what the
 * configuration file says.
 */
struct CLIArgs {
    std::string config_path;
    std::optional<std::string> resource_id;
    std::optional<std::string> operation;
    std::optional<std::string> target_sku;
    std::optional<bool> wait_for_completion;
    std::optional<int> timeout_minutes;
    std::optional<std::string> management_url;
    std::optional<std::string> api_version;
    std::optional<std::string> log_level;
    std::optional<bool> log_json;
    std::optional<std::string> log_file;
    bool debug_http = false;
    bool help = false;
};

void print_usage(std::ostream& out, const char* program_name);

/**
 * @brief Parse argv into CLIArgs
 *
 * Stops at --help. Unknown options, missing option values and malformed
 * values are reported on stderr.
 *
 * @return false if the command line is unusable
 */
bool parse_args(int argc, const char* const argv[], CLIArgs& args);

/**
 * @brief Load the configuration file (if any) and apply command-line overrides
 *
 * @throws ConfigParseError if the configuration file is unreadable or invalid
 */
RunConfig build_run_config(const CLIArgs& args);

} // namespace capscale

#endif // CAPSCALE_CLI_HPP
