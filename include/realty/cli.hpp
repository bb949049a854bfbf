/**
 * @file cli.hpp
 * @brief Command-line handling for the `realty` executable
 */

#pragma once

#include <iosfwd>
#include <optional>

#include "config.hpp"
#include "shell.hpp"

namespace realty {

struct CliOptions {
    EngineConfig config;            // --config, then --log-level applied on top
    OutputFormat format = OutputFormat::TABLE;
    bool show_help = false;
};

void print_usage(std::ostream& out, const char* argv0);

/**
 * Parse argv. Flags may repeat; the last --log-level wins over both the
 * environment and any log_level inside --config.
 *
 * @return std::nullopt after writing a diagnostic to `err` for an unknown
 *         flag, a flag missing its value, an unknown level or a bad config
 */
std::optional<CliOptions> parse_cli(int argc, const char* const* argv, std::ostream& err);

/**
 * Parse argv, configure logging, and run the shell on `in`/`out`.
 * @return process exit status: 0 on a normal exit or --help, 2 on a usage
 *         error, 1 if the engine could not be set up
 */
int run_cli(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace realty
