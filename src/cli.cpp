/**
 * @file cli.cpp
 * @brief Implementation of the `realty` command line
 */

#include "cli.hpp"
#include "catalog_engine.hpp"
#include "logging.hpp"

#include <cstring>
#include <exception>
#include <iostream>

namespace realty {

namespace {

constexpr int USAGE_ERROR_STATUS = 2;

} // namespace

void print_usage(std::ostream& out, const char* argv0) {
    out << "Usage: " << (argv0 ? argv0 : "realty") << " [options]\n"
        << "  --log-level <level>  DEBUG, INFO, WARN, ERROR or OFF\n"
        << "  --config <json>      Engine config, e.g. '{\"reserve\": 1024}'\n"
        << "  --json               Print results as JSON instead of tables\n"
        << "  --help               Show this message\n";
}

std::optional<CliOptions> parse_cli(int argc, const char* const* argv, std::ostream& err) {
    const char* argv0 = argc > 0 ? argv[0] : nullptr;
    CliOptions options;
    std::optional<LogLevel> level_override;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0) {
            options.show_help = true;
            continue;
        }
        if (std::strcmp(arg, "--json") == 0) {
            options.format = OutputFormat::JSON;
            continue;
        }
        if (std::strcmp(arg, "--log-level") == 0 || std::strcmp(arg, "--config") == 0) {
            if (i + 1 >= argc) {
                err << "Missing value for " << arg << '\n';
                print_usage(err, argv0);
                return std::nullopt;
            }
            const char* value = argv[++i];

            if (std::strcmp(arg, "--log-level") == 0) {
                level_override = parse_log_level(value);
                if (!level_override) {
                    err << "Unknown log level: " << value << '\n';
                    return std::nullopt;
                }
                continue;
            }

            try {
                options.config = EngineConfig::parse(value);
            } catch (const std::exception& e) {
                err << e.what() << '\n';
                return std::nullopt;
            }
            continue;
        }

        err << "Unknown argument: " << arg << '\n';
        print_usage(err, argv0);
        return std::nullopt;
    }

    if (level_override) {
        options.config.log_level = *level_override;
    }
    return options;
}

int run_cli(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err) {
    auto options = parse_cli(argc, argv, err);
    if (!options) {
        return USAGE_ERROR_STATUS;
    }
    if (options->show_help) {
        print_usage(out, argc > 0 ? argv[0] : nullptr);
        return 0;
    }

    options->config.apply_logging();

    try {
        CatalogEngine engine(options->config);
        REALTY_LOG_INFO("Main", "Catalog ready: ", options->config.to_json().dump());

        Shell shell(engine, in, out, options->format);
        shell.run();
    } catch (const std::exception& e) {
        REALTY_LOG_ERROR("Main", "Catalog failed: ", e.what());
        err << e.what() << '\n';
        return 1;
    }
    return 0;
}

} // namespace realty
