/**
 * @file main.cpp
 * @brief ai_pacs_server entrypoint
 *
 *   ai_pacs_server -c config.yaml                 run the pipeline
 *   ai_pacs_server -c config.yaml --check-config  validate and exit
 *   ai_pacs_server -c config.yaml -l debug        override logging.level
 */

#include "aipacs/config/config_loader.h"
#include "aipacs/integration/logger_adapter.h"
#include "aipacs/pipeline_server.h"

#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

constexpr std::string_view kVersion = "0.1.0";
constexpr std::string_view kProgram = "ai_pacs_server";

enum class run_mode { serve, check_config, help, version };

struct cli_options {
    run_mode mode = run_mode::serve;
    std::filesystem::path config_path;
    std::optional<aipacs::integration::log_level> level_override;
};

void print_usage(std::ostream& out) {
    out << std::format(
        "Usage: {} -c <config> [options]\n"
        "\n"
        "Receives studies over DICOM, runs AI analysis on each complete study\n"
        "and stores the generated report back into the archive.\n"
        "\n"
        "Options:\n"
        "  -c, --config <path>     Configuration file (.yaml, .yml or .json)\n"
        "  -l, --log-level <name>  Override logging.level (trace..critical)\n"
        "      --check-config      Validate the configuration and exit\n"
        "  -h, --help              Show this help message\n"
        "  -v, --version           Show version information\n"
        "\n"
        "SIGINT and SIGTERM stop the server after in-flight stages finish.\n",
        kProgram);
}

std::expected<cli_options, std::string> parse_args(int argc, char* argv[]) {
    cli_options opts;

    auto value_of = [&](int& i, std::string_view flag) -> std::expected<std::string, std::string> {
        if (i + 1 >= argc) {
            return std::unexpected(std::format("{} requires a value", flag));
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.mode = run_mode::help;
            return opts;
        }
        if (arg == "-v" || arg == "--version") {
            opts.mode = run_mode::version;
            return opts;
        }
        if (arg == "--check-config") {
            opts.mode = run_mode::check_config;
        } else if (arg == "-c" || arg == "--config") {
            auto value = value_of(i, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            opts.config_path = *value;
        } else if (arg == "-l" || arg == "--log-level") {
            auto value = value_of(i, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            opts.level_override = aipacs::integration::parse_log_level(*value);
            if (!opts.level_override) {
                return std::unexpected(std::format("unknown log level '{}'", *value));
            }
        } else {
            return std::unexpected(std::format("unknown argument '{}'", arg));
        }
    }

    if (opts.config_path.empty()) {
        return std::unexpected(std::string("a configuration file is required"));
    }
    return opts;
}

int check_config(const aipacs::config::pipeline_config& config) {
    auto errors = config.validate();
    if (errors.empty()) {
        std::cout << "configuration OK\n";
        return EXIT_SUCCESS;
    }
    for (const auto& error : errors) {
        std::cerr << std::format("{}: {}", error.field_path, error.message);
        if (error.actual_value) {
            std::cerr << std::format(" (got: {})", *error.actual_value);
        }
        std::cerr << "\n";
    }
    return EXIT_FAILURE;
}

int serve(const aipacs::config::pipeline_config& config) {
    aipacs::pipeline_server server(config);

    if (auto started = server.start(); !started) {
        std::cerr << std::format("failed to start: {} ({})\n",
                                 aipacs::to_string(started.error()),
                                 aipacs::to_error_code(started.error()));
        return EXIT_FAILURE;
    }

    std::cout << std::format("{} {} listening as {} on port {}\n", config.name, kVersion,
                             config.receiver.ae_title, config.receiver.port);

    server.wait_for_shutdown();
    server.stop();

    auto stats = server.get_statistics();
    std::cout << std::format(
        "instances={} studies_ready={} jobs_done={} jobs_failed={} uptime={}s\n",
        stats.instances_received, stats.studies_ready, stats.jobs_done, stats.jobs_failed,
        stats.uptime.count());
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        std::cerr << kProgram << ": " << opts.error() << "\n\n";
        print_usage(std::cerr);
        return EXIT_FAILURE;
    }

    switch (opts->mode) {
        case run_mode::help:
            print_usage(std::cout);
            return EXIT_SUCCESS;
        case run_mode::version:
            std::cout << kProgram << " " << kVersion << "\n";
            return EXIT_SUCCESS;
        default:
            break;
    }

    auto loaded = aipacs::config::config_loader::load(opts->config_path);
    if (!loaded) {
        std::cerr << loaded.error().to_string() << "\n";
        for (const auto& error : loaded.error().validation_errors) {
            std::cerr << std::format("  {}: {}\n", error.field_path, error.message);
        }
        return EXIT_FAILURE;
    }
    if (opts->level_override) {
        loaded->logging.level = *opts->level_override;
    }

    if (opts->mode == run_mode::check_config) {
        return check_config(*loaded);
    }

    try {
        return serve(*loaded);
    } catch (const std::exception& ex) {
        std::cerr << kProgram << ": " << ex.what() << "\n";
        return EXIT_FAILURE;
    }
}
