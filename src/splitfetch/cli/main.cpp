// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/cli/commands.hpp>
#include <splitfetch/core/config.hpp>
#include <splitfetch/core/curl_http_client.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <iostream>

using namespace splitfetch::cli;

namespace {

void setup_logging(const CliArgs& args) {
    // Progress goes to stdout; keep log lines on stderr
    auto logger = spdlog::stderr_color_mt("splitfetch");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }
    if (args.version) {
        print_version();
        return EXIT_OK;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_USAGE;
    }

    setup_logging(args);

    splitfetch::core::EngineConfig config;
    if (!args.config_path.empty()) {
        auto loaded = splitfetch::core::load_engine_config(args.config_path);
        if (!loaded) {
            std::cerr << "Error: cannot load " << args.config_path << ": " << loaded.error().message() << std::endl;
            return EXIT_USAGE;
        }
        config = *loaded;
    }

    splitfetch::core::CurlHttpClient::global_init();
    int code = args.info_only ? info(args, config) : download(args, config);
    splitfetch::core::CurlHttpClient::global_cleanup();

    spdlog::shutdown();
    return code;
}
