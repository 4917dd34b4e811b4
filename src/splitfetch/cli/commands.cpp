// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/cli/commands.hpp>
#include <splitfetch/cli/progress_bar.hpp>
#include <splitfetch/core/curl_http_client.hpp>
#include <splitfetch/core/transfer_coordinator.hpp>
#include <splitfetch/core/url.hpp>
#include <splitfetch/version.hpp>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <thread>

namespace chrono = std::chrono;

namespace splitfetch::cli {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_interrupt(int) {
    g_interrupted = 1;
}

constexpr chrono::milliseconds RENDER_INTERVAL{200};

template<typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto take_value = [&](int& i, std::string_view option) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            args.error = std::string(option) + " requires a value";
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info_only = true;
        } else if (arg == "--keep-going") {
            args.keep_going = true;
        } else if (arg == "-o" || arg == "--output") {
            if (auto value = take_value(i, arg)) args.output_file = *value;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto value = take_value(i, arg)) args.output_dir = *value;
        } else if (arg == "--config") {
            if (auto value = take_value(i, arg)) args.config_path = *value;
        } else if (arg == "-t" || arg == "--threads") {
            if (auto value = take_value(i, arg)) {
                // Range is checked by the engine against its configured limit
                auto n = parse_number<std::uint32_t>(*value);
                if (!n) {
                    args.error = "invalid thread count: " + *value;
                } else {
                    args.workers = *n;
                }
            }
        } else if (arg == "-c" || arg == "--chunk") {
            if (auto value = take_value(i, arg)) {
                auto n = parse_number<std::uint64_t>(*value);
                if (!n) {
                    args.error = "invalid chunk size: " + *value;
                } else {
                    args.chunk_size = *n;
                }
            }
        } else if (arg.starts_with("-") && arg.size() > 1) {
            args.error = "unknown option: " + arg;
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            args.error = "only one URL may be given";
        }
    }

    if (args.error.empty() && !args.help && !args.version && args.url.empty()) {
        args.error = "no URL specified";
    }
    return args;
}

std::string resolve_destination(const CliArgs& args) {
    std::string name = args.output_file;
    if (args.output_dir.empty()) {
        return name;
    }

    if (name.empty()) {
        auto parsed = core::Url::parse(args.url);
        if (!parsed) {
            // Let the engine report the bad URL
            return {};
        }
        name = parsed->filename();
    }
    return (std::filesystem::path(args.output_dir) / name).string();
}

//=============================================================================
// Commands
//=============================================================================

int download(const CliArgs& args, const core::EngineConfig& config) {
    core::EngineConfig engine_config = config;
    if (args.keep_going) {
        engine_config.fail_fast = false;
    }

    core::CurlHttpClient client(engine_config.http);
    core::TransferCoordinator coordinator(engine_config, client);

    core::TransferRequest request;
    request.url = args.url;
    request.destination = resolve_destination(args);
    request.workers = args.workers;
    request.chunk_size = args.chunk_size;

    std::optional<std::expected<core::TransferResult, core::TransferError>> outcome;
    std::atomic<bool> finished{false};

    g_interrupted = 0;
    auto previous = std::signal(SIGINT, on_interrupt);

    std::jthread runner([&] {
        outcome = coordinator.run(request);
        finished.store(true, std::memory_order_release);
    });

    ProgressBar bar;
    Spinner spinner;
    bool drawn = false;
    while (!finished.load(std::memory_order_acquire)) {
        if (g_interrupted) {
            g_interrupted = 0;
            coordinator.cancel();
        }
        if (!args.quiet && coordinator.phase() == core::TransferPhase::fetching) {
            auto snap = coordinator.progress();
            if (snap.total) {
                bar.update(snap);
            } else {
                spinner.update(snap);
            }
            drawn = true;
        }
        std::this_thread::sleep_for(RENDER_INTERVAL);
    }
    runner.join();
    std::signal(SIGINT, previous);

    auto& result = *outcome;
    if (!result) {
        if (drawn) {
            std::cout << std::endl;
        }
        std::cerr << "Error: " << result.error().message() << std::endl;
        return EXIT_TRANSFER_FAILED;
    }

    if (!args.quiet) {
        auto snap = coordinator.progress();
        if (snap.total) {
            bar.finish(snap);
        } else {
            spinner.finish(snap);
        }
        std::cout << "Saved " << result->destination << " (" << format_bytes(result->bytes) << ", "
                  << to_string(result->plan) << ", " << result->segments << " segment(s), "
                  << result->workers << " worker(s))" << std::endl;
        std::cout << "Elapsed " << format_time(static_cast<std::uint64_t>(result->elapsed.count()))
                  << ", average " << format_speed(result->average_bps()) << std::endl;
    }
    return EXIT_OK;
}

int info(const CliArgs& args, const core::EngineConfig& config) {
    core::CurlHttpClient client(config.http);
    core::TransferCoordinator coordinator(config, client);

    auto result = coordinator.probe(args.url);
    if (!result) {
        std::cerr << "Error: " << result.error().message() << std::endl;
        return EXIT_TRANSFER_FAILED;
    }

    std::cout << "URL: " << args.url << std::endl;
    std::cout << "Status: " << result->status_code << std::endl;
    std::cout << "Content-Type: " << (result->content_type.empty() ? "unknown" : result->content_type) << std::endl;
    std::cout << "Size: "
              << (result->total_size ? std::to_string(*result->total_size) + " bytes" : std::string("unknown"))
              << std::endl;
    std::cout << "Range requests: " << (result->supports_range ? "yes" : "no") << std::endl;
    return EXIT_OK;
}

void print_help(std::string_view program_name) {
    std::cout << "splitfetch " << splitfetch::version.to_string() << " - segmented HTTP(S) downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Errors only, no progress bar\n";
    std::cout << "  -o, --output <FILE>     Save to specified file\n";
    std::cout << "  -d, --directory <DIR>   Save into specified directory\n";
    std::cout << "  -t, --threads <N>       Worker count, 1-10000 (default: 10)\n";
    std::cout << "  -c, --chunk <BYTES>     Segment size in bytes (default: 1048576)\n";
    std::cout << "      --keep-going        Let other segments finish after a failure\n";
    std::cout << "      --config <FILE>     Load engine settings from a JSON file\n";
    std::cout << "  -i, --info              Show file info without downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -o myfile.zip https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -t 16 -c 4194304 https://example.com/large.iso\n";
}

void print_version() {
    std::cout << "splitfetch " << splitfetch::version.to_string() << std::endl;
    std::cout << "Built " << splitfetch::BUILD_DATE << " with C++23, libcurl, spdlog, nlohmann_json\n";
}

} // namespace splitfetch::cli
