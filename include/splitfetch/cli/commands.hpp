// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/config.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace splitfetch::cli {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_TRANSFER_FAILED = 1;
constexpr int EXIT_USAGE = 2;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string output_dir;
    std::string output_file;
    std::string config_path;
    std::uint32_t workers{core::DEFAULT_WORKERS};
    std::uint64_t chunk_size{core::DEFAULT_CHUNK_SIZE};
    bool keep_going{false};
    bool info_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;          // Non-empty on a usage error
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Join the output directory with the explicit or derived filename
[[nodiscard]] std::string resolve_destination(const CliArgs& args);

// Fetch args.url; returns a process exit code
[[nodiscard]] int download(const CliArgs& args, const core::EngineConfig& config);

// Probe args.url and print what the server reports
[[nodiscard]] int info(const CliArgs& args, const core::EngineConfig& config);

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace splitfetch::cli
