// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>

namespace splitfetch::core {

constexpr std::uint32_t DEFAULT_WORKERS = 10;
constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 1024 * 1024;           // 1 MiB
constexpr std::uint32_t MAX_WORKERS = 10'000;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::uint32_t PROBE_ATTEMPTS = 3;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::chrono::milliseconds RATE_WINDOW{3000};
constexpr std::chrono::milliseconds RATE_SAMPLE_INTERVAL{100};

constexpr std::size_t WRITE_BUFFER_SIZE = 256 * 1024;               // 256 KB

// Bounded retry with exponential backoff
struct RetryPolicy {
    std::uint32_t max_attempts{RETRY_COUNT};
    std::chrono::milliseconds base_delay{200};
    std::chrono::milliseconds max_delay{5000};
    double multiplier{2.0};

    // Delay before attempt number `attempt` (1-based; attempt 1 has no delay)
    [[nodiscard]] std::chrono::milliseconds delay(std::uint32_t attempt) const noexcept;

    // Sleep for delay(attempt); returns false if stop was requested meanwhile
    [[nodiscard]] bool wait_before(std::uint32_t attempt, std::stop_token stop) const;
};

// Per-request network options
struct HttpOptions {
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds stall_timeout{STALL_TIMEOUT_SEC};
    std::uint32_t max_redirects{MAX_REDIRECTS};
    bool verify_tls{true};
    std::string user_agent{"splitfetch/0.1"};
};

// Engine-wide limits and policies, injected into the coordinator
struct EngineConfig {
    std::uint32_t worker_limit{MAX_WORKERS};   // Requests above this are rejected
    std::uint32_t pool_limit{MAX_WORKERS};     // Worker pool never grows beyond this
    std::uint32_t probe_attempts{PROBE_ATTEMPTS};
    bool fail_fast{true};
    RetryPolicy retry;
    std::chrono::milliseconds rate_window{RATE_WINDOW};
    HttpOptions http;
};

// Parse a JSON configuration document; absent keys keep their defaults
[[nodiscard]] std::expected<EngineConfig, std::error_code>
parse_engine_config(std::string_view json) noexcept;

// Load a JSON configuration file
[[nodiscard]] std::expected<EngineConfig, std::error_code>
load_engine_config(const std::string& path) noexcept;

} // namespace splitfetch::core
