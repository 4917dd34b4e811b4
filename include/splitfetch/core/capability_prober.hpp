// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/config.hpp>
#include <splitfetch/core/http_client.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>

namespace splitfetch::core {

// What the server told us about the resource
struct ResourceInfo {
    std::optional<std::uint64_t> total_size;
    bool supports_range{false};
    std::int32_t status_code{0};
    std::string content_type;
};

class CapabilityProber {
public:
    CapabilityProber(HttpClient& client,
                     std::uint32_t attempts = PROBE_ATTEMPTS,
                     RetryPolicy backoff = {}) noexcept;

    // HEAD the URL. Transient faults are retried up to `attempts` times;
    // everything else is returned immediately.
    [[nodiscard]] std::expected<ResourceInfo, std::error_code>
    probe(const std::string& url, std::stop_token stop = {}) noexcept;

    // Classify a HEAD response (exposed for tests)
    [[nodiscard]] static std::expected<ResourceInfo, std::error_code>
    interpret(const HttpResponse& response) noexcept;

private:
    HttpClient& client_;
    std::uint32_t attempts_;
    RetryPolicy backoff_;
};

} // namespace splitfetch::core
