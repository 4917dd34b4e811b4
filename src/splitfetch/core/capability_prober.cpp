// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/capability_prober.hpp>
#include <spdlog/spdlog.h>

namespace splitfetch::core {

CapabilityProber::CapabilityProber(HttpClient& client,
                                   std::uint32_t attempts,
                                   RetryPolicy backoff) noexcept
    : client_(client)
    , attempts_(attempts == 0 ? 1 : attempts)
    , backoff_(backoff) {}

std::expected<ResourceInfo, std::error_code>
CapabilityProber::interpret(const HttpResponse& response) noexcept {
    const auto status = response.status_code;

    // Servers that refuse HEAD can still be streamed with a plain GET
    if (status == 405 || status == 501) {
        return ResourceInfo{std::nullopt, false, status, response.content_type};
    }

    if (status == 404) {
        return std::unexpected(make_error_code(TransferErrc::not_found));
    }
    if (status == 401 || status == 403) {
        return std::unexpected(make_error_code(TransferErrc::permission_denied));
    }
    if (status >= 500) {
        return std::unexpected(make_error_code(TransferErrc::server_error));
    }
    if (status < 200 || status >= 300) {
        return std::unexpected(make_error_code(TransferErrc::unexpected_status));
    }

    ResourceInfo info;
    info.status_code = status;
    info.content_type = response.content_type;

    if (response.headers.contains("content-length")) {
        if (!response.content_length) {
            return std::unexpected(make_error_code(TransferErrc::malformed_headers));
        }
        info.total_size = response.content_length;
    }

    // Ranged mode needs both a size and an explicit "Accept-Ranges: bytes"
    info.supports_range = info.total_size.has_value() && response.accepts_ranges;
    return info;
}

std::expected<ResourceInfo, std::error_code>
CapabilityProber::probe(const std::string& url, std::stop_token stop) noexcept {
    std::error_code last_error;

    for (std::uint32_t attempt = 1; attempt <= attempts_; ++attempt) {
        if (!backoff_.wait_before(attempt, stop)) {
            return std::unexpected(make_error_code(TransferErrc::cancelled));
        }

        auto response = client_.head(url, stop);
        if (response) {
            auto info = interpret(*response);
            if (info) {
                spdlog::info("Probe {}: size={} ranges={}", url,
                             info->total_size ? std::to_string(*info->total_size) : std::string("unknown"),
                             info->supports_range ? "yes" : "no");
                return info;
            }
            last_error = info.error();
        } else {
            last_error = response.error();
        }

        if (!is_transient(last_error)) {
            break;
        }
        if (attempt < attempts_) {
            spdlog::warn("Probe attempt {}/{} for {} failed: {}", attempt, attempts_, url,
                         last_error.message());
        }
    }

    spdlog::error("Probe of {} failed: {}", url, last_error.message());
    return std::unexpected(last_error);
}

} // namespace splitfetch::core
