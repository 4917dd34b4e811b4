// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/config.hpp>
#include <splitfetch/core/http_client.hpp>

namespace splitfetch::core {

// libcurl-backed HttpClient. One easy handle per request, so a single
// instance is safe to share between worker threads.
class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(HttpOptions options = {});

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url, std::stop_token stop) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        const std::optional<ByteRange>& range,
        const GetHandlers& handlers,
        std::stop_token stop) noexcept override;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpOptions options_;
};

} // namespace splitfetch::core
