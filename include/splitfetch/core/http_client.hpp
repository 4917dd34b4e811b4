// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <stop_token>
#include <string>

namespace splitfetch::core {

// Lowercase header name -> value
using HeaderMap = std::map<std::string, std::string>;

// HTTP response metadata
struct HttpResponse {
    std::int32_t status_code{0};
    HeaderMap headers;
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
    std::string content_type;
};

// Inclusive byte interval; an absent `last` means "to the end of the resource"
struct ByteRange {
    std::uint64_t first{0};
    std::optional<std::uint64_t> last;

    [[nodiscard]] std::string header_value() const;
};

// Callbacks for a streaming GET. on_response runs once, after the final
// response headers and before the first body byte. A non-empty error_code
// returned from either callback aborts the transfer and becomes the result.
struct GetHandlers {
    std::function<std::error_code(const HttpResponse&)> on_response;
    std::function<std::error_code(std::span<const std::byte>)> on_body;
};

// Network seam used by the prober and the fetchers
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Metadata-only request
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url, std::stop_token stop) noexcept = 0;

    // Streaming GET, optionally restricted to a byte range. HTTP error
    // statuses are not errors at this layer; on_response decides.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const std::string& url,
        const std::optional<ByteRange>& range,
        const GetHandlers& handlers,
        std::stop_token stop) noexcept = 0;
};

// Header helpers shared by client implementations
[[nodiscard]] std::optional<std::uint64_t> parse_content_length(const std::string& value) noexcept;

// First byte offset of a "bytes <first>-<last>/<total>" Content-Range value
[[nodiscard]] std::optional<std::uint64_t> parse_content_range_start(const std::string& value) noexcept;

// Fill content_length, accepts_ranges and content_type from headers
void fill_response_fields(HttpResponse& response);

} // namespace splitfetch::core
