// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/curl_http_client.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <string_view>

namespace splitfetch::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// State shared with the libcurl callbacks of one request
struct TransferContext {
    CURL* curl{nullptr};
    const GetHandlers* handlers{nullptr};
    HttpResponse response;
    bool response_delivered{false};
    std::error_code callback_error;
    std::stop_token stop;
};

std::error_code deliver_response(TransferContext& ctx) {
    if (ctx.response_delivered) return {};
    ctx.response_delivered = true;

    long http_code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &http_code);
    ctx.response.status_code = static_cast<std::int32_t>(http_code);
    fill_response_fields(ctx.response);

    if (ctx.handlers && ctx.handlers->on_response) {
        return ctx.handlers->on_response(ctx.response);
    }
    return {};
}

// Header callback; a new status line (redirect hop) starts a fresh map
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        ctx->response.headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    // Trim whitespace and \r\n
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name(name);
    for (char& c : lower_name) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    try {
        ctx->response.headers[lower_name] = std::string(value);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::size_t total = size * nmemb;

    try {
        if (auto ec = deliver_response(*ctx)) {
            ctx->callback_error = ec;
            return 0;
        }

        if (ctx->handlers && ctx->handlers->on_body) {
            auto data = std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), total);
            if (auto ec = ctx->handlers->on_body(data)) {
                ctx->callback_error = ec;
                return 0;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("HTTP body handler threw: {}", e.what());
        ctx->callback_error = make_error_code(TransferErrc::network_error);
        return 0;
    }

    return total;
}

// Return 1 to abort the transfer
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return ctx->stop.stop_requested() ? 1 : 0;
}

std::error_code map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:
            return {};
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            return make_error_code(TransferErrc::invalid_url);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(TransferErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(TransferErrc::refused);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(TransferErrc::timeout);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(TransferErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(TransferErrc::too_many_redirects);
        case CURLE_PARTIAL_FILE:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return make_error_code(TransferErrc::connection_lost);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(TransferErrc::cancelled);
        default:
            return make_error_code(TransferErrc::network_error);
    }
}

void apply_common_options(CURL* curl, const HttpOptions& options, TransferContext& ctx) {
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Follow redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(options.max_redirects));

    // Timeouts: connect bound plus stall detection, no overall limit
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.stall_timeout.count()));

    // SSL options
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verify_tls ? 2L : 0L);

    if (!options.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);

    // Progress callback lets the stop token interrupt the transfer
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
}

std::expected<HttpResponse, std::error_code> finish(CURLcode result, TransferContext& ctx) {
    if (ctx.callback_error) {
        return std::unexpected(ctx.callback_error);
    }
    if (result != CURLE_OK) {
        spdlog::debug("curl error {}: {}", static_cast<int>(result), curl_easy_strerror(result));
        return std::unexpected(map_curl_error(result));
    }

    // Empty bodies never reach the write callback
    if (auto ec = deliver_response(ctx)) {
        return std::unexpected(ec);
    }
    return std::move(ctx.response);
}

} // namespace

//=============================================================================
// CurlHttpClient
//=============================================================================

CurlHttpClient::CurlHttpClient(HttpOptions options)
    : options_(std::move(options)) {}

std::expected<HttpResponse, std::error_code>
CurlHttpClient::head(const std::string& url, std::stop_token stop) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;
    ctx.stop = std::move(stop);

    try {
        curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        apply_common_options(curl.ptr, options_, ctx);

        spdlog::debug("HEAD {}", url);
        CURLcode result = curl_easy_perform(curl.ptr);
        return finish(result, ctx);
    } catch (const std::exception& e) {
        spdlog::error("HEAD {} failed: {}", url, e.what());
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }
}

std::expected<HttpResponse, std::error_code>
CurlHttpClient::get(const std::string& url,
                    const std::optional<ByteRange>& range,
                    const GetHandlers& handlers,
                    std::stop_token stop) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }

    TransferContext ctx;
    ctx.curl = curl.ptr;
    ctx.handlers = &handlers;
    ctx.stop = std::move(stop);

    try {
        curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());

        // Range header
        std::string range_value;
        if (range) {
            range_value = range->header_value();
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range_value.c_str());
        }

        apply_common_options(curl.ptr, options_, ctx);

        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(WRITE_BUFFER_SIZE));

        spdlog::debug("GET {} range={}", url, range ? range_value : std::string("none"));
        CURLcode result = curl_easy_perform(curl.ptr);
        return finish(result, ctx);
    } catch (const std::exception& e) {
        spdlog::error("GET {} failed: {}", url, e.what());
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlHttpClient::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlHttpClient::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace splitfetch::core
