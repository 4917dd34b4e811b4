// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace splitfetch::core {

enum class TransferErrc {
    success = 0,
    // Configuration
    invalid_url,
    unsupported_scheme,
    invalid_worker_count,
    invalid_chunk_size,
    invalid_config,
    // Network / HTTP
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    connection_lost,
    too_many_redirects,
    not_found,
    permission_denied,
    server_error,
    unexpected_status,
    malformed_headers,
    // Ranges
    invalid_range,
    range_not_honored,
    size_mismatch,
    // Control
    cancelled,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "splitfetch::transfer";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:              return "Success";
            case TransferErrc::invalid_url:          return "Invalid URL";
            case TransferErrc::unsupported_scheme:   return "Unsupported URL scheme";
            case TransferErrc::invalid_worker_count: return "Worker count out of range";
            case TransferErrc::invalid_chunk_size:   return "Chunk size must be positive";
            case TransferErrc::invalid_config:       return "Invalid configuration";
            case TransferErrc::network_error:        return "Network error";
            case TransferErrc::timeout:              return "Operation timed out";
            case TransferErrc::refused:              return "Connection refused";
            case TransferErrc::dns_error:            return "DNS resolution failed";
            case TransferErrc::ssl_error:            return "SSL/TLS error";
            case TransferErrc::connection_lost:      return "Connection lost";
            case TransferErrc::too_many_redirects:   return "Too many redirects";
            case TransferErrc::not_found:            return "Resource not found (404)";
            case TransferErrc::permission_denied:    return "Access denied by server";
            case TransferErrc::server_error:         return "Server error (5xx)";
            case TransferErrc::unexpected_status:    return "Unexpected HTTP status";
            case TransferErrc::malformed_headers:    return "Malformed response headers";
            case TransferErrc::invalid_range:        return "Invalid byte range";
            case TransferErrc::range_not_honored:    return "Server did not honor the byte range";
            case TransferErrc::size_mismatch:        return "Size mismatch";
            case TransferErrc::cancelled:            return "Transfer cancelled";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TransferErrcCategory& transfer_errc_category() noexcept {
    static detail::TransferErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TransferErrc e) noexcept {
    return {static_cast<int>(e), transfer_errc_category()};
}

// Transient faults are retried by the segment fetcher and the prober
[[nodiscard]] bool is_transient(const std::error_code& ec) noexcept;

// Terminal classification reported by the coordinator
enum class ErrorKind : std::uint8_t {
    config,
    probe,
    segment,
    assembly,
    cancelled,
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

struct TransferError {
    ErrorKind kind{ErrorKind::config};
    std::error_code cause;
    std::string detail;

    // "<kind>: <cause message>[ (<detail>)]"
    [[nodiscard]] std::string message() const;
};

} // namespace splitfetch::core

namespace std {

template<>
struct is_error_code_enum<splitfetch::core::TransferErrc> : true_type {};

} // namespace std
