// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/error.hpp>

namespace splitfetch::core {

bool is_transient(const std::error_code& ec) noexcept {
    if (ec.category() != transfer_errc_category()) {
        return false;
    }

    switch (static_cast<TransferErrc>(ec.value())) {
        case TransferErrc::network_error:
        case TransferErrc::timeout:
        case TransferErrc::refused:
        case TransferErrc::connection_lost:
        case TransferErrc::server_error:
            return true;
        default:
            return false;
    }
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::config:    return "ConfigError";
        case ErrorKind::probe:     return "ProbeError";
        case ErrorKind::segment:   return "SegmentError";
        case ErrorKind::assembly:  return "AssemblyError";
        case ErrorKind::cancelled: return "Cancelled";
    }
    return "UnknownError";
}

std::string TransferError::message() const {
    std::string result(to_string(kind));
    result += ": ";
    result += cause ? cause.message() : std::string("no cause recorded");
    if (!detail.empty()) {
        result += " (";
        result += detail;
        result += ")";
    }
    return result;
}

} // namespace splitfetch::core
