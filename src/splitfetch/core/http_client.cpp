// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/http_client.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace splitfetch::core {

namespace {

std::string lowercase(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
    if (s.empty()) return std::nullopt;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::string ByteRange::header_value() const {
    std::string range = std::to_string(first) + "-";
    if (last) {
        range += std::to_string(*last);
    }
    return range;
}

std::optional<std::uint64_t> parse_content_length(const std::string& value) noexcept {
    return parse_u64(value);
}

std::optional<std::uint64_t> parse_content_range_start(const std::string& value) noexcept {
    // "bytes 100-199/1000" or "bytes 100-199/*"
    std::string_view v(value);
    constexpr std::string_view prefix = "bytes ";
    if (v.size() < prefix.size()) return std::nullopt;

    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(v[i])) != prefix[i]) {
            return std::nullopt;
        }
    }
    v.remove_prefix(prefix.size());

    auto dash = v.find('-');
    if (dash == std::string_view::npos) return std::nullopt;
    return parse_u64(v.substr(0, dash));
}

void fill_response_fields(HttpResponse& response) {
    auto cl_it = response.headers.find("content-length");
    if (cl_it != response.headers.end()) {
        response.content_length = parse_content_length(cl_it->second);
    }

    auto ct_it = response.headers.find("content-type");
    if (ct_it != response.headers.end()) {
        response.content_type = ct_it->second;
    }

    auto ar_it = response.headers.find("accept-ranges");
    response.accepts_ranges = ar_it != response.headers.end()
        && lowercase(ar_it->second).find("bytes") != std::string::npos;
}

} // namespace splitfetch::core
