// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace splitfetch::core {

namespace {

bool has_forbidden_chars(std::string_view s) noexcept {
    return std::any_of(s.begin(), s.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc < 0x20 || uc == 0x7f;
    });
}

bool is_valid_port(std::string_view port) noexcept {
    if (port.empty() || port.size() > 5) return false;
    if (!std::all_of(port.begin(), port.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return false;
    }
    unsigned long value = std::stoul(std::string(port));
    return value > 0 && value <= 65535;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    // Surrounding whitespace is common when URLs are pasted
    while (!url_str.empty() && std::isspace(static_cast<unsigned char>(url_str.front()))) {
        url_str.remove_prefix(1);
    }
    while (!url_str.empty() && std::isspace(static_cast<unsigned char>(url_str.back()))) {
        url_str.remove_suffix(1);
    }

    if (url_str.empty() || has_forbidden_chars(url_str)) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    // Parse scheme
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    // Convert scheme to lowercase and store
    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }
    if (url.scheme_ != "http" && url.scheme_ != "https") {
        return std::unexpected(make_error_code(TransferErrc::unsupported_scheme));
    }

    auto rest_start = scheme_end + 3; // Skip "://"

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }

    // host_end is at the first of: /, ?, #, or end
    auto host_end = std::min({path_start, query_start, fragment_start});
    // A '?' or '#' before the first '/' ends the authority; the path is then empty
    if (path_start > host_end) {
        path_start = url_str.length();
    }

    // Skip userinfo (user:pass@host)
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);

    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal [::1]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(TransferErrc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        auto after = authority.substr(bracket_end + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::unexpected(make_error_code(TransferErrc::invalid_url));
            }
            url.port_ = std::string(after.substr(1));
        }
    } else {
        auto colon_pos = authority.rfind(':');
        if (colon_pos != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon_pos));
            url.port_ = std::string(authority.substr(colon_pos + 1));
        } else {
            url.host_ = std::string(authority);
        }
    }

    if (url.host_.empty() || url.host_.find(' ') != std::string::npos) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }
    if (!url.port_.empty() && !is_valid_port(url.port_)) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    // Extract path (if present)
    if (path_start < url_str.length()) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    // Extract query (if present)
    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    // Extract fragment (if present)
    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    url.str_ = std::string(url_str);
    return url;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_.empty() ? "index.html" : path_;
    }
    auto filename = path_.substr(last_slash + 1);
    // For directory URLs (path ends with /), default to index.html
    if (filename.empty()) {
        return "index.html";
    }
    return filename;
}

} // namespace splitfetch::core
