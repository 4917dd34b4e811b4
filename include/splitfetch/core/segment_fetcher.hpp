// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/config.hpp>
#include <splitfetch/core/http_client.hpp>
#include <splitfetch/core/progress.hpp>
#include <splitfetch/core/segment.hpp>
#include <cstdint>
#include <stop_token>
#include <string>
#include <system_error>

namespace splitfetch::core {

// How a segment is requested from the server
enum class FetchMode : std::uint8_t {
    ranged,   // Range request; resumes inside the segment after a fault
    stream    // Whole body, no Range header; restarts from byte 0
};

// Retrieves one segment into its part file with bounded retry
class SegmentFetcher {
public:
    SegmentFetcher(HttpClient& client, RetryPolicy retry, ProgressAggregator& progress) noexcept;

    // Drive `segment` from pending to done or failed. Returns the terminal
    // error (empty on success); the same code is stored on the segment.
    [[nodiscard]] std::error_code fetch(Segment& segment,
                                        const std::string& url,
                                        FetchMode mode,
                                        std::stop_token stop) noexcept;

private:
    // One request; bytes persisted so far stay counted on the segment
    [[nodiscard]] std::error_code attempt(Segment& segment,
                                          const std::string& url,
                                          FetchMode mode,
                                          std::stop_token stop) noexcept;

    [[nodiscard]] std::error_code finish(Segment& segment, std::error_code ec) noexcept;

    HttpClient& client_;
    RetryPolicy retry_;
    ProgressAggregator& progress_;
};

// Check a response against what was requested (exposed for tests)
[[nodiscard]] std::error_code check_segment_response(const HttpResponse& response,
                                                     const std::optional<ByteRange>& requested,
                                                     std::optional<std::uint64_t> remaining) noexcept;

} // namespace splitfetch::core
