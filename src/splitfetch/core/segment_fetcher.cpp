// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/segment_fetcher.hpp>
#include <splitfetch/disk/error.hpp>
#include <splitfetch/disk/part_file.hpp>
#include <spdlog/spdlog.h>

namespace splitfetch::core {

namespace {

bool is_disk_error(const std::error_code& ec) noexcept {
    return ec.category() == disk::disk_errc_category();
}

} // namespace

std::error_code check_segment_response(const HttpResponse& response,
                                       const std::optional<ByteRange>& requested,
                                       std::optional<std::uint64_t> remaining) noexcept {
    const auto status = response.status_code;

    if (status >= 500) {
        return make_error_code(TransferErrc::server_error);
    }
    if (status == 416) {
        return make_error_code(TransferErrc::invalid_range);
    }
    if (status == 404) {
        return make_error_code(TransferErrc::not_found);
    }
    if (status == 401 || status == 403) {
        return make_error_code(TransferErrc::permission_denied);
    }

    if (!requested) {
        if (status < 200 || status >= 300 || status == 206) {
            return make_error_code(TransferErrc::unexpected_status);
        }
        // The resource changed size since it was probed
        if (remaining && response.content_length && *response.content_length != *remaining) {
            return make_error_code(TransferErrc::size_mismatch);
        }
        return {};
    }

    if (status == 200) {
        // A full body is acceptable only when it is exactly the requested range
        if (requested->first == 0 && remaining && response.content_length == remaining) {
            return {};
        }
        return make_error_code(TransferErrc::range_not_honored);
    }
    if (status != 206) {
        return make_error_code(TransferErrc::unexpected_status);
    }

    if (auto it = response.headers.find("content-range"); it != response.headers.end()) {
        auto start = parse_content_range_start(it->second);
        if (!start || *start != requested->first) {
            return make_error_code(TransferErrc::range_not_honored);
        }
    }
    return {};
}

//=============================================================================
// SegmentFetcher
//=============================================================================

SegmentFetcher::SegmentFetcher(HttpClient& client, RetryPolicy retry, ProgressAggregator& progress) noexcept
    : client_(client)
    , retry_(retry)
    , progress_(progress) {
    if (retry_.max_attempts == 0) {
        retry_.max_attempts = 1;
    }
}

std::error_code SegmentFetcher::fetch(Segment& segment,
                                      const std::string& url,
                                      FetchMode mode,
                                      std::stop_token stop) noexcept {
    if (!segment.transition(SegmentState::pending, SegmentState::in_progress)) {
        // Already owned by another fetcher or settled
        return std::make_error_code(std::errc::device_or_resource_busy);
    }

    std::error_code ec;
    for (std::uint32_t attempt_no = 1; attempt_no <= retry_.max_attempts; ++attempt_no) {
        if (!retry_.wait_before(attempt_no, stop)) {
            return finish(segment, make_error_code(TransferErrc::cancelled));
        }

        segment.record_attempt();
        spdlog::debug("Segment {} attempt {}/{} from offset {}", segment.index(), attempt_no,
                      retry_.max_attempts, segment.next_range().first);

        ec = attempt(segment, url, mode, stop);
        if (!ec) {
            return finish(segment, {});
        }
        if (stop.stop_requested()) {
            return finish(segment, make_error_code(TransferErrc::cancelled));
        }
        if (is_disk_error(ec) || !is_transient(ec)) {
            break;
        }
        if (attempt_no < retry_.max_attempts) {
            spdlog::warn("Segment {} attempt {}/{} failed: {}; retrying", segment.index(), attempt_no,
                         retry_.max_attempts, ec.message());
        }
    }

    return finish(segment, ec);
}

std::error_code SegmentFetcher::attempt(Segment& segment,
                                        const std::string& url,
                                        FetchMode mode,
                                        std::stop_token stop) noexcept {
    if (mode == FetchMode::stream) {
        // A plain GET cannot continue mid-body
        progress_.rollback(segment.reset_fetched());
    }

    auto remaining = segment.remaining();
    std::optional<ByteRange> requested;
    if (mode == FetchMode::ranged) {
        requested = segment.next_range();
    }

    disk::PartFile file;
    if (auto ec = file.open(segment.part_path(), segment.fetched())) {
        spdlog::error("Cannot open part file {}: {}", segment.part_path(), ec.message());
        return ec;
    }

    if (remaining && *remaining == 0 && mode == FetchMode::ranged) {
        return file.close();
    }

    std::uint64_t received = 0;
    bool checked = false;

    GetHandlers handlers;
    handlers.on_response = [&](const HttpResponse& response) {
        checked = true;
        return check_segment_response(response, requested, remaining);
    };
    handlers.on_body = [&](std::span<const std::byte> data) -> std::error_code {
        if (remaining && received + data.size() > *remaining) {
            return make_error_code(mode == FetchMode::ranged ? TransferErrc::range_not_honored
                                                             : TransferErrc::size_mismatch);
        }
        if (auto ec = file.write(data)) {
            return ec;
        }
        received += data.size();
        segment.add_fetched(data.size());
        progress_.add(data.size());
        return {};
    };

    auto result = client_.get(url, requested, handlers, stop);
    auto close_ec = file.close();

    if (!result) {
        return result.error();
    }
    if (close_ec) {
        return close_ec;
    }
    if (!checked) {
        if (auto ec = check_segment_response(*result, requested, remaining)) {
            return ec;
        }
    }
    if (remaining && received < *remaining) {
        spdlog::debug("Segment {} body ended after {} of {} bytes", segment.index(), received, *remaining);
        return make_error_code(TransferErrc::connection_lost);
    }
    return {};
}

std::error_code SegmentFetcher::finish(Segment& segment, std::error_code ec) noexcept {
    segment.error(ec);
    if (!ec) {
        (void)segment.transition(SegmentState::in_progress, SegmentState::done);
        spdlog::debug("Segment {} done ({} bytes)", segment.index(), segment.fetched());
        return ec;
    }

    (void)segment.transition(SegmentState::in_progress, SegmentState::failed);
    if (ec == TransferErrc::cancelled) {
        spdlog::debug("Segment {} cancelled", segment.index());
    } else {
        spdlog::error("Segment {} failed after {} attempt(s): {}", segment.index(), segment.attempts(),
                      ec.message());
    }
    return ec;
}

} // namespace splitfetch::core
