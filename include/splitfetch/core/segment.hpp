// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/http_client.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace splitfetch::core {

// Segment state machine
enum class SegmentState : std::uint8_t {
    pending,      // Queued, not started
    in_progress,  // Owned by a fetcher
    done,         // All bytes persisted to the part file
    failed        // Retries exhausted or non-retriable error
};

[[nodiscard]] std::string_view to_string(SegmentState state) noexcept;

// Point-in-time view for display
struct SegmentSnapshot {
    std::uint32_t index{0};
    SegmentState state{SegmentState::pending};
    std::uint64_t fetched{0};
    std::optional<std::uint64_t> size;
};

// A contiguous byte range of the resource and its part file
class Segment {
public:
    // `last` is inclusive; nullopt for a stream of unknown length
    Segment(std::uint32_t index,
            std::uint64_t first,
            std::optional<std::uint64_t> last,
            std::string part_path) noexcept;

    // Non-copyable, non-movable (atomic members)
    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    [[nodiscard]] std::uint32_t index() const noexcept { return index_; }
    [[nodiscard]] std::uint64_t first() const noexcept { return first_; }
    [[nodiscard]] std::optional<std::uint64_t> last() const noexcept { return last_; }
    [[nodiscard]] bool bounded() const noexcept { return last_.has_value(); }
    [[nodiscard]] std::optional<std::uint64_t> size() const noexcept;
    [[nodiscard]] const std::string& part_path() const noexcept { return part_path_; }

    [[nodiscard]] SegmentState state() const noexcept { return state_.load(std::memory_order_acquire); }

    // Compare-and-set; returns false if the segment was not in `from`
    [[nodiscard]] bool transition(SegmentState from, SegmentState to) noexcept;

    [[nodiscard]] std::uint64_t fetched() const noexcept { return fetched_.load(std::memory_order_relaxed); }
    void add_fetched(std::uint64_t bytes) noexcept { fetched_.fetch_add(bytes, std::memory_order_relaxed); }

    // Forget persisted progress; returns the discarded byte count
    std::uint64_t reset_fetched() noexcept { return fetched_.exchange(0, std::memory_order_relaxed); }

    // Bytes still missing; nullopt when unbounded
    [[nodiscard]] std::optional<std::uint64_t> remaining() const noexcept;

    // Range for the next request, starting after the persisted bytes
    [[nodiscard]] ByteRange next_range() const noexcept;

    [[nodiscard]] std::uint32_t attempts() const noexcept { return attempts_.load(std::memory_order_relaxed); }
    void record_attempt() noexcept { attempts_.fetch_add(1, std::memory_order_relaxed); }

    // Last error; written by the owning fetcher before it publishes `failed`
    [[nodiscard]] const std::error_code& error() const noexcept { return error_; }
    void error(std::error_code ec) noexcept { error_ = ec; }

    [[nodiscard]] SegmentSnapshot snapshot() const noexcept;

private:
    std::uint32_t index_;
    std::uint64_t first_;
    std::optional<std::uint64_t> last_;
    std::string part_path_;

    std::atomic<SegmentState> state_{SegmentState::pending};
    std::atomic<std::uint64_t> fetched_{0};
    std::atomic<std::uint32_t> attempts_{0};
    std::error_code error_;
};

} // namespace splitfetch::core
