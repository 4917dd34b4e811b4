// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/segment.hpp>

namespace splitfetch::core {

std::string_view to_string(SegmentState state) noexcept {
    switch (state) {
        case SegmentState::pending:     return "pending";
        case SegmentState::in_progress: return "in-progress";
        case SegmentState::done:        return "done";
        case SegmentState::failed:      return "failed";
    }
    return "unknown";
}

//=============================================================================
// Segment
//=============================================================================

Segment::Segment(std::uint32_t index,
                 std::uint64_t first,
                 std::optional<std::uint64_t> last,
                 std::string part_path) noexcept
    : index_(index)
    , first_(first)
    , last_(last)
    , part_path_(std::move(part_path)) {}

std::optional<std::uint64_t> Segment::size() const noexcept {
    if (!last_) return std::nullopt;
    return *last_ - first_ + 1;
}

bool Segment::transition(SegmentState from, SegmentState to) noexcept {
    return state_.compare_exchange_strong(from, to, std::memory_order_acq_rel);
}

std::optional<std::uint64_t> Segment::remaining() const noexcept {
    auto total = size();
    if (!total) return std::nullopt;
    auto done = fetched();
    return done >= *total ? 0 : *total - done;
}

ByteRange Segment::next_range() const noexcept {
    return ByteRange{first_ + fetched(), last_};
}

SegmentSnapshot Segment::snapshot() const noexcept {
    return SegmentSnapshot{index_, state(), fetched(), size()};
}

} // namespace splitfetch::core
