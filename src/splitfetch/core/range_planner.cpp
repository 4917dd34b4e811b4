// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/range_planner.hpp>
#include <algorithm>
#include <limits>

namespace splitfetch::core {

std::expected<RangePlan, std::error_code>
plan_ranges(std::uint64_t total, std::uint32_t workers, std::uint64_t chunk) noexcept {
    if (chunk == 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_chunk_size));
    }
    if (workers == 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_worker_count));
    }

    RangePlan plan;
    if (total == 0) {
        return plan;
    }

    // ceil(total / chunk) without overflowing near UINT64_MAX
    std::uint64_t count = total / chunk + (total % chunk != 0 ? 1 : 0);
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(make_error_code(TransferErrc::invalid_chunk_size));
    }

    try {
        plan.ranges.reserve(static_cast<std::size_t>(count));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(TransferErrc::invalid_chunk_size));
    }

    std::uint64_t offset = 0;
    for (std::uint32_t index = 0; index < count; ++index) {
        std::uint64_t this_size = std::min(chunk, total - offset);
        plan.ranges.push_back(PlannedRange{index, offset, offset + this_size - 1});
        offset += this_size;
    }

    // No idle workers
    plan.workers = static_cast<std::uint32_t>(std::min<std::uint64_t>(workers, count));
    return plan;
}

} // namespace splitfetch::core
