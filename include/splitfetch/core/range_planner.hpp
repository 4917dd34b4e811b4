// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/error.hpp>
#include <cstdint>
#include <expected>
#include <vector>

namespace splitfetch::core {

// Inclusive byte interval assigned to one segment
struct PlannedRange {
    std::uint32_t index{0};
    std::uint64_t first{0};
    std::uint64_t last{0};

    [[nodiscard]] std::uint64_t size() const noexcept { return last - first + 1; }
};

struct RangePlan {
    std::vector<PlannedRange> ranges;  // Index order equals byte order
    std::uint32_t workers{0};          // min(requested workers, ranges.size())
};

// Split [0, total) into ceil(total / chunk) contiguous ranges of `chunk`
// bytes, the last one holding the remainder. total == 0 yields no ranges.
[[nodiscard]] std::expected<RangePlan, std::error_code>
plan_ranges(std::uint64_t total, std::uint32_t workers, std::uint64_t chunk) noexcept;

} // namespace splitfetch::core
