// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/segment.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace splitfetch::core {

// Hands out pending segments to workers, lowest index first
class SegmentQueue {
public:
    explicit SegmentQueue(const std::vector<std::unique_ptr<Segment>>& segments);

    // Next pending segment, or nullptr when none are left
    [[nodiscard]] Segment* next() noexcept;

private:
    std::vector<Segment*> order_;
    std::size_t cursor_{0};
    std::mutex mutex_;
};

} // namespace splitfetch::core
