// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/segment_queue.hpp>
#include <algorithm>

namespace splitfetch::core {

SegmentQueue::SegmentQueue(const std::vector<std::unique_ptr<Segment>>& segments) {
    order_.reserve(segments.size());
    for (const auto& seg : segments) {
        order_.push_back(seg.get());
    }
    std::sort(order_.begin(), order_.end(),
              [](const Segment* a, const Segment* b) { return a->index() < b->index(); });
}

Segment* SegmentQueue::next() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    while (cursor_ < order_.size()) {
        Segment* seg = order_[cursor_++];
        if (seg->state() == SegmentState::pending) {
            return seg;
        }
    }
    return nullptr;
}

} // namespace splitfetch::core
