// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/progress.hpp>
#include <algorithm>
#include <cmath>

namespace splitfetch::core {

std::optional<double> ProgressSnapshot::percent() const noexcept {
    if (!total) return std::nullopt;
    if (*total == 0) return 100.0;
    double pct = static_cast<double>(bytes_done) * 100.0 / static_cast<double>(*total);
    return std::clamp(pct, 0.0, 100.0);
}

//=============================================================================
// ProgressAggregator
//=============================================================================

ProgressAggregator::ProgressAggregator(std::chrono::milliseconds window) noexcept
    : window_(window.count() > 0 ? window : RATE_WINDOW) {}

void ProgressAggregator::reset(std::optional<std::uint64_t> total, Clock::time_point start) {
    std::lock_guard<std::mutex> lock(mutex_);
    bytes_.store(0, std::memory_order_relaxed);
    total_ = total;
    start_ = start;
    samples_.clear();
    samples_.push_back(Sample{start, 0});
}

void ProgressAggregator::total(std::optional<std::uint64_t> total) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_ = total;
}

void ProgressAggregator::add(std::uint64_t bytes, Clock::time_point now) noexcept {
    bytes_.fetch_add(bytes, std::memory_order_relaxed);

    // Skip sampling when another thread holds the lock; snapshot() samples too
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (lock.owns_lock()) {
        record_sample(now);
    }
}

void ProgressAggregator::rollback(std::uint64_t bytes) noexcept {
    auto current = bytes_.load(std::memory_order_relaxed);
    while (!bytes_.compare_exchange_weak(current, current >= bytes ? current - bytes : 0,
                                         std::memory_order_relaxed)) {
    }
}

void ProgressAggregator::record_sample(Clock::time_point now) const {
    if (!samples_.empty() && now - samples_.back().time < RATE_SAMPLE_INTERVAL) {
        return;
    }
    samples_.push_back(Sample{now, bytes_.load(std::memory_order_relaxed)});

    // Keep exactly one sample at or before the window start as the baseline
    const auto window_start = now - window_;
    while (samples_.size() >= 2 && samples_[1].time <= window_start) {
        samples_.pop_front();
    }
}

ProgressSnapshot ProgressAggregator::snapshot(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    record_sample(now);

    ProgressSnapshot snap;
    snap.bytes_done = bytes_.load(std::memory_order_relaxed);
    snap.total = total_;
    snap.elapsed = std::chrono::duration<double>(now - start_);

    if (snap.elapsed.count() > 0.0) {
        snap.average_bps = static_cast<double>(snap.bytes_done) / snap.elapsed.count();
    }

    if (!samples_.empty()) {
        const auto& baseline = samples_.front();
        double span = std::chrono::duration<double>(now - baseline.time).count();
        double delta = static_cast<double>(snap.bytes_done) - static_cast<double>(baseline.bytes);
        if (span > 0.0 && delta > 0.0) {
            snap.rate_bps = delta / span;
        }
    }

    if (snap.total && snap.rate_bps > 0.0) {
        std::uint64_t left = *snap.total > snap.bytes_done ? *snap.total - snap.bytes_done : 0;
        snap.eta = std::chrono::seconds{
            static_cast<std::chrono::seconds::rep>(std::ceil(static_cast<double>(left) / snap.rate_bps))};
    }

    return snap;
}

} // namespace splitfetch::core
