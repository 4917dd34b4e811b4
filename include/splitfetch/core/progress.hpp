// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/config.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace splitfetch::core {

// Overall progress as seen by a display layer
struct ProgressSnapshot {
    std::uint64_t bytes_done{0};
    std::optional<std::uint64_t> total;
    std::chrono::duration<double> elapsed{0.0};
    double rate_bps{0.0};                       // Trailing window
    double average_bps{0.0};                    // Since start
    std::optional<std::chrono::seconds> eta;    // Unknown without total or rate

    [[nodiscard]] std::optional<double> percent() const noexcept;
};

// Aggregates byte counts from every fetcher. add() is lock-free on the
// counter; rate samples are taken under a mutex at most every
// RATE_SAMPLE_INTERVAL.
class ProgressAggregator {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressAggregator(std::chrono::milliseconds window = RATE_WINDOW) noexcept;

    // Start a new transfer
    void reset(std::optional<std::uint64_t> total, Clock::time_point start = Clock::now());

    void total(std::optional<std::uint64_t> total);

    void add(std::uint64_t bytes) noexcept { add(bytes, Clock::now()); }
    void add(std::uint64_t bytes, Clock::time_point now) noexcept;

    // Take back bytes that were discarded (restart of an unresumable stream)
    void rollback(std::uint64_t bytes) noexcept;

    [[nodiscard]] std::uint64_t bytes_done() const noexcept { return bytes_.load(std::memory_order_relaxed); }

    [[nodiscard]] ProgressSnapshot snapshot() const { return snapshot(Clock::now()); }
    [[nodiscard]] ProgressSnapshot snapshot(Clock::time_point now) const;

private:
    struct Sample {
        Clock::time_point time;
        std::uint64_t bytes;
    };

    // Requires mutex_
    void record_sample(Clock::time_point now) const;

    std::chrono::milliseconds window_;
    std::atomic<std::uint64_t> bytes_{0};

    mutable std::mutex mutex_;
    mutable std::deque<Sample> samples_;
    std::optional<std::uint64_t> total_;
    Clock::time_point start_{Clock::now()};
};

} // namespace splitfetch::core
