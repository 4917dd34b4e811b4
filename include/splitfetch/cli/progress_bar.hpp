// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/progress.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace splitfetch::cli {

// Single-line progress display for a known total
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    void update(const core::ProgressSnapshot& snap);

    // Draw the final state and end the line
    void finish(const core::ProgressSnapshot& snap);

    // Clear the progress bar line
    void clear();

    [[nodiscard]] std::string render(const core::ProgressSnapshot& snap) const;

private:
    [[nodiscard]] std::string render_bar(double percent) const;

    std::string label_;
    bool finished_{false};
    int width_{30};
};

// Spinner with a byte count for unknown totals
class Spinner {
public:
    Spinner() = default;

    void update(const core::ProgressSnapshot& snap);
    void finish(const core::ProgressSnapshot& snap);
    void clear();

private:
    std::size_t frame_{0};
};

[[nodiscard]] std::string format_speed(double bps);
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

} // namespace splitfetch::cli
