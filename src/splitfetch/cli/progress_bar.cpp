// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace splitfetch::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

std::string format_speed(double bps) {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;
    constexpr double GB = 1024.0 * MB;

    if (bps >= GB) return fixed(bps / GB, 1) + " GB/s";
    if (bps >= MB) return fixed(bps / MB, 1) + " MB/s";
    if (bps >= KB) return fixed(bps / KB, 1) + " KB/s";
    return std::to_string(static_cast<std::uint64_t>(bps)) + " B/s";
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    const auto value = static_cast<double>(bytes);
    if (bytes >= TB) return fixed(value / TB, 2) + " TB";
    if (bytes >= GB) return fixed(value / GB, 2) + " GB";
    if (bytes >= MB) return fixed(value / MB, 1) + " MB";
    if (bytes >= KB) return fixed(value / KB, 0) + " KB";
    return std::to_string(bytes) + " B";
}

std::string format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m " << std::setw(2) << secs << "s";
        return ss.str();
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

//=============================================================================
// Spinner
//=============================================================================

void Spinner::update(const core::ProgressSnapshot& snap) {
    std::cout << "\r" << SPINNER_FRAMES[frame_ % 4] << " " << format_bytes(snap.bytes_done);
    if (snap.rate_bps > 0.0) {
        std::cout << " @ " << format_speed(snap.rate_bps);
    }
    std::cout << "          " << std::flush;
    ++frame_;
}

void Spinner::finish(const core::ProgressSnapshot& snap) {
    std::cout << "\r  " << format_bytes(snap.bytes_done) << " done" << std::string(20, ' ') << std::endl;
}

void Spinner::clear() {
    std::cout << "\r" << std::string(60, ' ') << "\r" << std::flush;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

std::string ProgressBar::render(const core::ProgressSnapshot& snap) const {
    double percent = snap.percent().value_or(0.0);

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }
    line += render_bar(percent);

    auto pct = static_cast<int>(percent);
    line += " ";
    if (pct < 10) line += " ";
    if (pct < 100) line += " ";
    line += std::to_string(pct) + "%";

    line += " (";
    line += format_bytes(snap.bytes_done);
    if (snap.total) {
        line += "/";
        line += format_bytes(*snap.total);
    }
    line += ")";

    if (snap.rate_bps > 0.0) {
        line += " @ ";
        line += format_speed(snap.rate_bps);
    }
    if (snap.eta) {
        line += " ETA: ";
        line += format_time(static_cast<std::uint64_t>(snap.eta->count()));
    }
    return line;
}

void ProgressBar::update(const core::ProgressSnapshot& snap) {
    if (finished_) return;
    // Clear rest of line
    std::cout << "\r" << render(snap) << std::string(10, ' ') << std::flush;
}

void ProgressBar::finish(const core::ProgressSnapshot& snap) {
    if (finished_) return;
    update(snap);
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() {
    std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) const {
    const int filled = std::clamp(static_cast<int>(std::round(width_ * percent / 100.0)), 0, width_);

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < width_) {
        bar += '>';
        bar.append(static_cast<std::size_t>(width_ - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

} // namespace splitfetch::cli
