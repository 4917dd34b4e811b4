// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/capability_prober.hpp>
#include <splitfetch/core/config.hpp>
#include <splitfetch/core/error.hpp>
#include <splitfetch/core/http_client.hpp>
#include <splitfetch/core/progress.hpp>
#include <splitfetch/core/segment.hpp>
#include <splitfetch/core/segment_fetcher.hpp>
#include <splitfetch/core/segment_queue.hpp>
#include <splitfetch/core/transfer_plan.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace splitfetch::core {

// What to fetch and where to put it
struct TransferRequest {
    std::string url;
    std::string destination;                    // Empty: derived from the URL
    std::uint32_t workers{DEFAULT_WORKERS};
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
};

// Coordinator state machine
enum class TransferPhase : std::uint8_t {
    idle,        // run() not called yet
    probing,     // HEAD in flight
    planning,    // Splitting into ranges
    fetching,    // Workers running
    assembling,  // Concatenating part files
    complete,    // Destination written and verified
    aborted      // Terminal failure or cancellation
};

[[nodiscard]] std::string_view to_string(TransferPhase phase) noexcept;

// Summary of a finished transfer
struct TransferResult {
    std::string destination;
    std::uint64_t bytes{0};
    PlanKind plan{PlanKind::multi_segment};
    std::uint32_t segments{0};
    std::uint32_t workers{0};
    std::chrono::duration<double> elapsed{0.0};

    [[nodiscard]] double average_bps() const noexcept;
};

using PhaseListener = std::function<void(TransferPhase)>;

// Runs one transfer at a time: probe, plan, fetch, assemble
class TransferCoordinator {
public:
    TransferCoordinator(EngineConfig config, HttpClient& client);

    // Non-copyable, non-movable (owns atomics and a mutex)
    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    // Check a request without touching the network; fills in the destination
    [[nodiscard]] std::expected<TransferRequest, TransferError> validate(TransferRequest request) const;

    // Blocking. Returns once the transfer is complete or aborted.
    [[nodiscard]] std::expected<TransferResult, TransferError> run(const TransferRequest& request);

    // Probe only (used by the CLI's info mode)
    [[nodiscard]] std::expected<ResourceInfo, TransferError> probe(const std::string& url);

    // Stop the current (or next) run; safe from any thread
    void cancel() noexcept;

    [[nodiscard]] TransferPhase phase() const noexcept { return phase_.load(std::memory_order_acquire); }

    // Called on the run() thread for every phase change
    void phase_listener(PhaseListener listener);

    [[nodiscard]] ProgressSnapshot progress() const { return progress_.snapshot(); }
    [[nodiscard]] std::vector<SegmentSnapshot> segment_snapshots() const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::expected<TransferResult, TransferError> run_once(const TransferRequest& request);

    void set_phase(TransferPhase phase);

    // Run fetchers for every segment of the plan on a bounded pool
    [[nodiscard]] std::error_code fetch_all(TransferPlan& plan, const std::string& url,
                                            std::uint32_t requested_workers, std::uint32_t& used_workers);

    void worker_loop(TransferPlan& plan, SegmentQueue& queue, SegmentFetcher& fetcher,
                     const std::string& url, std::stop_token stop) noexcept;

    // Terminal code of a plan whose segments did not all finish
    [[nodiscard]] std::error_code first_failure(const TransferPlan& plan) const noexcept;

    [[nodiscard]] TransferError abort(ErrorKind kind, std::error_code cause, std::string detail,
                                      const TransferPlan* plan);

    [[nodiscard]] std::stop_token current_token();

    // Fresh stop source for the next run
    void reset_stop();

    EngineConfig config_;
    HttpClient& client_;

    std::atomic<TransferPhase> phase_{TransferPhase::idle};
    ProgressAggregator progress_;

    mutable std::mutex plan_mutex_;
    std::unique_ptr<TransferPlan> plan_;

    std::mutex stop_mutex_;
    std::stop_source stop_;
    std::atomic<bool> cancelled_{false};

    std::mutex listener_mutex_;
    PhaseListener listener_;
};

} // namespace splitfetch::core
