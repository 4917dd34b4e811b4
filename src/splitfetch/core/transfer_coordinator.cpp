// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/transfer_coordinator.hpp>
#include <splitfetch/core/url.hpp>
#include <splitfetch/disk/assembler.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace splitfetch::core {

std::string_view to_string(TransferPhase phase) noexcept {
    switch (phase) {
        case TransferPhase::idle:       return "idle";
        case TransferPhase::probing:    return "probing";
        case TransferPhase::planning:   return "planning";
        case TransferPhase::fetching:   return "fetching";
        case TransferPhase::assembling: return "assembling";
        case TransferPhase::complete:   return "complete";
        case TransferPhase::aborted:    return "aborted";
    }
    return "unknown";
}

double TransferResult::average_bps() const noexcept {
    if (elapsed.count() <= 0.0) return 0.0;
    return static_cast<double>(bytes) / elapsed.count();
}

//=============================================================================
// TransferCoordinator
//=============================================================================

TransferCoordinator::TransferCoordinator(EngineConfig config, HttpClient& client)
    : config_(std::move(config))
    , client_(client)
    , progress_(config_.rate_window) {}

std::expected<TransferRequest, TransferError> TransferCoordinator::validate(TransferRequest request) const {
    auto url = Url::parse(request.url);
    if (!url) {
        return std::unexpected(TransferError{ErrorKind::config, url.error(), request.url});
    }

    if (request.workers == 0 || request.workers > config_.worker_limit) {
        return std::unexpected(TransferError{
            ErrorKind::config, make_error_code(TransferErrc::invalid_worker_count),
            "worker count " + std::to_string(request.workers) + " outside 1.." +
                std::to_string(config_.worker_limit)});
    }

    if (request.chunk_size == 0) {
        return std::unexpected(TransferError{
            ErrorKind::config, make_error_code(TransferErrc::invalid_chunk_size), "chunk size must be positive"});
    }

    request.url = url->str();
    if (request.destination.empty()) {
        request.destination = url->filename();
    }
    return request;
}

std::expected<TransferResult, TransferError> TransferCoordinator::run(const TransferRequest& request) {
    auto result = run_once(request);
    reset_stop();
    return result;
}

std::expected<TransferResult, TransferError> TransferCoordinator::run_once(const TransferRequest& request) {
    const auto started = std::chrono::steady_clock::now();

    auto valid = validate(request);
    if (!valid) {
        set_phase(TransferPhase::aborted);
        spdlog::error("Rejected request: {}", valid.error().message());
        return std::unexpected(valid.error());
    }

    {
        std::lock_guard<std::mutex> lock(plan_mutex_);
        plan_.reset();
    }
    progress_.reset(std::nullopt, started);
    auto stop = current_token();

    // Probe
    set_phase(TransferPhase::probing);
    CapabilityProber prober(client_, config_.probe_attempts, config_.retry);
    auto info = prober.probe(valid->url, stop);
    if (!info) {
        if (cancelled_.load(std::memory_order_acquire) || info.error() == TransferErrc::cancelled) {
            return std::unexpected(abort(ErrorKind::cancelled, make_error_code(TransferErrc::cancelled), {}, nullptr));
        }
        return std::unexpected(abort(ErrorKind::probe, info.error(), valid->url, nullptr));
    }

    // Plan
    if (info->supports_range) {
        set_phase(TransferPhase::planning);
    }
    auto plan = make_plan(*info, valid->destination, valid->workers, valid->chunk_size);
    if (!plan) {
        return std::unexpected(abort(ErrorKind::config, plan.error(), {}, nullptr));
    }
    TransferPlan* active = plan->get();
    spdlog::info("{} plan for {}: {} segment(s), {} worker(s)", to_string(active->kind()),
                 active->destination(), active->segments().size(), active->workers());

    progress_.total(active->total());
    {
        std::lock_guard<std::mutex> lock(plan_mutex_);
        plan_ = std::move(*plan);
    }

    if (auto ec = disk::Assembler::prepare(active->destination())) {
        return std::unexpected(abort(ErrorKind::assembly, ec, active->destination(), active));
    }

    // Fetch
    std::uint32_t used_workers = 0;
    if (!active->segments().empty()) {
        set_phase(TransferPhase::fetching);
        auto ec = fetch_all(*active, valid->url, valid->workers, used_workers);
        if (cancelled_.load(std::memory_order_acquire)) {
            return std::unexpected(abort(ErrorKind::cancelled, make_error_code(TransferErrc::cancelled), {}, active));
        }
        if (ec) {
            return std::unexpected(abort(ErrorKind::segment, ec, valid->url, active));
        }
    }

    // Assemble
    if (cancelled_.load(std::memory_order_acquire)) {
        return std::unexpected(abort(ErrorKind::cancelled, make_error_code(TransferErrc::cancelled), {}, active));
    }
    set_phase(TransferPhase::assembling);
    if (auto ec = disk::Assembler::assemble(active->parts(), active->destination(), active->total())) {
        set_phase(TransferPhase::aborted);
        return std::unexpected(TransferError{ErrorKind::assembly, ec, active->destination()});
    }

    TransferResult result;
    result.destination = active->destination();
    result.bytes = active->total().value_or(progress_.bytes_done());
    result.plan = active->kind();
    result.segments = static_cast<std::uint32_t>(active->segments().size());
    result.workers = used_workers;
    result.elapsed = std::chrono::steady_clock::now() - started;

    set_phase(TransferPhase::complete);
    return result;
}

std::expected<ResourceInfo, TransferError> TransferCoordinator::probe(const std::string& url) {
    auto parsed = Url::parse(url);
    if (!parsed) {
        return std::unexpected(TransferError{ErrorKind::config, parsed.error(), url});
    }

    CapabilityProber prober(client_, config_.probe_attempts, config_.retry);
    auto info = prober.probe(url, current_token());
    if (!info) {
        auto kind = info.error() == TransferErrc::cancelled ? ErrorKind::cancelled : ErrorKind::probe;
        return std::unexpected(TransferError{kind, info.error(), url});
    }
    return *info;
}

void TransferCoordinator::cancel() noexcept {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    cancelled_.store(true, std::memory_order_release);
    stop_.request_stop();
}

void TransferCoordinator::phase_listener(PhaseListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

std::vector<SegmentSnapshot> TransferCoordinator::segment_snapshots() const {
    std::lock_guard<std::mutex> lock(plan_mutex_);
    if (!plan_) return {};
    return plan_->snapshots();
}

void TransferCoordinator::set_phase(TransferPhase phase) {
    phase_.store(phase, std::memory_order_release);
    spdlog::info("Transfer phase: {}", to_string(phase));

    PhaseListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(phase);
    }
}

std::error_code TransferCoordinator::fetch_all(TransferPlan& plan, const std::string& url,
                                               std::uint32_t requested_workers, std::uint32_t& used_workers) {
    const auto pool_limit = std::max<std::uint32_t>(config_.pool_limit, 1);
    const auto pool_size = std::min(std::clamp<std::uint32_t>(requested_workers, 1, pool_limit),
                                    std::max<std::uint32_t>(plan.workers(), 1));

    SegmentQueue queue(plan.segments());
    SegmentFetcher fetcher(client_, config_.retry, progress_);
    auto stop = current_token();

    {
        std::vector<std::jthread> pool;
        pool.reserve(pool_size);
        try {
            for (std::uint32_t i = 0; i < pool_size; ++i) {
                pool.emplace_back([this, &plan, &queue, &fetcher, &url, stop] {
                    worker_loop(plan, queue, fetcher, url, stop);
                });
            }
        } catch (const std::system_error& e) {
            spdlog::warn("Started {} of {} workers: {}", pool.size(), pool_size, e.what());
            if (pool.empty()) {
                return e.code();
            }
        }
        used_workers = static_cast<std::uint32_t>(pool.size());
        spdlog::debug("Dispatched {} segment(s) over {} worker(s)", plan.segments().size(), used_workers);
    } // Workers join here

    if (plan.all_done()) {
        return {};
    }
    return first_failure(plan);
}

void TransferCoordinator::worker_loop(TransferPlan& plan, SegmentQueue& queue, SegmentFetcher& fetcher,
                                      const std::string& url, std::stop_token stop) noexcept {
    while (!stop.stop_requested()) {
        Segment* segment = queue.next();
        if (!segment) {
            return;
        }

        auto ec = fetcher.fetch(*segment, url, plan.mode(), stop);
        if (ec && ec != TransferErrc::cancelled && config_.fail_fast) {
            spdlog::error("Segment {} failed; stopping remaining segments", segment->index());
            std::lock_guard<std::mutex> lock(stop_mutex_);
            stop_.request_stop();
        }
    }
}

std::error_code TransferCoordinator::first_failure(const TransferPlan& plan) const noexcept {
    // Prefer the root cause over siblings that were stopped because of it
    std::error_code fallback;
    for (const auto& seg : plan.segments()) {
        if (seg->state() != SegmentState::failed) continue;
        if (seg->error() != TransferErrc::cancelled) {
            return seg->error();
        }
        if (!fallback) fallback = seg->error();
    }
    return fallback ? fallback : make_error_code(TransferErrc::cancelled);
}

TransferError TransferCoordinator::abort(ErrorKind kind, std::error_code cause, std::string detail,
                                         const TransferPlan* plan) {
    set_phase(TransferPhase::aborted);
    if (plan) {
        disk::Assembler::purge(plan->parts());
    }

    TransferError error{kind, cause, std::move(detail)};
    if (kind == ErrorKind::cancelled) {
        spdlog::warn("Transfer cancelled");
    } else {
        spdlog::error("Transfer aborted: {}", error.message());
    }
    return error;
}

std::stop_token TransferCoordinator::current_token() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    return stop_.get_token();
}

void TransferCoordinator::reset_stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_ = std::stop_source{};
    cancelled_.store(false, std::memory_order_release);
}

} // namespace splitfetch::core
