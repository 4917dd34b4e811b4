// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/transfer_plan.hpp>
#include <splitfetch/core/range_planner.hpp>
#include <splitfetch/disk/part_file.hpp>
#include <algorithm>
#include <new>

namespace splitfetch::core {

std::string_view to_string(PlanKind kind) noexcept {
    switch (kind) {
        case PlanKind::multi_segment: return "multi-segment";
        case PlanKind::single_stream: return "single-stream";
    }
    return "unknown";
}

//=============================================================================
// TransferPlan
//=============================================================================

TransferPlan::TransferPlan(std::string destination,
                           std::optional<std::uint64_t> total,
                           std::uint32_t workers) noexcept
    : destination_(std::move(destination))
    , total_(total)
    , workers_(workers) {}

bool TransferPlan::all_done() const noexcept {
    return std::all_of(segments_.begin(), segments_.end(), [](const auto& seg) {
        return seg->state() == SegmentState::done;
    });
}

std::vector<SegmentSnapshot> TransferPlan::snapshots() const {
    std::vector<SegmentSnapshot> out;
    out.reserve(segments_.size());
    for (const auto& seg : segments_) {
        out.push_back(seg->snapshot());
    }
    return out;
}

std::vector<disk::AssemblyPart> TransferPlan::parts() const {
    std::vector<disk::AssemblyPart> out;
    out.reserve(segments_.size());
    for (const auto& seg : segments_) {
        out.push_back(disk::AssemblyPart{seg->index(), seg->part_path()});
    }
    return out;
}

//=============================================================================
// Variants
//=============================================================================

std::expected<std::unique_ptr<TransferPlan>, std::error_code>
MultiSegmentPlan::create(std::string destination, std::uint64_t total, std::uint32_t workers, std::uint64_t chunk) {
    auto ranges = plan_ranges(total, workers, chunk);
    if (!ranges) {
        return std::unexpected(ranges.error());
    }

    auto plan = std::make_unique<MultiSegmentPlan>(Key{}, std::move(destination), total, ranges->workers);
    plan->segments_.reserve(ranges->ranges.size());
    for (const auto& range : ranges->ranges) {
        plan->segments_.push_back(std::make_unique<Segment>(
            range.index, range.first, range.last, disk::part_path(plan->destination_, range.index)));
    }
    return std::unique_ptr<TransferPlan>(std::move(plan));
}

std::unique_ptr<TransferPlan>
SingleStreamPlan::create(std::string destination, std::optional<std::uint64_t> total) {
    auto plan = std::make_unique<SingleStreamPlan>(Key{}, std::move(destination), total, 1);

    std::optional<std::uint64_t> last;
    if (total && *total > 0) {
        last = *total - 1;
    }
    // An empty body still gets a segment so the GET confirms it
    plan->segments_.push_back(std::make_unique<Segment>(0, 0, last, disk::part_path(plan->destination_, 0)));
    return std::unique_ptr<TransferPlan>(std::move(plan));
}

std::expected<std::unique_ptr<TransferPlan>, std::error_code>
make_plan(const ResourceInfo& info, std::string destination, std::uint32_t workers, std::uint64_t chunk) {
    try {
        if (info.supports_range && info.total_size) {
            return MultiSegmentPlan::create(std::move(destination), *info.total_size, workers, chunk);
        }
        return SingleStreamPlan::create(std::move(destination), info.total_size);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace splitfetch::core
