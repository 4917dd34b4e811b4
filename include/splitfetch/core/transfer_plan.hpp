// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/core/capability_prober.hpp>
#include <splitfetch/core/segment.hpp>
#include <splitfetch/core/segment_fetcher.hpp>
#include <splitfetch/disk/assembler.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace splitfetch::core {

enum class PlanKind : std::uint8_t {
    multi_segment,   // N ranged segments
    single_stream    // One plain GET over the whole body
};

[[nodiscard]] std::string_view to_string(PlanKind kind) noexcept;

// The segments of one transfer and how to fetch them
class TransferPlan {
public:
    virtual ~TransferPlan() = default;

    TransferPlan(const TransferPlan&) = delete;
    TransferPlan& operator=(const TransferPlan&) = delete;

    [[nodiscard]] virtual PlanKind kind() const noexcept = 0;
    [[nodiscard]] virtual FetchMode mode() const noexcept = 0;

    [[nodiscard]] std::optional<std::uint64_t> total() const noexcept { return total_; }
    [[nodiscard]] std::uint32_t workers() const noexcept { return workers_; }
    [[nodiscard]] const std::string& destination() const noexcept { return destination_; }

    [[nodiscard]] std::vector<std::unique_ptr<Segment>>& segments() noexcept { return segments_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Segment>>& segments() const noexcept { return segments_; }

    [[nodiscard]] bool all_done() const noexcept;
    [[nodiscard]] std::vector<SegmentSnapshot> snapshots() const;
    [[nodiscard]] std::vector<disk::AssemblyPart> parts() const;

protected:
    TransferPlan(std::string destination, std::optional<std::uint64_t> total, std::uint32_t workers) noexcept;

    std::string destination_;
    std::optional<std::uint64_t> total_;
    std::uint32_t workers_;
    std::vector<std::unique_ptr<Segment>> segments_;
};

class MultiSegmentPlan final : public TransferPlan {
public:
    // Split `total` bytes into `chunk`-sized ranged segments
    [[nodiscard]] static std::expected<std::unique_ptr<TransferPlan>, std::error_code>
    create(std::string destination, std::uint64_t total, std::uint32_t workers, std::uint64_t chunk);

    [[nodiscard]] PlanKind kind() const noexcept override { return PlanKind::multi_segment; }
    [[nodiscard]] FetchMode mode() const noexcept override { return FetchMode::ranged; }

private:
    // Restricts construction to create()
    struct Key {
        explicit Key() = default;
    };

public:
    MultiSegmentPlan(Key, std::string destination, std::optional<std::uint64_t> total, std::uint32_t workers) noexcept
        : TransferPlan(std::move(destination), total, workers) {}
};

class SingleStreamPlan final : public TransferPlan {
public:
    // One segment covering the body; bounded when the size is known
    [[nodiscard]] static std::unique_ptr<TransferPlan>
    create(std::string destination, std::optional<std::uint64_t> total);

    [[nodiscard]] PlanKind kind() const noexcept override { return PlanKind::single_stream; }
    [[nodiscard]] FetchMode mode() const noexcept override { return FetchMode::stream; }

private:
    // Restricts construction to create()
    struct Key {
        explicit Key() = default;
    };

public:
    SingleStreamPlan(Key, std::string destination, std::optional<std::uint64_t> total, std::uint32_t workers) noexcept
        : TransferPlan(std::move(destination), total, workers) {}
};

// Pick the plan variant for what the probe found
[[nodiscard]] std::expected<std::unique_ptr<TransferPlan>, std::error_code>
make_plan(const ResourceInfo& info, std::string destination, std::uint32_t workers, std::uint64_t chunk);

} // namespace splitfetch::core
