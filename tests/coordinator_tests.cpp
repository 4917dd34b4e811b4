// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitfetch/core/transfer_coordinator.hpp>
#include "fake_http_client.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace splitfetch::core;
using namespace std::chrono_literals;
using splitfetch::test::Fault;
using splitfetch::test::FakeHttpClient;
using splitfetch::test::TempDir;
using splitfetch::test::make_body;
using splitfetch::test::read_file;

namespace {

constexpr const char* URL = "http://example.com/files/data.bin";

EngineConfig test_config() {
    EngineConfig config;
    config.retry.base_delay = 1ms;
    config.retry.max_delay = 2ms;
    return config;
}

TransferRequest request_for(const TempDir& dir, std::uint32_t workers, std::uint64_t chunk) {
    TransferRequest request;
    request.url = URL;
    request.destination = dir.file("data.bin");
    request.workers = workers;
    request.chunk_size = chunk;
    return request;
}

} // namespace

TEST_CASE("Coordinator splits a ranged resource", "[coordinator]") {
    const auto body = make_body(10'000'000);
    FakeHttpClient client(body);
    client.piece_size = 256 * 1024;
    TempDir dir;

    TransferCoordinator coordinator(test_config(), client);
    std::vector<TransferPhase> phases;
    coordinator.phase_listener([&](TransferPhase phase) { phases.push_back(phase); });

    auto result = coordinator.run(request_for(dir, 10, 1'048'576));
    REQUIRE(result.has_value());
    CHECK(result->plan == PlanKind::multi_segment);
    CHECK(result->segments == 10);
    CHECK(result->workers <= 10);
    CHECK(result->bytes == 10'000'000);
    CHECK(coordinator.phase() == TransferPhase::complete);

    CHECK(std::filesystem::file_size(dir.file("data.bin")) == 10'000'000);
    CHECK(read_file(dir.file("data.bin")) == body);
    CHECK(dir.entries() == std::vector<std::string>{"data.bin"});

    CHECK(client.max_in_flight.load() <= 10);
    CHECK(client.get_calls.load() == 10);
    CHECK(coordinator.progress().bytes_done == 10'000'000);

    CHECK(phases == std::vector<TransferPhase>{TransferPhase::probing, TransferPhase::planning,
                                               TransferPhase::fetching, TransferPhase::assembling,
                                               TransferPhase::complete});

    auto segments = coordinator.segment_snapshots();
    REQUIRE(segments.size() == 10);
    for (const auto& seg : segments) {
        CHECK(seg.state == SegmentState::done);
    }
    CHECK(segments[9].size == 10'000'000u - 9u * 1'048'576u);
}

TEST_CASE("Coordinator bounds the worker pool", "[coordinator]") {
    const auto body = make_body(64 * 1000);
    FakeHttpClient client(body);
    client.piece_size = 100;
    client.piece_delay = 50us;
    TempDir dir;

    SECTION("By the requested count") {
        TransferCoordinator coordinator(test_config(), client);
        auto result = coordinator.run(request_for(dir, 4, 1000));
        REQUIRE(result.has_value());
        CHECK(result->segments == 64);
        CHECK(result->workers == 4);
        CHECK(client.max_in_flight.load() <= 4);
    }

    SECTION("By the configured pool limit") {
        auto config = test_config();
        config.pool_limit = 3;
        TransferCoordinator coordinator(config, client);
        auto result = coordinator.run(request_for(dir, 50, 1000));
        REQUIRE(result.has_value());
        CHECK(result->workers == 3);
        CHECK(client.max_in_flight.load() <= 3);
    }

    SECTION("By the segment count") {
        TransferCoordinator coordinator(test_config(), client);
        auto result = coordinator.run(request_for(dir, 100, 32 * 1000));
        REQUIRE(result.has_value());
        CHECK(result->segments == 2);
        CHECK(result->workers == 2);
    }

    CHECK(read_file(dir.file("data.bin")) == body);
}

TEST_CASE("Coordinator falls back to a single stream", "[coordinator]") {
    const auto body = make_body(3'000'000);
    FakeHttpClient client(body);
    client.advertise_ranges = false;
    client.honor_ranges = false;
    TempDir dir;

    SECTION("Known size") {
        TransferCoordinator coordinator(test_config(), client);
        std::vector<TransferPhase> phases;
        coordinator.phase_listener([&](TransferPhase phase) { phases.push_back(phase); });

        auto result = coordinator.run(request_for(dir, 10, 1'048'576));
        REQUIRE(result.has_value());
        CHECK(result->plan == PlanKind::single_stream);
        CHECK(result->segments == 1);
        CHECK(result->workers == 1);
        CHECK(std::find(phases.begin(), phases.end(), TransferPhase::planning) == phases.end());
    }

    SECTION("Unknown size") {
        client.send_length = false;
        TransferCoordinator coordinator(test_config(), client);
        auto result = coordinator.run(request_for(dir, 10, 1'048'576));
        REQUIRE(result.has_value());
        CHECK(result->plan == PlanKind::single_stream);
        CHECK(result->bytes == body.size());
        CHECK(!coordinator.progress().total.has_value());
    }

    SECTION("HEAD rejected by the server") {
        client.head_status = 405;
        TransferCoordinator coordinator(test_config(), client);
        auto result = coordinator.run(request_for(dir, 10, 1'048'576));
        REQUIRE(result.has_value());
        CHECK(result->plan == PlanKind::single_stream);
    }

    CHECK(client.get_calls.load() == 1);
    CHECK(read_file(dir.file("data.bin")) == body);
    CHECK(dir.entries() == std::vector<std::string>{"data.bin"});
}

TEST_CASE("Coordinator aborts when a segment exhausts its retries", "[coordinator]") {
    const auto body = make_body(8 * 1000);
    FakeHttpClient client(body);
    client.piece_size = 100;
    client.fault = [](std::uint64_t first, std::uint32_t) -> std::optional<Fault> {
        if (first == 3000) {
            return Fault{std::nullopt, {}, 503};
        }
        return std::nullopt;
    };
    TempDir dir;

    SECTION("Fail fast") {
        TransferCoordinator coordinator(test_config(), client);
        auto result = coordinator.run(request_for(dir, 2, 1000));
        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorKind::segment);
        CHECK(result.error().cause == TransferErrc::server_error);
        CHECK(coordinator.phase() == TransferPhase::aborted);
    }

    SECTION("Keep going") {
        auto config = test_config();
        config.fail_fast = false;
        TransferCoordinator coordinator(config, client);
        auto result = coordinator.run(request_for(dir, 2, 1000));
        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorKind::segment);
        CHECK(result.error().cause == TransferErrc::server_error);

        // Every other segment still ran to completion
        std::size_t done = 0;
        for (const auto& seg : coordinator.segment_snapshots()) {
            if (seg.state == SegmentState::done) ++done;
        }
        CHECK(done == 7);
    }

    CHECK(!std::filesystem::exists(dir.file("data.bin")));
    CHECK(dir.entries().empty());
}

TEST_CASE("Coordinator fails a segment whose range is rejected mid-transfer", "[coordinator]") {
    const auto body = make_body(4 * 1000);
    FakeHttpClient client(body);
    client.fault = [](std::uint64_t first, std::uint32_t) -> std::optional<Fault> {
        if (first == 2000) {
            return Fault{std::nullopt, {}, 200};
        }
        return std::nullopt;
    };
    TempDir dir;

    TransferCoordinator coordinator(test_config(), client);
    auto result = coordinator.run(request_for(dir, 1, 1000));
    REQUIRE(!result.has_value());
    CHECK(result.error().kind == ErrorKind::segment);
    CHECK(result.error().cause == TransferErrc::range_not_honored);

    // Not retried
    std::size_t starts_at_2000 = 0;
    for (const auto& request : client.requests()) {
        if (request && request->first == 2000) ++starts_at_2000;
    }
    CHECK(starts_at_2000 == 1);
    CHECK(dir.entries().empty());
}

TEST_CASE("Coordinator resumes a segment after a transient fault", "[coordinator]") {
    const auto body = make_body(5'000'000);
    FakeHttpClient client(body);
    client.piece_size = 64 * 1024;
    client.fault = [](std::uint64_t first, std::uint32_t previous) -> std::optional<Fault> {
        if (first == 1'048'576 && previous == 0) {
            return Fault{std::uint64_t{300'000}, make_error_code(TransferErrc::connection_lost), std::nullopt};
        }
        return std::nullopt;
    };
    TempDir dir;

    TransferCoordinator coordinator(test_config(), client);
    auto result = coordinator.run(request_for(dir, 4, 1'048'576));
    REQUIRE(result.has_value());
    CHECK(read_file(dir.file("data.bin")) == body);
    CHECK(coordinator.progress().bytes_done == body.size());

    bool resumed = false;
    for (const auto& request : client.requests()) {
        if (request && request->first == 1'048'576 + 300'000) resumed = true;
    }
    CHECK(resumed);
    CHECK(dir.entries() == std::vector<std::string>{"data.bin"});
}

TEST_CASE("Coordinator rejects bad requests before any network call", "[coordinator]") {
    FakeHttpClient client(make_body(1000));
    TempDir dir;
    TransferCoordinator coordinator(test_config(), client);

    SECTION("Zero workers") {
        auto result = coordinator.run(request_for(dir, 0, 1000));
        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorKind::config);
        CHECK(result.error().cause == TransferErrc::invalid_worker_count);
    }

    SECTION("Too many workers") {
        auto result = coordinator.run(request_for(dir, 10'001, 1000));
        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorKind::config);
        CHECK(result.error().cause == TransferErrc::invalid_worker_count);
    }

    SECTION("Zero chunk") {
        auto result = coordinator.run(request_for(dir, 4, 0));
        REQUIRE(!result.has_value());
        CHECK(result.error().cause == TransferErrc::invalid_chunk_size);
    }

    SECTION("Malformed URL") {
        auto request = request_for(dir, 4, 1000);
        request.url = "not a url";
        auto result = coordinator.run(request);
        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorKind::config);
        CHECK(result.error().cause == TransferErrc::invalid_url);
    }

    CHECK(coordinator.phase() == TransferPhase::aborted);
    CHECK(client.head_calls.load() == 0);
    CHECK(client.get_calls.load() == 0);
    CHECK(dir.entries().empty());
}

TEST_CASE("Coordinator honors a configured worker limit", "[coordinator]") {
    FakeHttpClient client(make_body(1000));
    TempDir dir;
    auto config = test_config();
    config.worker_limit = 8;
    TransferCoordinator coordinator(config, client);

    auto rejected = coordinator.run(request_for(dir, 9, 100));
    REQUIRE(!rejected.has_value());
    CHECK(rejected.error().cause == TransferErrc::invalid_worker_count);
    CHECK(client.head_calls.load() == 0);

    auto accepted = coordinator.run(request_for(dir, 8, 100));
    CHECK(accepted.has_value());
}

TEST_CASE("Coordinator reports probe failures", "[coordinator]") {
    FakeHttpClient client(make_body(1000));
    client.head_status = 404;
    TempDir dir;
    TransferCoordinator coordinator(test_config(), client);

    auto result = coordinator.run(request_for(dir, 4, 100));
    REQUIRE(!result.has_value());
    CHECK(result.error().kind == ErrorKind::probe);
    CHECK(result.error().cause == TransferErrc::not_found);
    CHECK(client.get_calls.load() == 0);
    CHECK(dir.entries().empty());
}

TEST_CASE("Coordinator writes an empty file for an empty resource", "[coordinator]") {
    FakeHttpClient client("");
    TempDir dir;
    TransferCoordinator coordinator(test_config(), client);
    std::vector<TransferPhase> phases;
    coordinator.phase_listener([&](TransferPhase phase) { phases.push_back(phase); });

    auto result = coordinator.run(request_for(dir, 10, 1000));
    REQUIRE(result.has_value());
    CHECK(result->segments == 0);
    CHECK(result->bytes == 0);
    CHECK(client.get_calls.load() == 0);
    REQUIRE(std::filesystem::exists(dir.file("data.bin")));
    CHECK(std::filesystem::file_size(dir.file("data.bin")) == 0);
    CHECK(std::find(phases.begin(), phases.end(), TransferPhase::fetching) == phases.end());
}

TEST_CASE("Coordinator creates missing destination directories", "[coordinator]") {
    const auto body = make_body(100'000);
    FakeHttpClient client(body);
    TempDir dir;
    TransferCoordinator coordinator(test_config(), client);

    SECTION("Ranged transfer") {
        auto request = request_for(dir, 4, 30'000);
        request.destination = (dir.path() / "sub" / "out.bin").string();

        auto result = coordinator.run(request);
        REQUIRE(result.has_value());
        CHECK(result->plan == PlanKind::multi_segment);
        CHECK(read_file(request.destination) == body);

        std::vector<std::string> names;
        for (const auto& entry : std::filesystem::directory_iterator(dir.path() / "sub")) {
            names.push_back(entry.path().filename().string());
        }
        CHECK(names == std::vector<std::string>{"out.bin"});
    }

    SECTION("Single stream") {
        client.advertise_ranges = false;
        auto request = request_for(dir, 4, 30'000);
        request.destination = (dir.path() / "a" / "b" / "out.bin").string();

        auto result = coordinator.run(request);
        REQUIRE(result.has_value());
        CHECK(result->plan == PlanKind::single_stream);
        CHECK(read_file(request.destination) == body);
    }

    SECTION("Parent path blocked by a file") {
        { std::ofstream(dir.file("blocker")) << "x"; }
        auto request = request_for(dir, 4, 30'000);
        request.destination = (dir.path() / "blocker" / "out.bin").string();

        auto result = coordinator.run(request);
        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorKind::assembly);
        CHECK(result.error().detail == request.destination);
        CHECK(coordinator.phase() == TransferPhase::aborted);
        CHECK(client.get_calls.load() == 0);
        CHECK(dir.entries() == std::vector<std::string>{"blocker"});
    }
}

TEST_CASE("Coordinator cancellation", "[coordinator]") {
    const auto body = make_body(2'000'000);
    FakeHttpClient client(body);
    client.piece_size = 10'000;
    TempDir dir;
    TransferCoordinator coordinator(test_config(), client);

    SECTION("While segments are in flight") {
        client.fault = [&coordinator](std::uint64_t first, std::uint32_t) -> std::optional<Fault> {
            if (first == 300'000) {
                coordinator.cancel();
            }
            return std::nullopt;
        };
        auto result = coordinator.run(request_for(dir, 2, 100'000));
        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorKind::cancelled);
        CHECK(result.error().cause == TransferErrc::cancelled);
        CHECK(coordinator.phase() == TransferPhase::aborted);
        CHECK(dir.entries().empty());

        // The next run starts with a fresh stop state
        client.fault = {};
        auto again = coordinator.run(request_for(dir, 4, 100'000));
        REQUIRE(again.has_value());
        CHECK(read_file(dir.file("data.bin")) == body);
    }

    SECTION("Before fetching starts") {
        coordinator.phase_listener([&coordinator](TransferPhase phase) {
            if (phase == TransferPhase::fetching) coordinator.cancel();
        });
        auto result = coordinator.run(request_for(dir, 4, 100'000));
        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorKind::cancelled);
        CHECK(coordinator.phase() == TransferPhase::aborted);
        CHECK(client.get_calls.load() == 0);
        CHECK(dir.entries().empty());
    }

    SECTION("Before assembly starts") {
        FakeHttpClient empty("");
        TransferCoordinator idle(test_config(), empty);
        std::vector<TransferPhase> phases;
        idle.phase_listener([&](TransferPhase phase) {
            phases.push_back(phase);
            if (phase == TransferPhase::planning) idle.cancel();
        });
        auto result = idle.run(request_for(dir, 4, 100'000));
        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorKind::cancelled);
        CHECK(idle.phase() == TransferPhase::aborted);
        CHECK(std::find(phases.begin(), phases.end(), TransferPhase::assembling) == phases.end());
        CHECK(dir.entries().empty());
    }
}

TEST_CASE("Coordinator derives the destination from the URL", "[coordinator]") {
    FakeHttpClient client(make_body(10));
    TransferCoordinator coordinator(test_config(), client);

    TransferRequest request;
    request.url = "https://example.com/path/archive.tar.gz?token=1";
    auto valid = coordinator.validate(request);
    REQUIRE(valid.has_value());
    CHECK(valid->destination == "archive.tar.gz");
    CHECK(client.head_calls.load() == 0);
}
