// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitfetch/core/config.hpp>
#include "fake_http_client.hpp"
#include <fstream>

using namespace splitfetch::core;
using namespace std::chrono_literals;

TEST_CASE("parse_engine_config defaults", "[config]") {
    auto cfg = parse_engine_config("{}");
    REQUIRE(cfg.has_value());
    CHECK(cfg->worker_limit == 10'000);
    CHECK(cfg->pool_limit == 10'000);
    CHECK(cfg->probe_attempts == 3);
    CHECK(cfg->fail_fast);
    CHECK(cfg->retry.max_attempts == 3);
    CHECK(cfg->rate_window == 3000ms);
    CHECK(cfg->http.max_redirects == 10);
    CHECK(cfg->http.verify_tls);
}

TEST_CASE("parse_engine_config overrides", "[config]") {
    auto cfg = parse_engine_config(R"({
        "worker_limit": 64,
        "pool_limit": 32,
        "probe_attempts": 5,
        "fail_fast": false,
        "rate_window_ms": 1500,
        "retry": {"max_attempts": 7, "base_delay_ms": 50, "max_delay_ms": 400, "multiplier": 3.0},
        "http": {"connect_timeout_sec": 5, "stall_timeout_sec": 9, "max_redirects": 2,
                 "verify_tls": false, "user_agent": "test-agent"}
    })");
    REQUIRE(cfg.has_value());
    CHECK(cfg->worker_limit == 64);
    CHECK(cfg->pool_limit == 32);
    CHECK(cfg->probe_attempts == 5);
    CHECK(!cfg->fail_fast);
    CHECK(cfg->rate_window == 1500ms);
    CHECK(cfg->retry.max_attempts == 7);
    CHECK(cfg->retry.base_delay == 50ms);
    CHECK(cfg->retry.max_delay == 400ms);
    CHECK(cfg->retry.multiplier == Catch::Approx(3.0));
    CHECK(cfg->http.connect_timeout == 5s);
    CHECK(cfg->http.stall_timeout == 9s);
    CHECK(cfg->http.max_redirects == 2);
    CHECK(!cfg->http.verify_tls);
    CHECK(cfg->http.user_agent == "test-agent");
}

TEST_CASE("parse_engine_config rejects bad input", "[config]") {
    SECTION("Not JSON") {
        auto cfg = parse_engine_config("worker_limit = 4");
        REQUIRE(!cfg.has_value());
        CHECK(cfg.error() == TransferErrc::invalid_config);
    }

    SECTION("Not an object") {
        CHECK(!parse_engine_config("[1, 2]").has_value());
    }

    SECTION("Wrong type") {
        CHECK(!parse_engine_config(R"({"worker_limit": "many"})").has_value());
    }

    SECTION("Zero limits") {
        CHECK(!parse_engine_config(R"({"worker_limit": 0})").has_value());
        CHECK(!parse_engine_config(R"({"retry": {"max_attempts": 0}})").has_value());
    }

    SECTION("Limits above the worker cap") {
        auto cfg = parse_engine_config(R"({"worker_limit": 20000})");
        REQUIRE(!cfg.has_value());
        CHECK(cfg.error() == TransferErrc::invalid_config);
        CHECK(!parse_engine_config(R"({"pool_limit": 10001})").has_value());

        auto at_cap = parse_engine_config(R"({"worker_limit": 10000, "pool_limit": 10000})");
        REQUIRE(at_cap.has_value());
        CHECK(at_cap->worker_limit == MAX_WORKERS);
    }

    SECTION("Inconsistent retry delays") {
        CHECK(!parse_engine_config(R"({"retry": {"base_delay_ms": 900, "max_delay_ms": 100}})").has_value());
        CHECK(!parse_engine_config(R"({"retry": {"multiplier": 0.5}})").has_value());
    }
}

TEST_CASE("load_engine_config reads a file", "[config]") {
    splitfetch::test::TempDir dir;

    SECTION("Existing file") {
        auto path = dir.file("engine.json");
        {
            std::ofstream out(path);
            out << R"({"pool_limit": 4})";
        }
        auto cfg = load_engine_config(path);
        REQUIRE(cfg.has_value());
        CHECK(cfg->pool_limit == 4);
    }

    SECTION("Missing file") {
        auto cfg = load_engine_config(dir.file("absent.json"));
        REQUIRE(!cfg.has_value());
        CHECK(cfg.error() == TransferErrc::invalid_config);
    }
}

TEST_CASE("RetryPolicy backoff", "[config]") {
    RetryPolicy policy;
    policy.base_delay = 100ms;
    policy.max_delay = 1000ms;
    policy.multiplier = 2.0;

    CHECK(policy.delay(1) == 0ms);
    CHECK(policy.delay(2) == 100ms);
    CHECK(policy.delay(3) == 200ms);
    CHECK(policy.delay(4) == 400ms);
    CHECK(policy.delay(10) == 1000ms);

    SECTION("Wait is interrupted by stop") {
        std::stop_source stop;
        stop.request_stop();
        auto started = std::chrono::steady_clock::now();
        CHECK(!policy.wait_before(5, stop.get_token()));
        CHECK(std::chrono::steady_clock::now() - started < 500ms);
    }

    SECTION("First attempt does not wait") {
        CHECK(policy.wait_before(1, {}));
    }
}
