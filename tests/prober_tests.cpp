// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitfetch/core/capability_prober.hpp>
#include "fake_http_client.hpp"

using namespace splitfetch::core;
using namespace std::chrono_literals;
using splitfetch::test::FakeHttpClient;
using splitfetch::test::make_body;

namespace {

RetryPolicy fast_retry() {
    RetryPolicy policy;
    policy.base_delay = 1ms;
    policy.max_delay = 2ms;
    return policy;
}

HttpResponse head_response(std::int32_t status, HeaderMap headers) {
    HttpResponse response;
    response.status_code = status;
    response.headers = std::move(headers);
    fill_response_fields(response);
    return response;
}

} // namespace

TEST_CASE("CapabilityProber::interpret", "[prober]") {
    SECTION("Size and byte ranges") {
        auto info = CapabilityProber::interpret(
            head_response(200, {{"content-length", "1234"}, {"accept-ranges", "bytes"}}));
        REQUIRE(info.has_value());
        CHECK(info->total_size == 1234u);
        CHECK(info->supports_range);
    }

    SECTION("Ranges advertised as none") {
        auto info = CapabilityProber::interpret(
            head_response(200, {{"content-length", "1234"}, {"accept-ranges", "none"}}));
        REQUIRE(info.has_value());
        CHECK(info->total_size == 1234u);
        CHECK(!info->supports_range);
    }

    SECTION("Ranges without a size are not usable") {
        auto info = CapabilityProber::interpret(head_response(200, {{"accept-ranges", "bytes"}}));
        REQUIRE(info.has_value());
        CHECK(!info->total_size.has_value());
        CHECK(!info->supports_range);
    }

    SECTION("Malformed Content-Length") {
        auto info = CapabilityProber::interpret(head_response(200, {{"content-length", "12ab"}}));
        REQUIRE(!info.has_value());
        CHECK(info.error() == TransferErrc::malformed_headers);
    }

    SECTION("HEAD not allowed falls back to streaming") {
        for (std::int32_t status : {405, 501}) {
            auto info = CapabilityProber::interpret(head_response(status, {}));
            REQUIRE(info.has_value());
            CHECK(!info->total_size.has_value());
            CHECK(!info->supports_range);
        }
    }

    SECTION("Error statuses") {
        CHECK(CapabilityProber::interpret(head_response(404, {})).error() == TransferErrc::not_found);
        CHECK(CapabilityProber::interpret(head_response(403, {})).error() == TransferErrc::permission_denied);
        CHECK(CapabilityProber::interpret(head_response(401, {})).error() == TransferErrc::permission_denied);
        CHECK(CapabilityProber::interpret(head_response(503, {})).error() == TransferErrc::server_error);
        CHECK(CapabilityProber::interpret(head_response(302, {})).error() == TransferErrc::unexpected_status);
    }
}

TEST_CASE("CapabilityProber::probe retries transient faults", "[prober]") {
    FakeHttpClient client(make_body(5000));

    SECTION("Recovers within the attempt budget") {
        client.head_errors = {make_error_code(TransferErrc::timeout), make_error_code(TransferErrc::network_error)};
        CapabilityProber prober(client, 3, fast_retry());
        auto info = prober.probe("http://example.com/file");
        REQUIRE(info.has_value());
        CHECK(info->total_size == 5000u);
        CHECK(client.head_calls.load() == 3);
    }

    SECTION("Gives up after the attempt budget") {
        client.head_errors = {make_error_code(TransferErrc::refused), make_error_code(TransferErrc::refused),
                              make_error_code(TransferErrc::refused), make_error_code(TransferErrc::refused)};
        CapabilityProber prober(client, 3, fast_retry());
        auto info = prober.probe("http://example.com/file");
        REQUIRE(!info.has_value());
        CHECK(info.error() == TransferErrc::refused);
        CHECK(client.head_calls.load() == 3);
    }

    SECTION("Does not retry client errors") {
        client.head_status = 404;
        CapabilityProber prober(client, 3, fast_retry());
        auto info = prober.probe("http://example.com/file");
        REQUIRE(!info.has_value());
        CHECK(info.error() == TransferErrc::not_found);
        CHECK(client.head_calls.load() == 1);
    }

    SECTION("Retries server errors") {
        client.head_status = 503;
        CapabilityProber prober(client, 3, fast_retry());
        auto info = prober.probe("http://example.com/file");
        REQUIRE(!info.has_value());
        CHECK(info.error() == TransferErrc::server_error);
        CHECK(client.head_calls.load() == 3);
    }

    SECTION("Stops when cancelled") {
        std::stop_source stop;
        stop.request_stop();
        CapabilityProber prober(client, 3, fast_retry());
        auto info = prober.probe("http://example.com/file", stop.get_token());
        REQUIRE(!info.has_value());
        CHECK(info.error() == TransferErrc::cancelled);
    }
}
