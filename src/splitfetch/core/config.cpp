// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/core/config.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <sstream>

namespace splitfetch::core {

namespace {

template<typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

template<typename Duration>
void read_duration(const nlohmann::json& j, const char* key, Duration& out) {
    if (j.contains(key)) {
        out = Duration{j.at(key).get<typename Duration::rep>()};
    }
}

std::error_code validate(const EngineConfig& cfg) noexcept {
    if (cfg.worker_limit == 0 || cfg.pool_limit == 0 || cfg.probe_attempts == 0) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (cfg.worker_limit > MAX_WORKERS || cfg.pool_limit > MAX_WORKERS) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (cfg.retry.max_attempts == 0 || cfg.retry.multiplier < 1.0) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (cfg.retry.base_delay.count() < 0 || cfg.retry.max_delay < cfg.retry.base_delay) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (cfg.rate_window.count() <= 0) {
        return make_error_code(TransferErrc::invalid_config);
    }
    return {};
}

} // namespace

//=============================================================================
// RetryPolicy
//=============================================================================

std::chrono::milliseconds RetryPolicy::delay(std::uint32_t attempt) const noexcept {
    if (attempt <= 1) {
        return std::chrono::milliseconds{0};
    }

    // base * multiplier^(attempt - 2), capped
    double scaled = static_cast<double>(base_delay.count())
                  * std::pow(multiplier, static_cast<double>(attempt - 2));
    double capped = std::min(scaled, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(capped)};
}

bool RetryPolicy::wait_before(std::uint32_t attempt, std::stop_token stop) const {
    auto wait = delay(attempt);
    if (wait.count() > 0) {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::unique_lock lock(mutex);
        cv.wait_for(lock, stop, wait, [] { return false; });
    }
    return !stop.stop_requested();
}

//=============================================================================
// JSON loading
//=============================================================================

std::expected<EngineConfig, std::error_code>
parse_engine_config(std::string_view json) noexcept {
    EngineConfig cfg;

    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(TransferErrc::invalid_config));
        }

        read_key(j, "worker_limit", cfg.worker_limit);
        read_key(j, "pool_limit", cfg.pool_limit);
        read_key(j, "probe_attempts", cfg.probe_attempts);
        read_key(j, "fail_fast", cfg.fail_fast);
        read_duration(j, "rate_window_ms", cfg.rate_window);

        if (j.contains("retry")) {
            const auto& r = j.at("retry");
            read_key(r, "max_attempts", cfg.retry.max_attempts);
            read_duration(r, "base_delay_ms", cfg.retry.base_delay);
            read_duration(r, "max_delay_ms", cfg.retry.max_delay);
            read_key(r, "multiplier", cfg.retry.multiplier);
        }

        if (j.contains("http")) {
            const auto& h = j.at("http");
            read_duration(h, "connect_timeout_sec", cfg.http.connect_timeout);
            read_duration(h, "stall_timeout_sec", cfg.http.stall_timeout);
            read_key(h, "max_redirects", cfg.http.max_redirects);
            read_key(h, "verify_tls", cfg.http.verify_tls);
            read_key(h, "user_agent", cfg.http.user_agent);
        }
    } catch (const std::exception& e) {
        spdlog::error("Invalid engine configuration: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }

    if (auto ec = validate(cfg)) {
        return std::unexpected(ec);
    }
    return cfg;
}

std::expected<EngineConfig, std::error_code>
load_engine_config(const std::string& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            spdlog::error("Cannot open configuration file {}", path);
            return std::unexpected(make_error_code(TransferErrc::invalid_config));
        }

        std::ostringstream contents;
        contents << file.rdbuf();
        return parse_engine_config(contents.str());
    } catch (const std::exception& e) {
        spdlog::error("Cannot read configuration file {}: {}", path, e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }
}

} // namespace splitfetch::core
