#pragma once

#include <stepwise/log/macros.hpp>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace stepwise::debug {

/// Per-session debugger configuration
struct session_config {
    /// Pause before the first instrumented line
    bool stop_on_entry = false;
    /// Pause when the guest raises an error
    bool stop_on_exception = true;
    /// Evaluate breakpoint conditions (off = conditions are ignored)
    bool enable_conditions = true;
    bool enable_watch = true;
    /// Frames captured per pause
    size_t max_stack_depth = 100;
    /// Upper bound on one client round trip
    uint64_t operation_timeout_ms = 5000;

    /// Events buffered between coordinator and session before drops
    size_t event_queue_capacity = 256;
    /// Publish-to-block latency above which a pause counts as an SLO miss
    uint64_t pause_latency_budget_ms = 10;
    /// Script being debugged; sessions with the same path are exclusive
    std::string script_path;

    [[nodiscard]] std::chrono::milliseconds operation_timeout() const noexcept {
        return std::chrono::milliseconds(operation_timeout_ms);
    }

    [[nodiscard]] std::chrono::milliseconds pause_latency_budget() const noexcept {
        return std::chrono::milliseconds(pause_latency_budget_ms);
    }

    /// Defaults overlaid with STEPWISE_* environment variables
    static session_config from_env() {
        session_config config;
        config.apply_env();
        return config;
    }

    void apply_env() {
        if (auto v = env_bool("STEPWISE_STOP_ON_ENTRY")) stop_on_entry = *v;
        if (auto v = env_bool("STEPWISE_STOP_ON_EXCEPTION")) stop_on_exception = *v;
        if (auto v = env_bool("STEPWISE_ENABLE_CONDITIONS")) enable_conditions = *v;
        if (auto v = env_uint("STEPWISE_OPERATION_TIMEOUT_MS")) operation_timeout_ms = *v;
        if (auto v = env_uint("STEPWISE_MAX_STACK_DEPTH")) max_stack_depth = static_cast<size_t>(*v);
        if (auto v = env_uint("STEPWISE_PAUSE_BUDGET_MS")) pause_latency_budget_ms = *v;
        if (auto* v = std::getenv("STEPWISE_LOG_LEVEL")) {
            if (auto lvl = log::level_from_string(v)) {
                log::logger::instance().set_level(*lvl);
            } else {
                STEPWISE_LOG_WARNING("ignoring STEPWISE_LOG_LEVEL={}", v);
            }
        }
    }

private:
    static std::optional<bool> env_bool(const char* name) {
        const char* raw = std::getenv(name);
        if (raw == nullptr) return std::nullopt;
        std::string_view v(raw);
        if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
        if (v == "0" || v == "false" || v == "no" || v == "off") return false;
        STEPWISE_LOG_WARNING("ignoring {}={}: expected a boolean", name, v);
        return std::nullopt;
    }

    static std::optional<uint64_t> env_uint(const char* name) {
        const char* raw = std::getenv(name);
        if (raw == nullptr) return std::nullopt;
        std::string_view v(raw);
        uint64_t out = 0;
        auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
        if (ec != std::errc{} || ptr != v.data() + v.size()) {
            STEPWISE_LOG_WARNING("ignoring {}={}: expected an unsigned integer", name, v);
            return std::nullopt;
        }
        return out;
    }
};

} // namespace stepwise::debug
