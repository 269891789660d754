#include <catch2/catch_test_macros.hpp>
#include <stepwise/debug/config.hpp>
#include <stepwise/log/logger.hpp>

#include <cstdlib>

using namespace stepwise::debug;

namespace {

/// Sets an environment variable for the lifetime of the guard
class scoped_env {
public:
    scoped_env(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~scoped_env() { ::unsetenv(name_); }

    scoped_env(const scoped_env&) = delete;
    scoped_env& operator=(const scoped_env&) = delete;

private:
    const char* name_;
};

} // namespace

TEST_CASE("session_config defaults", "[debug][config]") {
    session_config config;
    REQUIRE_FALSE(config.stop_on_entry);
    REQUIRE(config.stop_on_exception);
    REQUIRE(config.enable_conditions);
    REQUIRE(config.enable_watch);
    REQUIRE(config.max_stack_depth == 100);
    REQUIRE(config.operation_timeout() == std::chrono::milliseconds(5000));
    REQUIRE(config.pause_latency_budget() == std::chrono::milliseconds(10));
    REQUIRE(config.event_queue_capacity == 256);
    REQUIRE(config.script_path.empty());
}

TEST_CASE("session_config reads STEPWISE_* variables", "[debug][config]") {
    scoped_env entry("STEPWISE_STOP_ON_ENTRY", "true");
    scoped_env exception("STEPWISE_STOP_ON_EXCEPTION", "off");
    scoped_env conditions("STEPWISE_ENABLE_CONDITIONS", "0");
    scoped_env timeout("STEPWISE_OPERATION_TIMEOUT_MS", "250");
    scoped_env depth("STEPWISE_MAX_STACK_DEPTH", "12");
    scoped_env budget("STEPWISE_PAUSE_BUDGET_MS", "3");

    auto config = session_config::from_env();
    REQUIRE(config.stop_on_entry);
    REQUIRE_FALSE(config.stop_on_exception);
    REQUIRE_FALSE(config.enable_conditions);
    REQUIRE(config.operation_timeout_ms == 250);
    REQUIRE(config.max_stack_depth == 12);
    REQUIRE(config.pause_latency_budget_ms == 3);
}

TEST_CASE("session_config ignores malformed values", "[debug][config]") {
    scoped_env entry("STEPWISE_STOP_ON_ENTRY", "maybe");
    scoped_env timeout("STEPWISE_OPERATION_TIMEOUT_MS", "12ms");
    scoped_env depth("STEPWISE_MAX_STACK_DEPTH", "-4");

    auto config = session_config::from_env();
    REQUIRE_FALSE(config.stop_on_entry);
    REQUIRE(config.operation_timeout_ms == 5000);
    REQUIRE(config.max_stack_depth == 100);
}

TEST_CASE("session_config applies STEPWISE_LOG_LEVEL", "[debug][config]") {
    auto& log = stepwise::log::logger::instance();
    auto saved = log.get_level();

    {
        scoped_env level("STEPWISE_LOG_LEVEL", "error");
        session_config::from_env();
        REQUIRE(log.get_level() == stepwise::log::level::error);
    }
    {
        scoped_env level("STEPWISE_LOG_LEVEL", "loud");
        session_config::from_env();
        REQUIRE(log.get_level() == stepwise::log::level::error);
    }

    log.set_level(saved);
}
