#include <catch2/catch_test_macros.hpp>
#include <stepwise/debug/debug_session.hpp>
#include <stepwise/runtime/block_on.hpp>
#include <stepwise/runtime/scheduler.hpp>

#include <memory>
#include <vector>
#include "../test_main.cpp"  // For scaled timeouts
#include "../support/toy_interpreter.hpp"

using namespace stepwise;
using namespace stepwise::debug;
using namespace stepwise::test;

namespace {

/// Location of the pause the session is waiting on, or nothing if the
/// script ended first
coro::task<std::optional<execution_location>> next_stop(debug_session& session) {
    auto state = co_await session.wait_for_pause(scaled_ms(2000));
    if (!state) {
        co_return std::nullopt;
    }
    co_return state->paused_info()->location;
}

} // namespace

TEST_CASE("Step over, into and out across a call", "[integration][stepping]") {
    runtime::scheduler sched(2);
    sched.start();
    auto session = std::make_shared<debug_session>("stepping", session_config{}, sched);

    auto setup = [&]() -> coro::task<debug_result<uint64_t>> {
        auto init = co_await session->initialize("main.lua");
        if (!init) {
            co_return std::unexpected(init.error());
        }
        co_return co_await session->set_breakpoint("main.lua", 2);
    };
    REQUIRE(runtime::block_on(sched, setup()).has_value());

    toy_interpreter interp(session->coordinator(), two_function_program());
    interp.start();

    auto client = [&]() -> coro::task<std::vector<std::optional<execution_location>>> {
        std::vector<std::optional<execution_location>> stops;
        stops.push_back(co_await next_stop(*session));

        if (co_await session->step_into()) {
            stops.push_back(co_await next_stop(*session));
        }
        if (co_await session->step_out()) {
            stops.push_back(co_await next_stop(*session));
        }
        auto resumed = co_await session->continue_execution();
        if (!resumed) {
            STEPWISE_LOG_ERROR("continue failed: {}", resumed.error().to_string());
        }
        co_return stops;
    };
    auto stops = runtime::block_on(sched, client());
    interp.join();

    REQUIRE(stops.size() == 3);
    REQUIRE(stops[0] == execution_location{"main.lua", 2});
    REQUIRE(stops[1] == execution_location{"helper.lua", 10});
    REQUIRE(stops[2] == execution_location{"main.lua", 3});
    REQUIRE(session->metadata().steps_executed == 2);
    REQUIRE(interp.result() == toy_interpreter::outcome::completed);
    // x and y assigned, helper ran in full
    REQUIRE(interp.trace() == std::vector<uint32_t>{1, 2, 10, 11, 3});

    sched.shutdown();
}

TEST_CASE("Step over from the breakpoint lands on the next line", "[integration][stepping]") {
    runtime::scheduler sched(2);
    sched.start();
    auto session = std::make_shared<debug_session>("stepping", session_config{}, sched);
    REQUIRE(runtime::block_on(sched, session->initialize("main.lua")).has_value());
    REQUIRE(runtime::block_on(sched, session->set_breakpoint("main.lua", 2)).has_value());

    toy_interpreter interp(session->coordinator(), two_function_program());
    interp.start();

    auto first = runtime::block_on(sched, session->wait_for_pause(scaled_ms(2000)));
    REQUIRE(first.has_value());

    REQUIRE(runtime::block_on(sched, session->step_over()).has_value());
    auto second = runtime::block_on(sched, session->wait_for_pause(scaled_ms(2000)));
    REQUIRE(second.has_value());
    REQUIRE(second->paused_info()->location == execution_location{"main.lua", 3});
    REQUIRE(second->paused_info()->reason.kind == pause_kind::step);
    REQUIRE(session->metadata().steps_executed == 1);

    // The callee ran while stepping over it
    auto trace = interp.trace();
    REQUIRE(trace == std::vector<uint32_t>{1, 2, 10, 11, 3});

    REQUIRE(runtime::block_on(sched, session->continue_execution()).has_value());
    interp.join();
    sched.shutdown();
}

TEST_CASE("Single-stepping a whole script from entry", "[integration][stepping]") {
    runtime::scheduler sched(2);
    sched.start();
    auto session = std::make_shared<debug_session>("walk", session_config{.stop_on_entry = true}, sched);
    REQUIRE(runtime::block_on(sched, session->initialize("main.lua")).has_value());

    toy_interpreter interp(session->coordinator(), counting_program(5));
    interp.start();

    auto walk = [&]() -> coro::task<std::vector<uint32_t>> {
        std::vector<uint32_t> lines;
        while (auto at = co_await next_stop(*session)) {
            lines.push_back(at->line);
            auto r = co_await session->step_over();
            if (!r) {
                break;
            }
        }
        co_return lines;
    };
    auto lines = runtime::block_on(sched, walk());
    interp.join();

    REQUIRE(lines == std::vector<uint32_t>{1, 2, 3, 4, 5});
    REQUIRE(session->metadata().steps_executed == 5);
    REQUIRE(interp.result() == toy_interpreter::outcome::completed);
    REQUIRE(session->state() == session_state::terminated);

    sched.shutdown();
}

TEST_CASE("Step out of the main chunk runs to completion", "[integration][stepping]") {
    runtime::scheduler sched(2);
    sched.start();
    auto session = std::make_shared<debug_session>("out", session_config{.stop_on_entry = true}, sched);
    REQUIRE(runtime::block_on(sched, session->initialize("main.lua")).has_value());

    toy_interpreter interp(session->coordinator(), two_function_program());
    interp.start();
    REQUIRE(runtime::block_on(sched, session->wait_for_pause(scaled_ms(2000))).has_value());

    REQUIRE(runtime::block_on(sched, session->step_out()).has_value());
    interp.join();
    REQUIRE(interp.result() == toy_interpreter::outcome::completed);
    REQUIRE(interp.trace() == std::vector<uint32_t>{1, 2, 10, 11, 3});

    sched.shutdown();
}
