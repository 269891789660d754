#include <catch2/catch_test_macros.hpp>
#include <stepwise/debug/debug_session.hpp>
#include <stepwise/runtime/block_on.hpp>
#include <stepwise/runtime/scheduler.hpp>

#include <memory>
#include <string>
#include "../test_main.cpp"
#include "../support/toy_interpreter.hpp"

using namespace stepwise;
using namespace stepwise::debug;
using namespace stepwise::test;
using runtime::block_on;

namespace {

std::shared_ptr<debug_session> make_session(runtime::scheduler& sched, session_config config = {}) {
    return std::make_shared<debug_session>("test-session", std::move(config), sched);
}

} // namespace

TEST_CASE("debug_session lifecycle", "[debug][session]") {
    runtime::scheduler sched(2);
    sched.start();
    auto session = make_session(sched);

    REQUIRE(session->state() == session_state::initialized);
    auto early = block_on(sched, session->continue_execution());
    REQUIRE(early.error() == debug_errc::invalid_state);
    REQUIRE(block_on(sched, session->step_over()).error() == debug_errc::invalid_state);

    REQUIRE(block_on(sched, session->initialize("main.lua")).has_value());
    REQUIRE(session->state() == session_state::running);
    REQUIRE(session->metadata().script_path == "main.lua");
    REQUIRE(block_on(sched, session->initialize("main.lua")).error() == debug_errc::invalid_state);

    REQUIRE(block_on(sched, session->terminate()).has_value());
    REQUIRE(session->state() == session_state::terminated);
    REQUIRE(block_on(sched, session->terminate()).has_value());

    REQUIRE(block_on(sched, session->continue_execution()).error() == debug_errc::invalid_state);
    REQUIRE(block_on(sched, session->run()).error() == debug_errc::invalid_state);
    REQUIRE(block_on(sched, session->set_breakpoint("main.lua", 1)).error() == debug_errc::invalid_state);
    REQUIRE(block_on(sched, session->initialize("other.lua")).error() == debug_errc::invalid_state);
}

TEST_CASE("debug_session breakpoint management", "[debug][session]") {
    runtime::scheduler sched(2);
    sched.start();
    auto session = make_session(sched);

    auto id = block_on(sched, session->set_breakpoint("main.lua", 4, "i > 2"));
    REQUIRE(id.has_value());
    auto other = block_on(sched, session->set_breakpoint("main.lua", 9, std::nullopt, 5));
    REQUIRE(other.has_value());

    auto bps = block_on(sched, session->list_breakpoints());
    REQUIRE(bps.size() == 2);
    REQUIRE(session->gate().might_break_at("main.lua", 4));

    REQUIRE(block_on(sched, session->set_breakpoint("main.lua", 0)).error() == debug_errc::not_found);
    REQUIRE(block_on(sched, session->set_breakpoint("main.lua", 5, "i >")).error() ==
            debug_errc::evaluation_error);

    REQUIRE(block_on(sched, session->remove_breakpoint(*id)).has_value());
    REQUIRE(block_on(sched, session->remove_breakpoint(*id)).error() == debug_errc::not_found);
    REQUIRE_FALSE(session->gate().might_break_at("main.lua", 4));
    REQUIRE(block_on(sched, session->list_breakpoints()).size() == 1);
}

TEST_CASE("debug_session inspects a paused interpreter", "[debug][session]") {
    runtime::scheduler sched(2);
    sched.start();
    auto session = make_session(sched);
    REQUIRE(block_on(sched, session->initialize("main.lua")).has_value());
    REQUIRE(block_on(sched, session->set_breakpoint("main.lua", 2)).has_value());

    toy_interpreter interp(session->coordinator(), two_function_program());
    interp.start();

    auto paused = block_on(sched, session->wait_for_pause(scaled_ms(2000)));
    REQUIRE(paused.has_value());
    REQUIRE(paused->paused_info()->location.line == 2);
    REQUIRE(session->state() == session_state::paused);

    auto stack = block_on(sched, session->get_stack_trace());
    REQUIRE(stack.has_value());
    REQUIRE(stack->size() == 1);
    REQUIRE(stack->front().name == "main");

    auto vars = block_on(sched, session->get_variables());
    REQUIRE(vars.has_value());
    REQUIRE(vars->size() == 1);
    REQUIRE(vars->front().value == "1");
    REQUIRE(block_on(sched, session->get_variables("7")).error() == debug_errc::not_found);

    auto sum = block_on(sched, session->evaluate("x + 1"));
    REQUIRE(sum.has_value());
    REQUIRE(sum->value == "2");
    REQUIRE(sum->type == "number");
    REQUIRE(block_on(sched, session->evaluate("nope * 2")).error() == debug_errc::evaluation_error);

    auto seen = session->inspector().inspect_variables({"x", "y"});
    REQUIRE(seen.has_value());
    REQUIRE(seen->at("x").value == "1");
    REQUIRE(seen->at("y").value == "<unavailable>");

    REQUIRE(session->add_watch("x * 10"));
    REQUIRE_FALSE(session->add_watch("x * 10"));
    REQUIRE(session->add_watch("x +"));
    auto watches = block_on(sched, session->evaluate_watches());
    REQUIRE(watches.size() == 2);
    REQUIRE(watches[0].value == "10");
    REQUIRE(watches[1].type == "error");
    REQUIRE(watches[1].value.starts_with("<error: "));

    REQUIRE(block_on(sched, session->step_over()).has_value());
    REQUIRE(session->inspector().cached_count() == 0);
    REQUIRE(session->metadata().steps_executed == 1);

    auto stepped = block_on(sched, session->wait_for_pause(scaled_ms(2000)));
    REQUIRE(stepped.has_value());
    REQUIRE(stepped->paused_info()->location.line == 3);
    REQUIRE(stepped->paused_info()->reason.kind == pause_kind::step);

    REQUIRE(block_on(sched, session->continue_execution()).has_value());
    interp.join();
    REQUIRE(interp.result() == toy_interpreter::outcome::completed);

    // breakpoint_hit, paused, resumed, paused, resumed, terminated
    REQUIRE(session->process_events() == 6);
    REQUIRE(session->process_events() == 0);
    REQUIRE(session->metadata().breakpoints_hit == 1);
    REQUIRE(session->state() == session_state::terminated);
}

TEST_CASE("debug_session watches outside a pause", "[debug][session]") {
    runtime::scheduler sched(2);
    sched.start();

    SECTION("not paused") {
        auto session = make_session(sched);
        session->add_watch("x");
        auto watches = block_on(sched, session->evaluate_watches());
        REQUIRE(watches.size() == 1);
        REQUIRE(watches[0].value == "<unavailable>");
        REQUIRE(session->remove_watch("x"));
        REQUIRE_FALSE(session->remove_watch("x"));
        REQUIRE(session->watch_expressions().empty());
    }

    SECTION("watches disabled") {
        auto session = make_session(sched, session_config{.stop_on_entry = true, .enable_watch = false});
        REQUIRE(block_on(sched, session->initialize("main.lua")).has_value());
        toy_interpreter interp(session->coordinator(), counting_program(2));
        interp.start();

        auto paused = block_on(sched, session->wait_for_pause(scaled_ms(2000)));
        REQUIRE(paused.has_value());
        REQUIRE(paused->paused_info()->reason.kind == pause_kind::entry);

        session->add_watch("i");
        auto watches = block_on(sched, session->evaluate_watches());
        REQUIRE(watches[0].value == "<unavailable>");

        REQUIRE(block_on(sched, session->continue_execution()).has_value());
        interp.join();
    }
}

TEST_CASE("debug_session wait_for_pause gives up", "[debug][session]") {
    runtime::scheduler sched(2);
    sched.start();
    auto session = make_session(sched);
    REQUIRE(block_on(sched, session->initialize("main.lua")).has_value());

    auto r = block_on(sched, session->wait_for_pause(std::chrono::milliseconds(20)));
    REQUIRE(r.error() == debug_errc::timeout);

    REQUIRE(block_on(sched, session->terminate()).has_value());
    auto after = block_on(sched, session->wait_for_pause(std::chrono::milliseconds(20)));
    REQUIRE(after.error() == debug_errc::invalid_state);
}

TEST_CASE("debug_session pause command", "[debug][session]") {
    runtime::scheduler sched(2);
    sched.start();
    auto session = make_session(sched);
    REQUIRE(block_on(sched, session->initialize("main.lua")).has_value());
    REQUIRE(block_on(sched, session->pause()).has_value());
    REQUIRE(session->gate().is_pause_requested());

    toy_interpreter interp(session->coordinator(), counting_program(3));
    interp.start();
    auto paused = block_on(sched, session->wait_for_pause(scaled_ms(2000)));
    REQUIRE(paused.has_value());
    REQUIRE(paused->paused_info()->reason.kind == pause_kind::pause);
    REQUIRE(paused->paused_info()->location.line == 1);

    REQUIRE(block_on(sched, session->continue_execution()).has_value());
    interp.join();
}

TEST_CASE("debug_session event pump", "[debug][session]") {
    runtime::scheduler sched(2);
    sched.start();
    auto session = make_session(sched);
    session->start_event_pump();
    REQUIRE(block_on(sched, session->initialize("main.lua")).has_value());
    REQUIRE(block_on(sched, session->set_breakpoint("main.lua", 1)).has_value());

    toy_interpreter interp(session->coordinator(), counting_program(2));
    interp.start();
    REQUIRE(block_on(sched, session->wait_for_pause(scaled_ms(2000))).has_value());
    REQUIRE(block_on(sched, session->continue_execution()).has_value());
    interp.join();

    // breakpoint_hit, paused, resumed, terminated
    REQUIRE(wait_until([&] { return session->events_seen() == 4; }, scaled_ms(2000)));
    REQUIRE(session->metadata().breakpoints_hit == 1);
    REQUIRE(session->process_events() == 0);
}

TEST_CASE("debug_session teardown releases the interpreter", "[debug][session]") {
    runtime::scheduler sched(2);
    sched.start();
    auto session = make_session(sched);
    REQUIRE(block_on(sched, session->initialize("main.lua")).has_value());
    REQUIRE(block_on(sched, session->set_breakpoint("main.lua", 1)).has_value());

    toy_interpreter interp(session->coordinator(), counting_program(3));
    interp.start();
    REQUIRE(block_on(sched, session->wait_for_pause(scaled_ms(2000))).has_value());

    session.reset();
    interp.join();
    REQUIRE(interp.result() == toy_interpreter::outcome::terminated);
    REQUIRE(interp.trace() == std::vector<uint32_t>{1});
}
