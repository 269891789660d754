#include <stepwise/stepwise.hpp>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>

using namespace stepwise;

// sum.lua, as the hooks see it:
//   1  local total = 0
//   2  for i = 1, 5 do
//   3    total = total + square(i)
//   4  end
//   5  print(total)
// square.lua:
//  10  return n * n
class sum_script {
public:
    explicit sum_script(std::shared_ptr<debug::debug_coordinator> coordinator)
        : coordinator_(std::move(coordinator)) {}

    void run() {
        if (!line(1, 1)) return finish();
        set("total", 0);
        for (int i = 1; i <= 5; ++i) {
            set("i", i);
            if (!line(2, 1) || !line(3, 1)) return finish();
            int sq = 0;
            if (!square(i, sq)) return finish();
            set("total", get("total") + sq);
            if (!line(4, 1)) return finish();
        }
        if (!line(5, 1)) return finish();
        std::cout << "[script] total = " << get("total") << std::endl;
        finish();
    }

private:
    bool square(int n, int& out) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callee_.emplace(std::map<std::string, double>{{"n", n}});
        }
        bool ok = at("square.lua", 10, 2);
        out = n * n;
        std::lock_guard<std::mutex> lock(mutex_);
        callee_.reset();
        return ok;
    }

    bool line(uint32_t n, uint32_t depth) { return at("sum.lua", n, depth); }

    bool at(const std::string& source, uint32_t n, uint32_t depth) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current_line_ = n;
        }
        if (!coordinator_->execution()->gate().should_stop(source, n)) {
            return true;
        }
        auto action = coordinator_->on_line({source, n}, {.depth = depth, .state_epoch = epoch_},
                                            [this] { return capture(); });
        return action == debug::resume_action::proceed;
    }

    debug::pause_snapshot capture() {
        std::lock_guard<std::mutex> lock(mutex_);
        debug::pause_snapshot snap;
        if (callee_) {
            debug::stack_frame f{.id = "2", .name = "square", .source = "square.lua", .line = 10};
            for (const auto& [name, v] : *callee_) f.locals.push_back(number(name, v));
            snap.frames.push_back(std::move(f));
        }
        debug::stack_frame main{.id = "1", .name = "main", .source = "sum.lua", .line = callee_ ? 3 : current_line_};
        for (const auto& [name, v] : locals_) main.locals.push_back(number(name, v));
        snap.frames.push_back(std::move(main));
        return snap;
    }

    static debug::variable number(const std::string& name, double v) {
        debug::value val(v);
        return {.name = name, .value = val.render(), .type = std::string(val.type_name())};
    }

    void set(const std::string& name, double v) {
        std::lock_guard<std::mutex> lock(mutex_);
        locals_[name] = v;
        ++epoch_;
    }

    double get(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return locals_[name];
    }

    void finish() { coordinator_->on_finished(); }

    std::shared_ptr<debug::debug_coordinator> coordinator_;
    std::mutex mutex_;
    std::map<std::string, double> locals_;
    std::optional<std::map<std::string, double>> callee_;
    uint32_t current_line_ = 0;
    uint64_t epoch_ = 0;
};

coro::task<void> show_pause(debug::debug_session& session) {
    auto stack = co_await session.get_stack_trace();
    if (!stack) {
        std::cout << "  (no stack: " << stack.error().to_string() << ")" << std::endl;
        co_return;
    }
    std::cout << debug::stack_navigator::format_stack_trace(*stack, 0);
    auto vars = debug::stack_navigator::get_frame_variables(stack->front());
    for (const auto& v : vars) {
        std::cout << "    " << v.name << " = " << v.value << " (" << v.type << ")" << std::endl;
    }
    for (const auto& w : co_await session.evaluate_watches()) {
        std::cout << "    watch " << w.name << " = " << w.value << std::endl;
    }
}

coro::task<int> debug_client(debug::debug_session& session, std::thread& interpreter) {
    if (auto r = co_await session.initialize("sum.lua"); !r) {
        STEPWISE_LOG_ERROR("initialize: {}", r.error().to_string());
        co_return 1;
    }
    auto bp = co_await session.set_breakpoint("sum.lua", 3, "i == 3");
    if (!bp) {
        STEPWISE_LOG_ERROR("set_breakpoint: {}", bp.error().to_string());
        co_return 1;
    }
    session.add_watch("total * 2");

    interpreter = std::thread([&session] { sum_script(session.coordinator()).run(); });

    auto paused = co_await session.wait_for_pause();
    if (!paused) {
        STEPWISE_LOG_ERROR("no pause: {}", paused.error().to_string());
        co_return 1;
    }
    std::cout << "Paused: " << paused->to_string() << std::endl;
    co_await show_pause(session);

    std::cout << "\n-- step into --" << std::endl;
    if (auto r = co_await session.step_into(); !r) {
        STEPWISE_LOG_ERROR("step_into: {}", r.error().to_string());
        co_return 1;
    }
    if (auto s = co_await session.wait_for_pause(); s) {
        std::cout << "Paused: " << s->to_string() << std::endl;
        co_await show_pause(session);
    }

    std::cout << "\n-- step out --" << std::endl;
    if (auto r = co_await session.step_out(); !r) {
        STEPWISE_LOG_ERROR("step_out: {}", r.error().to_string());
        co_return 1;
    }
    if (auto s = co_await session.wait_for_pause(); s) {
        std::cout << "Paused: " << s->to_string() << std::endl;
        auto sq = co_await session.evaluate("total - 5");
        if (sq) {
            std::cout << "  total - 5 = " << sq->value << std::endl;
        }
    }

    if (auto r = co_await session.continue_execution(); !r) {
        STEPWISE_LOG_ERROR("continue: {}", r.error().to_string());
        co_return 1;
    }
    co_return 0;
}

int main() {
    log::logger::instance().set_level(log::level::info);

    std::cout << "=== stepwise toy debugger ===" << std::endl;

    runtime::scheduler sched(2);
    sched.start();

    debug::session_manager sessions(sched);
    auto id = sessions.create_session(debug::session_config{.script_path = "sum.lua"});
    if (!id) {
        std::cerr << id.error().to_string() << std::endl;
        return 1;
    }
    auto session = *sessions.get_session(*id);

    std::thread interpreter;
    int rc = runtime::block_on(sched, debug_client(*session, interpreter));
    if (rc != 0) {
        // Releases the script if the client bailed out mid-pause
        if (auto r = runtime::block_on(sched, session->terminate()); !r) {
            STEPWISE_LOG_ERROR("terminate: {}", r.error().to_string());
        }
    }
    if (interpreter.joinable()) {
        interpreter.join();
    }

    session->process_events();
    auto meta = session->metadata();
    std::cout << "Session " << session->id() << ": " << meta.breakpoints_hit << " breakpoint hit(s), "
              << meta.steps_executed << " step(s), state " << debug::session_state_str(session->state())
              << std::endl;

    session.reset();
    runtime::block_on(sched, sessions.cleanup_terminated());
    sched.shutdown();

    std::cout << "=== Example completed ===" << std::endl;
    return rc;
}
