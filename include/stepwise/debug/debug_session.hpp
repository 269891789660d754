#pragma once

#include "config.hpp"
#include "debug_coordinator.hpp"
#include "error.hpp"
#include "execution_manager.hpp"
#include "expression.hpp"
#include "script_debugger.hpp"
#include "types.hpp"
#include "variable_inspector.hpp"
#include <stepwise/coro/task.hpp>
#include <stepwise/log/macros.hpp>
#include <stepwise/runtime/scheduler.hpp>
#include <stepwise/sync/channel.hpp>
#include <stepwise/time/timer.hpp>
#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stepwise::debug {

enum class session_state : uint8_t {
    initialized,
    running,
    paused,
    terminated
};

constexpr const char* session_state_str(session_state state) noexcept {
    switch (state) {
        case session_state::initialized: return "initialized";
        case session_state::running:     return "running";
        case session_state::paused:      return "paused";
        case session_state::terminated:  return "terminated";
        default:                         return "unknown";
    }
}

struct session_metadata {
    std::string script_path;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point last_activity;
    uint64_t breakpoints_hit = 0;
    uint64_t steps_executed = 0;
};

/// One client's view of one debuggee.
///
/// Owns the engine pair for the script (execution_manager and
/// debug_coordinator) and drives it only through the script_debugger
/// interface. Commands are coroutines and must run on `sched`; the
/// interpreter thread talks to gate() and coordinator() directly.
/// Sessions are meant to be held by std::shared_ptr.
class debug_session : public std::enable_shared_from_this<debug_session> {
public:
    debug_session(std::string id, session_config config, runtime::scheduler& sched,
                  std::shared_ptr<const expression_evaluator> evaluator = std::make_shared<simple_evaluator>())
        : id_(std::move(id))
        , config_(std::move(config))
        , sched_(sched) {
        auto exec = std::make_shared<execution_manager>(std::make_shared<fast_path_gate>(),
                                                        std::make_shared<condition_cache>(),
                                                        std::move(evaluator));
        coordinator_ = std::make_shared<debug_coordinator>(std::move(exec), config_);
        debugger_ = std::make_shared<engine_debugger>(coordinator_);
        inspector_ = std::make_unique<variable_inspector>(debugger_, sched_);

        auto now = std::chrono::system_clock::now();
        meta_.script_path = config_.script_path;
        meta_.started_at = now;
        meta_.last_activity = now;
    }

    /// Dropping the session releases an interpreter blocked in pause()
    ~debug_session() {
        coordinator_->detach();
    }

    debug_session(const debug_session&) = delete;
    debug_session& operator=(const debug_session&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const session_config& config() const noexcept { return config_; }

    /// Initialized until initialize(); afterwards follows the engine state
    [[nodiscard]] session_state state() const {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (terminated_) return session_state::terminated;
            if (!initialized_) return session_state::initialized;
        }
        auto s = coordinator_->execution()->get_state();
        if (s.is_paused()) return session_state::paused;
        if (s.is_terminated()) return session_state::terminated;
        return session_state::running;
    }

    [[nodiscard]] session_metadata metadata() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return meta_;
    }

    // Interpreter-side wiring

    [[nodiscard]] fast_path_gate& gate() noexcept { return coordinator_->execution()->gate(); }
    [[nodiscard]] const std::shared_ptr<debug_coordinator>& coordinator() const noexcept { return coordinator_; }
    [[nodiscard]] std::shared_ptr<script_debugger> debugger() const noexcept { return debugger_; }
    [[nodiscard]] variable_inspector& inspector() noexcept { return *inspector_; }

    // Client commands

    /// Initialized -> Running; arms a stop on the first line if stop_on_entry
    coro::task<debug_result<void>> initialize(std::string script_ref) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (initialized_ || terminated_) {
                co_return make_error(debug_errc::invalid_state, "session {} already initialized", id_);
            }
            initialized_ = true;
            meta_.script_path = script_ref;
            touch_locked();
        }
        if (config_.stop_on_entry) {
            coordinator_->arm_entry();
        }
        STEPWISE_SESSION_LOG(::stepwise::log::level::info, id_, "debugging {}", script_ref);
        co_return debug_result<void>{};
    }

    coro::task<debug_result<void>> continue_execution() {
        co_return co_await resume_with(debug_command::continue_);
    }

    /// Same as continue_execution()
    coro::task<debug_result<void>> run() {
        return continue_execution();
    }

    coro::task<debug_result<void>> pause() {
        if (auto err = require_started()) {
            co_return std::unexpected(std::move(*err));
        }
        touch();
        co_return co_await debugger_->send_command(debug_command::pause);
    }

    coro::task<debug_result<void>> step_into() {
        co_return co_await resume_with(debug_command::step_into);
    }

    coro::task<debug_result<void>> step_over() {
        co_return co_await resume_with(debug_command::step_over);
    }

    coro::task<debug_result<void>> step_out() {
        co_return co_await resume_with(debug_command::step_out);
    }

    coro::task<debug_result<uint64_t>> set_breakpoint(std::string source, uint32_t line,
                                                      std::optional<std::string> condition = std::nullopt,
                                                      std::optional<uint32_t> hit_count = std::nullopt) {
        if (is_terminated()) {
            co_return make_error(debug_errc::invalid_state, "session {} is terminated", id_);
        }
        breakpoint bp(std::move(source), line);
        bp.condition = std::move(condition);
        bp.hit_count = hit_count;
        std::vector<breakpoint> batch;
        batch.push_back(std::move(bp));
        auto ids = co_await debugger_->set_breakpoints(std::move(batch));
        touch();
        if (!ids) {
            co_return std::unexpected(ids.error());
        }
        co_return ids->front();
    }

    coro::task<debug_result<void>> remove_breakpoint(uint64_t id) {
        if (is_terminated()) {
            co_return make_error(debug_errc::invalid_state, "session {} is terminated", id_);
        }
        touch();
        co_return co_await debugger_->remove_breakpoint(id);
    }

    coro::task<std::vector<breakpoint>> list_breakpoints() {
        co_return co_await debugger_->list_breakpoints();
    }

    coro::task<debug_result<std::vector<stack_frame>>> get_stack_trace() {
        touch();
        co_return co_await debugger_->get_stack_trace();
    }

    coro::task<debug_result<std::vector<variable>>> get_variables(std::optional<std::string> frame_id = std::nullopt) {
        touch();
        co_return co_await debugger_->get_variables(std::move(frame_id));
    }

    coro::task<debug_result<variable>> evaluate(std::string expression,
                                                std::optional<std::string> frame_id = std::nullopt) {
        touch();
        co_return co_await debugger_->evaluate(std::move(expression), std::move(frame_id));
    }

    /// Returns false if the expression was already watched
    bool add_watch(std::string expression) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::find(watches_.begin(), watches_.end(), expression) != watches_.end()) {
            return false;
        }
        watches_.push_back(std::move(expression));
        touch_locked();
        return true;
    }

    bool remove_watch(const std::string& expression) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(watches_.begin(), watches_.end(), expression);
        if (it == watches_.end()) {
            return false;
        }
        watches_.erase(it);
        touch_locked();
        return true;
    }

    [[nodiscard]] std::vector<std::string> watch_expressions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return watches_;
    }

    /// Every watch against the current top frame. While not paused (or
    /// with watches disabled) each value is `<unavailable>`; a failing
    /// expression yields `<error: ...>` instead of failing the batch.
    coro::task<std::vector<variable>> evaluate_watches() {
        auto exprs = watch_expressions();
        std::vector<variable> out;
        out.reserve(exprs.size());
        bool live = config_.enable_watch && state() == session_state::paused;
        for (auto& expr : exprs) {
            if (!live) {
                out.push_back(variable{.name = expr, .value = "<unavailable>", .type = "unavailable"});
                continue;
            }
            auto result = co_await debugger_->evaluate(expr, std::nullopt);
            if (result) {
                out.push_back(std::move(*result));
            } else {
                out.push_back(variable{.name = expr,
                                       .value = fmt::format("<error: {}>", result.error().message),
                                       .type = "error"});
            }
        }
        co_return out;
    }

    /// Running or Paused -> Terminated. Repeating it is harmless.
    coro::task<debug_result<void>> terminate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (terminated_) {
                co_return debug_result<void>{};
            }
            terminated_ = true;
            touch_locked();
        }
        auto r = co_await debugger_->send_command(debug_command::terminate);
        inspector_->invalidate_cache();
        STEPWISE_SESSION_LOG(::stepwise::log::level::info, id_, "terminated");
        co_return r;
    }

    /// Wait until the engine reports a pause (or the timeout passes)
    coro::task<debug_result<debug_state>> wait_for_pause(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        auto exec = coordinator_->execution();
        while (true) {
            auto s = exec->get_state();
            if (s.is_paused()) {
                co_return s;
            }
            if (s.is_terminated() || is_terminated()) {
                co_return make_error(debug_errc::invalid_state, "session {} terminated while waiting", id_);
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                co_return make_error(debug_errc::timeout, "no pause within {} ms", timeout.count());
            }
            co_await time::sleep_for(poll_interval);
        }
    }

    coro::task<debug_result<debug_state>> wait_for_pause() {
        return wait_for_pause(config_.operation_timeout());
    }

    // Events

    /// Bookkeeping for one coordinator event
    void handle_event(const debug_event& event) {
        bool resumed = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            switch (event.kind) {
                case event_kind::breakpoint_hit:
                    ++meta_.breakpoints_hit;
                    break;
                case event_kind::resumed:
                    resumed = true;
                    break;
                case event_kind::terminated:
                    terminated_ = true;
                    break;
                case event_kind::paused:
                    break;
            }
            ++events_seen_;
            touch_locked();
        }
        if (resumed) {
            inspector_->invalidate_cache();
        }
        STEPWISE_LOG_DEBUG("session {} event {}", id_, event_kind_str(event.kind));
    }

    /// Drain whatever is queued; returns how many events were handled.
    /// Safe to call with nothing pending.
    size_t process_events() {
        auto events = coordinator_->events();
        size_t handled = 0;
        while (auto ev = events->try_recv()) {
            handle_event(*ev);
            ++handled;
        }
        return handled;
    }

    /// Push-based alternative to process_events(): handle events on `sched`
    /// as they arrive, until the coordinator detaches.
    void start_event_pump() {
        sched_.spawn(event_pump(weak_from_this(), coordinator_->events()).release());
    }

    [[nodiscard]] uint64_t events_seen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_seen_;
    }

    static constexpr std::chrono::milliseconds poll_interval{2};

private:
    coro::task<debug_result<void>> resume_with(debug_command command) {
        if (auto err = require_started()) {
            co_return std::unexpected(std::move(*err));
        }
        bool is_step = command != debug_command::continue_;
        auto r = co_await debugger_->send_command(command);
        if (r) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (is_step) {
                ++meta_.steps_executed;
            }
            touch_locked();
        }
        // Cached values belonged to the pause we just left
        inspector_->invalidate_cache();
        co_return r;
    }

    static coro::task<void> event_pump(std::weak_ptr<debug_session> weak,
                                       std::shared_ptr<sync::channel<debug_event>> events) {
        while (true) {
            auto ev = co_await events->recv();
            if (!ev) {
                break;
            }
            auto self = weak.lock();
            if (!self) {
                break;
            }
            self->handle_event(*ev);
        }
    }

    std::optional<debug_error> require_started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminated_) {
            return debug_error{debug_errc::invalid_state, fmt::format("session {} is terminated", id_)};
        }
        if (!initialized_) {
            return debug_error{debug_errc::invalid_state, fmt::format("session {} not initialized", id_)};
        }
        return std::nullopt;
    }

    bool is_terminated() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminated_;
    }

    void touch() {
        std::lock_guard<std::mutex> lock(mutex_);
        touch_locked();
    }

    void touch_locked() {
        meta_.last_activity = std::chrono::system_clock::now();
    }

    std::string id_;
    session_config config_;
    runtime::scheduler& sched_;

    std::shared_ptr<debug_coordinator> coordinator_;
    std::shared_ptr<engine_debugger> debugger_;
    std::unique_ptr<variable_inspector> inspector_;

    mutable std::mutex mutex_;
    session_metadata meta_;
    std::vector<std::string> watches_;
    bool initialized_ = false;
    bool terminated_ = false;
    uint64_t events_seen_ = 0;
};

} // namespace stepwise::debug
