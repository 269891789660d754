#pragma once

#include "config.hpp"
#include "error.hpp"
#include "execution_manager.hpp"
#include "types.hpp"
#include <stepwise/log/macros.hpp>
#include <stepwise/sync/channel.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stepwise::debug {

/// What the interpreter hook hands over when the engine decides to stop
struct pause_snapshot {
    std::vector<stack_frame> frames;
    /// Optional pre-expanded variables by frame id
    std::unordered_map<std::string, std::vector<variable>> variables;
    /// Names visible from every frame (used by conditions and watches)
    std::vector<variable> globals;
};

/// Builds a snapshot on demand; only called when the slow path needs one
using capture_fn = std::function<pause_snapshot()>;

/// Per-line facts only the interpreter knows
struct line_context {
    /// Call depth, 1 for the main chunk
    uint32_t depth = 1;
    /// Changes whenever guest state may have changed; lets the engine reuse
    /// condition results between visits. Unset means "always re-evaluate".
    std::optional<uint64_t> state_epoch;
};

enum class step_mode : uint8_t {
    into,
    over,
    out
};

struct coordinator_stats {
    uint64_t pauses = 0;
    uint64_t slo_violations = 0;
    uint64_t events_dropped = 0;
    uint64_t condition_errors = 0;
    std::chrono::nanoseconds max_block_entry_latency{0};
};

/// Owns the pause/resume protocol between the interpreter thread and the
/// session side.
///
/// The interpreter thread calls on_line / on_entry / on_exception after the
/// gate fired; the only place it ever blocks is pause(). Commands arrive from
/// the session side through send_command(). Events go out on a bounded
/// channel with try_send, so a slow consumer loses events instead of
/// stalling the interpreter.
class debug_coordinator {
public:
    explicit debug_coordinator(std::shared_ptr<execution_manager> exec, session_config config = {})
        : exec_(std::move(exec))
        , config_(std::move(config))
        , events_(std::make_shared<sync::channel<debug_event>>(config_.event_queue_capacity)) {}

    ~debug_coordinator() {
        detach();
    }

    debug_coordinator(const debug_coordinator&) = delete;
    debug_coordinator& operator=(const debug_coordinator&) = delete;

    // Interpreter thread

    /// Slow-path decision for a line the gate flagged.
    /// Order: pending pause request, step target, then breakpoint
    /// (hit counted first, then threshold, then condition).
    resume_action on_line(const execution_location& location, const line_context& ctx,
                          const capture_fn& capture = {}) {
        if (is_detached() || exec_->get_state().is_terminated()) {
            return resume_action::terminate;
        }
        current_depth_.store(ctx.depth, std::memory_order_relaxed);
        track_epoch(ctx);

        std::optional<pause_snapshot> snap;
        auto snapshot = [&]() -> pause_snapshot& {
            if (!snap) {
                snap.emplace(capture ? capture() : pause_snapshot{});
            }
            return *snap;
        };

        auto& gate = exec_->gate();
        if (gate.take_pause_request()) {
            auto reason = entry_pending_.exchange(false) ? pause_reason::entry() : pause_reason::pause();
            clear_step();
            return pause(std::move(reason), location, std::move(snapshot()));
        }

        if (step_reached(ctx.depth)) {
            clear_step();
            return pause(pause_reason::step(), location, std::move(snapshot()));
        }

        if (!gate.might_break_at(location.source, location.line)) {
            return resume_action::proceed;
        }
        auto hit = exec_->register_hit(location.source, location.line);
        if (!hit || !hit->should_break()) {
            return resume_action::proceed;
        }
        if (hit->condition && config_.enable_conditions &&
            !condition_met(location, snapshot())) {
            return resume_action::proceed;
        }
        clear_step();
        return pause(pause_reason::breakpoint(), location, std::move(snapshot()), hit->id);
    }

    /// First line of the script; stops only if stop-on-entry was armed
    resume_action on_entry(const execution_location& location, const capture_fn& capture = {}) {
        if (is_detached() || exec_->get_state().is_terminated()) {
            return resume_action::terminate;
        }
        if (!entry_pending_.exchange(false)) {
            return resume_action::proceed;
        }
        exec_->gate().take_pause_request();
        return pause(pause_reason::entry(), location, capture ? capture() : pause_snapshot{});
    }

    /// Guest error; stops when stop_on_exception is configured
    resume_action on_exception(const execution_location& location, std::string message,
                               const capture_fn& capture = {}) {
        if (!config_.stop_on_exception || is_detached()) {
            return resume_action::proceed;
        }
        return pause(pause_reason::exception(std::move(message)), location,
                     capture ? capture() : pause_snapshot{});
    }

    /// Script ran to completion
    void on_finished() {
        if (exec_->get_state().is_terminated()) {
            return;
        }
        exec_->set_state(debug_state::terminated());
        publish(debug_event{.kind = event_kind::terminated});
    }

    /// Publish the pause, then block until resumed, terminated or detached.
    /// May block indefinitely while a human decides.
    resume_action pause(pause_reason reason, const execution_location& location,
                        pause_snapshot snapshot, std::optional<uint64_t> breakpoint_id = std::nullopt) {
        auto started = std::chrono::steady_clock::now();
        if (snapshot.frames.size() > config_.max_stack_depth) {
            snapshot.frames.resize(config_.max_stack_depth);
        }
        bool is_breakpoint = reason.kind == pause_kind::breakpoint;
        uint64_t seq;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (detached_ || terminate_requested_) {
                return resume_action::terminate;
            }
            {
                std::lock_guard<std::mutex> globals_lock(globals_mutex_);
                globals_ = std::move(snapshot.globals);
            }
            // State and snapshot go in before any command can observe paused_
            exec_->store_pause_snapshot(debug_state::paused(reason, location),
                                        std::move(snapshot.frames), std::move(snapshot.variables));
            paused_ = true;
            seq = resume_seq_;
            pause_depth_ = current_depth_.load(std::memory_order_relaxed);
        }

        if (is_breakpoint) {
            publish(debug_event{.kind = event_kind::breakpoint_hit, .location = location,
                                .reason = reason, .breakpoint_id = breakpoint_id});
        }
        publish(debug_event{.kind = event_kind::paused, .location = location, .reason = reason,
                            .breakpoint_id = breakpoint_id});
        pauses_.fetch_add(1, std::memory_order_relaxed);

        std::unique_lock<std::mutex> lock(mutex_);
        record_block_latency(std::chrono::steady_clock::now() - started, location);
        STEPWISE_LOG_DEBUG("interpreter paused at {} ({})", location.to_string(), pause_kind_str(reason.kind));

        cv_.wait(lock, [&] { return resume_seq_ != seq || detached_; });
        paused_ = false;
        if (detached_ || terminate_requested_) {
            return resume_action::terminate;
        }
        return resume_action::proceed;
    }

    // Session side

    /// Apply a client command.
    /// When the interpreter is not paused, continue/step/pause only record
    /// intent for the next instrumented line.
    debug_result<void> send_command(debug_command command) {
        std::optional<debug_event> note;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (detached_ || terminate_requested_ || exec_->get_state().is_terminated()) {
                if (command == debug_command::terminate) {
                    return {};
                }
                return make_error(debug_errc::invalid_state, "{} after termination",
                                  debug_command_str(command));
            }

            auto& gate = exec_->gate();
            switch (command) {
                case debug_command::terminate:
                    terminate_requested_ = true;
                    reset_step_locked();
                    // Left armed so a running interpreter reaches on_line and stops
                    gate.request_pause();
                    exec_->set_state(debug_state::terminated());
                    note = debug_event{.kind = event_kind::terminated};
                    release_locked();
                    break;

                case debug_command::pause:
                    if (!paused_) {
                        gate.request_pause();
                    }
                    break;

                case debug_command::continue_:
                    reset_step_locked();
                    if (!paused_) {
                        gate.take_pause_request();
                        break;
                    }
                    exec_->resume();
                    note = debug_event{.kind = event_kind::resumed};
                    release_locked();
                    break;

                case debug_command::step_into:
                case debug_command::step_over:
                case debug_command::step_out: {
                    auto mode = command == debug_command::step_into ? step_mode::into
                              : command == debug_command::step_over ? step_mode::over
                              : step_mode::out;
                    uint32_t from = paused_ ? pause_depth_ : current_depth_.load(std::memory_order_relaxed);
                    step_ = step_request{mode, from};
                    step_armed_.store(true, std::memory_order_release);
                    gate.set_stepping(true);
                    if (!paused_) {
                        break;
                    }
                    exec_->resume();
                    note = debug_event{.kind = event_kind::resumed};
                    release_locked();
                    break;
                }
            }
        }
        // Outside the lock: waking a consumer may run it inline
        if (note) {
            publish(std::move(*note));
        }
        return {};
    }

    /// Ask for a stop at the first line (consumed by on_entry or on_line)
    void arm_entry() {
        entry_pending_.store(true, std::memory_order_release);
        exec_->gate().request_pause();
    }

    /// The session side is gone: force-resume any blocked interpreter with
    /// terminated state. Idempotent.
    void detach() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (detached_) {
                return;
            }
            detached_ = true;
            reset_step_locked();
            exec_->set_state(debug_state::terminated());
            exec_->gate().reset();
            ++resume_seq_;
        }
        cv_.notify_all();
        events_->close();
        STEPWISE_LOG_DEBUG("coordinator detached");
    }

    /// Retire memoized condition results (guest state changed)
    void invalidate_condition_cache() {
        exec_->conditions().invalidate();
    }

    [[nodiscard]] bool is_paused() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return paused_;
    }

    [[nodiscard]] bool is_detached() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return detached_;
    }

    [[nodiscard]] std::optional<step_mode> pending_step() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!step_) return std::nullopt;
        return step_->mode;
    }

    /// Globals captured with the current pause
    [[nodiscard]] std::vector<variable> globals() const {
        std::lock_guard<std::mutex> lock(globals_mutex_);
        return globals_;
    }

    [[nodiscard]] coordinator_stats stats() const noexcept {
        coordinator_stats s;
        s.pauses = pauses_.load(std::memory_order_relaxed);
        s.slo_violations = slo_violations_.load(std::memory_order_relaxed);
        s.events_dropped = events_dropped_.load(std::memory_order_relaxed);
        s.condition_errors = condition_errors_.load(std::memory_order_relaxed);
        s.max_block_entry_latency = std::chrono::nanoseconds(max_latency_ns_.load(std::memory_order_relaxed));
        return s;
    }

    [[nodiscard]] std::shared_ptr<sync::channel<debug_event>> events() const noexcept { return events_; }
    [[nodiscard]] const std::shared_ptr<execution_manager>& execution() const noexcept { return exec_; }
    [[nodiscard]] const session_config& config() const noexcept { return config_; }

private:
    struct step_request {
        step_mode mode;
        uint32_t start_depth;
    };

    bool step_reached(uint32_t depth) {
        if (!step_armed_.load(std::memory_order_acquire)) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (!step_) return false;
        switch (step_->mode) {
            case step_mode::into: return true;
            case step_mode::over: return depth <= step_->start_depth;
            case step_mode::out:  return depth < step_->start_depth;
        }
        return false;
    }

    void clear_step() {
        std::lock_guard<std::mutex> lock(mutex_);
        reset_step_locked();
    }

    void reset_step_locked() {
        step_.reset();
        step_armed_.store(false, std::memory_order_release);
        exec_->gate().set_stepping(false);
    }

    void track_epoch(const line_context& ctx) {
        if (!ctx.state_epoch) {
            if (exec_->conditions().condition_count() != 0) {
                exec_->conditions().invalidate();
            }
            return;
        }
        if (last_epoch_ != ctx.state_epoch) {
            last_epoch_ = ctx.state_epoch;
            exec_->conditions().invalidate();
        }
    }

    /// Guard of the breakpoint at `location`. Failures count as "not met".
    bool condition_met(const execution_location& location, const pause_snapshot& snap) {
        auto& conditions = exec_->conditions();
        if (auto memo = conditions.lookup_fresh(location.source, location.line)) {
            return *memo;
        }
        auto guard = conditions.get_condition(location.source, location.line);
        if (!guard) {
            return false;
        }
        evaluation_scope scope;
        if (!snap.frames.empty()) {
            scope.locals = snap.frames.front().locals;
        }
        scope.globals = snap.globals;
        auto result = expression_evaluator::evaluate_condition(*guard, scope);
        if (!result) {
            condition_errors_.fetch_add(1, std::memory_order_relaxed);
            STEPWISE_LOG_WARNING("condition '{}' at {} failed, not breaking: {}",
                                 guard->text(), location.to_string(), result.error().message);
            return false;
        }
        conditions.cache_condition_result(location.source, location.line, *result);
        return *result;
    }

    void publish(debug_event event) {
        if (!events_->try_send(std::move(event))) {
            auto dropped = events_dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
            if (dropped == 1 || dropped % 100 == 0) {
                STEPWISE_LOG_WARNING("debug event queue full or closed, {} events dropped", dropped);
            }
        }
    }

    void record_block_latency(std::chrono::nanoseconds latency, const execution_location& location) {
        auto ns = static_cast<uint64_t>(latency.count());
        auto prev = max_latency_ns_.load(std::memory_order_relaxed);
        while (ns > prev && !max_latency_ns_.compare_exchange_weak(prev, ns, std::memory_order_relaxed)) {}
        if (latency > config_.pause_latency_budget()) {
            slo_violations_.fetch_add(1, std::memory_order_relaxed);
            STEPWISE_LOG_WARNING("pause at {} took {} us to block, budget is {} ms",
                                 location.to_string(), ns / 1000, config_.pause_latency_budget_ms);
        }
    }

    /// Caller holds mutex_
    void release_locked() {
        paused_ = false;
        ++resume_seq_;
        cv_.notify_all();
    }

    std::shared_ptr<execution_manager> exec_;
    session_config config_;
    std::shared_ptr<sync::channel<debug_event>> events_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool paused_ = false;
    bool detached_ = false;
    bool terminate_requested_ = false;
    uint64_t resume_seq_ = 0;
    uint32_t pause_depth_ = 0;
    std::optional<step_request> step_;

    std::atomic<bool> step_armed_{false};
    std::atomic<bool> entry_pending_{false};
    std::atomic<uint32_t> current_depth_{1};
    std::optional<uint64_t> last_epoch_;

    mutable std::mutex globals_mutex_;
    std::vector<variable> globals_;

    std::atomic<uint64_t> pauses_{0};
    std::atomic<uint64_t> slo_violations_{0};
    std::atomic<uint64_t> events_dropped_{0};
    std::atomic<uint64_t> condition_errors_{0};
    std::atomic<uint64_t> max_latency_ns_{0};
};

} // namespace stepwise::debug
