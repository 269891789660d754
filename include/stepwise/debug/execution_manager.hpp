#pragma once

#include "condition_cache.hpp"
#include "error.hpp"
#include "expression.hpp"
#include "fast_path_gate.hpp"
#include "types.hpp"
#include <stepwise/log/macros.hpp>
#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stepwise::debug {

/// Canonical store for one debuggee: breakpoints, state, and the snapshot
/// captured at the current pause.
///
/// Every breakpoint mutation rebuilds the gate's index and updates the
/// condition cache before returning, so the hot path never lags by more
/// than the mutation in flight. All client-visible reads come through here.
class execution_manager {
public:
    explicit execution_manager(std::shared_ptr<fast_path_gate> gate = std::make_shared<fast_path_gate>(),
                               std::shared_ptr<condition_cache> conditions = std::make_shared<condition_cache>(),
                               std::shared_ptr<const expression_evaluator> evaluator =
                                   std::make_shared<simple_evaluator>())
        : gate_(std::move(gate))
        , conditions_(std::move(conditions))
        , evaluator_(std::move(evaluator)) {}

    execution_manager(const execution_manager&) = delete;
    execution_manager& operator=(const execution_manager&) = delete;

    // Breakpoints

    /// Install a breakpoint and return its id.
    /// A breakpoint already at the same (source, line) is replaced.
    debug_result<uint64_t> add_breakpoint(breakpoint bp) {
        if (bp.source.empty() || bp.line == 0) {
            return make_error(debug_errc::not_found, "no executable location {}:{}", bp.source, bp.line);
        }

        compiled_expression_ptr guard;
        if (bp.condition) {
            auto compiled = evaluator_->compile(*bp.condition);
            if (!compiled) {
                return make_error(debug_errc::evaluation_error, "condition '{}': {}",
                                  *bp.condition, compiled.error().message);
            }
            guard = std::move(*compiled);
        }
        if (bp.id == 0) {
            bp.id = breakpoint::next_id();
        }
        bp.current_hits = 0;

        std::unique_lock lock(mutex_);
        auto it = std::find_if(breakpoints_.begin(), breakpoints_.end(), [&](const breakpoint& b) {
            return b.source == bp.source && b.line == bp.line;
        });
        if (it != breakpoints_.end()) {
            STEPWISE_LOG_DEBUG("breakpoint {} replaces {} at {}:{}", bp.id, it->id, bp.source, bp.line);
            breakpoints_.erase(it);
        }
        if (guard) {
            conditions_->set_condition(bp.source, bp.line, std::move(guard));
        } else {
            conditions_->remove_condition(bp.source, bp.line);
        }
        uint64_t id = bp.id;
        breakpoints_.push_back(std::move(bp));
        rebuild_index_locked();
        return id;
    }

    bool remove_breakpoint(uint64_t id) {
        std::unique_lock lock(mutex_);
        auto it = std::find_if(breakpoints_.begin(), breakpoints_.end(),
                               [id](const breakpoint& b) { return b.id == id; });
        if (it == breakpoints_.end()) {
            return false;
        }
        conditions_->remove_condition(it->source, it->line);
        breakpoints_.erase(it);
        rebuild_index_locked();
        return true;
    }

    debug_result<void> set_breakpoint_enabled(uint64_t id, bool enabled) {
        std::unique_lock lock(mutex_);
        auto it = std::find_if(breakpoints_.begin(), breakpoints_.end(),
                               [id](const breakpoint& b) { return b.id == id; });
        if (it == breakpoints_.end()) {
            return make_error(debug_errc::not_found, "breakpoint {}", id);
        }
        it->enabled = enabled;
        rebuild_index_locked();
        return {};
    }

    [[nodiscard]] std::vector<breakpoint> get_breakpoints() const {
        std::shared_lock lock(mutex_);
        return breakpoints_;
    }

    [[nodiscard]] std::optional<breakpoint> breakpoint_at(std::string_view source, uint32_t line) const {
        std::shared_lock lock(mutex_);
        for (const auto& b : breakpoints_) {
            if (b.source == source && b.line == line) return b;
        }
        return std::nullopt;
    }

    /// Count a hit on the enabled breakpoint at (source, line) and return it
    /// as it stands after the increment.
    std::optional<breakpoint> register_hit(std::string_view source, uint32_t line) {
        std::unique_lock lock(mutex_);
        for (auto& b : breakpoints_) {
            if (b.source == source && b.line == line && b.enabled) {
                ++b.current_hits;
                return b;
            }
        }
        return std::nullopt;
    }

    // State

    void set_state(debug_state state) {
        std::unique_lock lock(mutex_);
        state_ = std::move(state);
    }

    [[nodiscard]] debug_state get_state() const {
        std::shared_lock lock(mutex_);
        return state_;
    }

    /// Anything but terminated
    [[nodiscard]] bool is_active() const {
        std::shared_lock lock(mutex_);
        return !state_.is_terminated();
    }

    // Snapshot

    void set_stack_trace(std::vector<stack_frame> frames) {
        std::unique_lock lock(mutex_);
        frames_ = std::move(frames);
    }

    /// Latest pause snapshot; empty while running
    [[nodiscard]] std::vector<stack_frame> get_stack_trace() const {
        std::shared_lock lock(mutex_);
        if (state_.is_running()) {
            return {};
        }
        return frames_;
    }

    void cache_variables(const std::string& frame_id, std::vector<variable> vars) {
        std::unique_lock lock(mutex_);
        variables_[frame_id] = std::move(vars);
    }

    [[nodiscard]] std::optional<std::vector<variable>> get_cached_variables(const std::string& frame_id) const {
        std::shared_lock lock(mutex_);
        auto it = variables_.find(frame_id);
        if (it == variables_.end()) return std::nullopt;
        return it->second;
    }

    /// Variables of `frame_id` (top frame when empty): cached set first,
    /// then the frame's captured locals.
    [[nodiscard]] debug_result<std::vector<variable>> get_variables(std::optional<std::string> frame_id = std::nullopt) const {
        std::shared_lock lock(mutex_);
        if (!state_.is_paused() || frames_.empty()) {
            return make_error(debug_errc::invalid_state, "not paused");
        }
        const std::string& id = frame_id ? *frame_id : frames_.front().id;
        if (auto it = variables_.find(id); it != variables_.end()) {
            return it->second;
        }
        for (const auto& f : frames_) {
            if (f.id == id) return f.locals;
        }
        return make_error(debug_errc::not_found, "frame '{}'", id);
    }

    /// Publish a pause: state, frames and variables replaced under one lock
    uint64_t store_pause_snapshot(debug_state state, std::vector<stack_frame> frames,
                                  std::unordered_map<std::string, std::vector<variable>> vars = {}) {
        std::unique_lock lock(mutex_);
        state_ = std::move(state);
        frames_ = std::move(frames);
        variables_ = std::move(vars);
        return ++pause_epoch_;
    }

    /// Leave the pause: running again, snapshot dropped
    void resume() {
        std::unique_lock lock(mutex_);
        if (state_.is_terminated()) {
            return;
        }
        state_ = debug_state::running();
        frames_.clear();
        variables_.clear();
    }

    /// Increments once per pause; lets readers tell snapshots apart
    [[nodiscard]] uint64_t pause_epoch() const {
        std::shared_lock lock(mutex_);
        return pause_epoch_;
    }

    /// Teardown: no breakpoints, no snapshot, gate disarmed, state terminated
    void clear() {
        std::unique_lock lock(mutex_);
        breakpoints_.clear();
        frames_.clear();
        variables_.clear();
        state_ = debug_state::terminated();
        conditions_->clear();
        gate_->reset();
    }

    [[nodiscard]] fast_path_gate& gate() noexcept { return *gate_; }
    [[nodiscard]] const fast_path_gate& gate() const noexcept { return *gate_; }
    [[nodiscard]] condition_cache& conditions() noexcept { return *conditions_; }
    [[nodiscard]] const expression_evaluator& evaluator() const noexcept { return *evaluator_; }
    [[nodiscard]] std::shared_ptr<fast_path_gate> gate_handle() const noexcept { return gate_; }

private:
    void rebuild_index_locked() {
        std::vector<source_line> locations;
        locations.reserve(breakpoints_.size());
        for (const auto& b : breakpoints_) {
            if (b.enabled) {
                locations.push_back(source_line{b.source, b.line});
            }
        }
        gate_->update_breakpoints(locations);
    }

    std::shared_ptr<fast_path_gate> gate_;
    std::shared_ptr<condition_cache> conditions_;
    std::shared_ptr<const expression_evaluator> evaluator_;

    mutable std::shared_mutex mutex_;
    std::vector<breakpoint> breakpoints_;
    debug_state state_ = debug_state::running();
    std::vector<stack_frame> frames_;
    std::unordered_map<std::string, std::vector<variable>> variables_;
    uint64_t pause_epoch_ = 0;
};

} // namespace stepwise::debug
