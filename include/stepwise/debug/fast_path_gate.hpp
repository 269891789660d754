#pragma once

#include "breakpoint_index.hpp"
#include <atomic>
#include <cstdint>
#include <string_view>
#include <vector>

namespace stepwise::debug {

/// Entry point called by the interpreter hook on every line.
///
/// With nothing armed the whole check is one relaxed load of `flags_`.
/// The gate only answers "maybe stop here"; hit counts, conditions and
/// step targets are decided by the coordinator on the slow path.
class fast_path_gate {
public:
    enum flag : uint32_t {
        breakpoints_active = 1u << 0,
        stepping = 1u << 1,
        pause_requested = 1u << 2
    };

    fast_path_gate() = default;

    fast_path_gate(const fast_path_gate&) = delete;
    fast_path_gate& operator=(const fast_path_gate&) = delete;

    /// True iff a breakpoint is installed at (source, line)
    [[nodiscard]] bool might_break_at(std::string_view source, uint32_t line) const noexcept {
        return index_.might_break_at(source, line);
    }

    /// Hook test: breakpoint location, active stepping, or a pending pause
    [[nodiscard]] bool should_stop(std::string_view source, uint32_t line) const noexcept {
        uint32_t f = flags_.load(std::memory_order_relaxed);
        if (f == 0) [[likely]] {
            return false;
        }
        if (f & (stepping | pause_requested)) {
            return true;
        }
        return index_.might_break_at(source, line);
    }

    /// Install a new breakpoint location set (wholesale)
    void update_breakpoints(const std::vector<source_line>& locations) {
        index_.update_breakpoints(locations);
        set_flag(breakpoints_active, !locations.empty());
    }

    void set_stepping(bool on) noexcept { set_flag(stepping, on); }

    void request_pause() noexcept { set_flag(pause_requested, true); }

    /// Consume a pending pause request; true if one was pending
    bool take_pause_request() noexcept {
        uint32_t prev = flags_.fetch_and(~static_cast<uint32_t>(pause_requested), std::memory_order_acq_rel);
        return (prev & pause_requested) != 0;
    }

    [[nodiscard]] bool is_pause_requested() const noexcept {
        return (flags_.load(std::memory_order_acquire) & pause_requested) != 0;
    }

    [[nodiscard]] bool is_stepping() const noexcept {
        return (flags_.load(std::memory_order_acquire) & stepping) != 0;
    }

    [[nodiscard]] bool is_armed() const noexcept {
        return flags_.load(std::memory_order_acquire) != 0;
    }

    [[nodiscard]] uint32_t flags() const noexcept {
        return flags_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const breakpoint_index& index() const noexcept { return index_; }

    /// Full teardown: no breakpoints, no stepping, no pause request
    void reset() {
        index_.clear();
        flags_.store(0, std::memory_order_release);
    }

private:
    void set_flag(uint32_t bit, bool on) noexcept {
        if (on) {
            flags_.fetch_or(bit, std::memory_order_acq_rel);
        } else {
            flags_.fetch_and(~bit, std::memory_order_acq_rel);
        }
    }

    std::atomic<uint32_t> flags_{0};
    breakpoint_index index_;
};

} // namespace stepwise::debug
