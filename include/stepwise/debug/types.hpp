#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <fmt/format.h>

namespace stepwise::debug {

/// Position in guest source
struct execution_location {
    std::string source;
    uint32_t line = 0;
    std::optional<uint32_t> column;

    [[nodiscard]] std::string to_string() const {
        if (column) {
            return fmt::format("{}:{}:{}", source, line, *column);
        }
        return fmt::format("{}:{}", source, line);
    }

    bool operator==(const execution_location&) const = default;
};

enum class pause_kind : uint8_t {
    breakpoint,
    step,
    pause,
    exception,
    entry
};

constexpr const char* pause_kind_str(pause_kind kind) noexcept {
    switch (kind) {
        case pause_kind::breakpoint: return "breakpoint";
        case pause_kind::step:       return "step";
        case pause_kind::pause:      return "pause";
        case pause_kind::exception:  return "exception";
        case pause_kind::entry:      return "entry";
        default:                     return "unknown";
    }
}

/// Why the interpreter stopped. `message` is only set for exceptions.
struct pause_reason {
    pause_kind kind = pause_kind::pause;
    std::string message;

    static pause_reason breakpoint() { return {pause_kind::breakpoint, {}}; }
    static pause_reason step() { return {pause_kind::step, {}}; }
    static pause_reason pause() { return {pause_kind::pause, {}}; }
    static pause_reason entry() { return {pause_kind::entry, {}}; }
    static pause_reason exception(std::string message) {
        return {pause_kind::exception, std::move(message)};
    }

    bool operator==(const pause_reason&) const = default;
};

/// Live state of one debuggee: running, paused somewhere, or gone
class debug_state {
public:
    struct running_t {
        bool operator==(const running_t&) const = default;
    };
    struct paused_t {
        pause_reason reason;
        execution_location location;
        bool operator==(const paused_t&) const = default;
    };
    struct terminated_t {
        bool operator==(const terminated_t&) const = default;
    };

    debug_state() = default;

    static debug_state running() { return debug_state(running_t{}); }
    static debug_state paused(pause_reason reason, execution_location location) {
        return debug_state(paused_t{std::move(reason), std::move(location)});
    }
    static debug_state terminated() { return debug_state(terminated_t{}); }

    [[nodiscard]] bool is_running() const noexcept { return std::holds_alternative<running_t>(state_); }
    [[nodiscard]] bool is_paused() const noexcept { return std::holds_alternative<paused_t>(state_); }
    [[nodiscard]] bool is_terminated() const noexcept { return std::holds_alternative<terminated_t>(state_); }

    /// Pause details, or nullptr when not paused
    [[nodiscard]] const paused_t* paused_info() const noexcept {
        return std::get_if<paused_t>(&state_);
    }

    [[nodiscard]] std::string to_string() const {
        if (auto* p = paused_info()) {
            if (p->reason.kind == pause_kind::exception) {
                return fmt::format("paused ({}: {}) at {}", pause_kind_str(p->reason.kind),
                                   p->reason.message, p->location.to_string());
            }
            return fmt::format("paused ({}) at {}", pause_kind_str(p->reason.kind),
                               p->location.to_string());
        }
        return is_running() ? "running" : "terminated";
    }

    bool operator==(const debug_state&) const = default;

private:
    template<typename Alt>
    explicit debug_state(Alt alt) : state_(std::move(alt)) {}

    std::variant<running_t, paused_t, terminated_t> state_;
};

/// Rendered guest value as handed over by the interpreter hook
struct variable {
    std::string name;
    std::string value;
    std::string type;
    bool has_children = false;
    std::optional<uint64_t> reference;

    bool operator==(const variable&) const = default;
};

struct stack_frame {
    std::string id;
    std::string name;
    std::string source;
    uint32_t line = 0;
    std::optional<uint32_t> column;
    std::vector<variable> locals;
    bool is_user_code = true;

    [[nodiscard]] execution_location location() const {
        return execution_location{source, line, column};
    }
};

/// A breakpoint as owned by the execution manager
struct breakpoint {
    uint64_t id = 0;
    std::string source;
    uint32_t line = 0;
    std::optional<std::string> condition;
    std::optional<uint32_t> hit_count;
    uint32_t current_hits = 0;
    bool enabled = true;

    breakpoint() = default;
    breakpoint(std::string src, uint32_t ln)
        : id(next_id()), source(std::move(src)), line(ln) {}

    breakpoint& with_condition(std::string expr) {
        condition = std::move(expr);
        return *this;
    }

    breakpoint& with_hit_count(uint32_t n) {
        hit_count = n;
        return *this;
    }

    /// Enabled and past its hit threshold (if any)
    [[nodiscard]] bool should_break() const noexcept {
        return enabled && (!hit_count || current_hits >= *hit_count);
    }

    /// Process-unique id; 0 is never handed out
    static uint64_t next_id() noexcept {
        static std::atomic<uint64_t> counter{1};
        return counter.fetch_add(1, std::memory_order_relaxed);
    }
};

enum class debug_command : uint8_t {
    continue_,
    step_into,
    step_over,
    step_out,
    pause,
    terminate
};

constexpr const char* debug_command_str(debug_command cmd) noexcept {
    switch (cmd) {
        case debug_command::continue_: return "continue";
        case debug_command::step_into: return "step_into";
        case debug_command::step_over: return "step_over";
        case debug_command::step_out:  return "step_out";
        case debug_command::pause:     return "pause";
        case debug_command::terminate: return "terminate";
        default:                       return "unknown";
    }
}

/// What the interpreter should do once pause() returns
enum class resume_action : uint8_t {
    proceed,
    terminate
};

enum class event_kind : uint8_t {
    paused,
    resumed,
    breakpoint_hit,
    terminated
};

constexpr const char* event_kind_str(event_kind kind) noexcept {
    switch (kind) {
        case event_kind::paused:         return "paused";
        case event_kind::resumed:        return "resumed";
        case event_kind::breakpoint_hit: return "breakpoint_hit";
        case event_kind::terminated:     return "terminated";
        default:                         return "unknown";
    }
}

/// Notification from the coordinator to the session side
struct debug_event {
    event_kind kind = event_kind::paused;
    std::optional<execution_location> location;
    std::optional<pause_reason> reason;
    std::optional<uint64_t> breakpoint_id;
    std::chrono::steady_clock::time_point at = std::chrono::steady_clock::now();
};

} // namespace stepwise::debug
