#pragma once

#include <exception>
#include <cstdint>

namespace stepwise::coro {

/// Coroutine lifecycle, tracked for diagnostics
enum class coroutine_state : uint8_t {
    created = 0,
    completed = 1,
    failed = 2
};

inline const char* state_to_string(coroutine_state state) noexcept {
    switch (state) {
        case coroutine_state::created: return "created";
        case coroutine_state::completed: return "completed";
        case coroutine_state::failed: return "failed";
        default: return "unknown";
    }
}

/// Base class for all coroutine promise types.
/// Captures an escaping exception so the awaiter (or block_on) can rethrow it.
class promise_base {
public:
    promise_base() noexcept = default;

    promise_base(const promise_base&) = delete;
    promise_base& operator=(const promise_base&) = delete;
    promise_base(promise_base&&) = delete;
    promise_base& operator=(promise_base&&) = delete;

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
        state_ = coroutine_state::failed;
    }

    [[nodiscard]] std::exception_ptr exception() const noexcept {
        return exception_;
    }

    [[nodiscard]] coroutine_state state() const noexcept { return state_; }
    void set_state(coroutine_state state) noexcept { state_ = state; }

private:
    std::exception_ptr exception_;
    coroutine_state state_ = coroutine_state::created;
};

} // namespace stepwise::coro
