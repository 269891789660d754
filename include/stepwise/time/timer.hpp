#pragma once

#include <stepwise/runtime/scheduler.hpp>
#include <stepwise/log/macros.hpp>
#include <chrono>
#include <coroutine>
#include <thread>

namespace stepwise::time {

/// Awaitable for sleeping/delaying execution.
/// On a worker the coroutine is parked on the scheduler's timer thread;
/// anywhere else the calling thread sleeps.
class sleep_awaitable {
public:
    template<typename Rep, typename Period>
    explicit sleep_awaitable(std::chrono::duration<Rep, Period> duration)
        : duration_(std::chrono::duration_cast<std::chrono::nanoseconds>(duration)) {}

    bool await_ready() const noexcept {
        return duration_.count() <= 0;
    }

    bool await_suspend(std::coroutine_handle<> awaiter) {
        auto* sched = runtime::scheduler::current();
        if (sched && sched->is_running()) {
            sched->schedule_after(duration_, awaiter);
            return true;
        }
        STEPWISE_LOG_DEBUG("sleep_for outside a scheduler, sleeping the thread");
        std::this_thread::sleep_for(duration_);
        return false;
    }

    void await_resume() const noexcept {}

private:
    std::chrono::nanoseconds duration_;
};

template<typename Rep, typename Period>
inline auto sleep_for(std::chrono::duration<Rep, Period> duration) {
    return sleep_awaitable(duration);
}

template<typename Clock, typename Duration>
inline auto sleep_until(std::chrono::time_point<Clock, Duration> time_point) {
    auto now = Clock::now();
    if (time_point <= now) {
        return sleep_awaitable(std::chrono::nanoseconds(0));
    }
    return sleep_awaitable(time_point - now);
}

/// Requeue the current coroutine behind other ready work
class yield_awaitable {
public:
    bool await_ready() const noexcept {
        return false;
    }

    bool await_suspend(std::coroutine_handle<> awaiter) const {
        auto* sched = runtime::scheduler::current();
        if (sched && sched->is_running()) {
            sched->spawn(awaiter);
            return true;
        }
        return false;
    }

    void await_resume() const noexcept {}
};

inline auto yield() {
    return yield_awaitable{};
}

} // namespace stepwise::time
