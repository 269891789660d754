#pragma once

#include "scheduler.hpp"
#include <stepwise/coro/task.hpp>
#include <stepwise/log/macros.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <variant>

namespace stepwise::runtime {

/// Configuration for run()
struct run_config {
    /// Number of worker threads (0 = hardware concurrency)
    size_t num_threads = 0;
};

namespace detail {

/// One-shot result slot shared between a driven task and the blocked caller.
/// Shared ownership lets a caller that gave up (timeout) walk away safely.
template<typename T>
struct completion_signal {
    using stored_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::mutex mutex;
    std::condition_variable cv;
    std::optional<stored_type> result;
    std::exception_ptr exception;
    bool completed = false;

    void set_result(stored_type value) {
        std::lock_guard<std::mutex> lock(mutex);
        result = std::move(value);
        completed = true;
        cv.notify_all();
    }

    void set_exception(std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(mutex);
        exception = e;
        completed = true;
        cv.notify_all();
    }

    T wait() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return completed; });
        return take();
    }

    /// Returns false if the deadline passed first
    bool wait_for(std::chrono::nanoseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return completed; });
    }

    /// Requires completed; caller holds or no longer needs the lock
    T take() {
        if (exception) {
            std::rethrow_exception(exception);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*result);
        }
    }
};

template<typename T>
coro::task<void> completion_wrapper(coro::task<T> inner, std::shared_ptr<completion_signal<T>> signal) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(inner);
            signal->set_result(std::monostate{});
        } else {
            T result = co_await std::move(inner);
            signal->set_result(std::move(result));
        }
    } catch (...) {
        signal->set_exception(std::current_exception());
    }
}

/// Process-wide single-thread scheduler used when a worker thread needs
/// to block on async work. Started on first use, stopped at exit.
inline scheduler& bridge_scheduler() {
    static scheduler bridge(1);
    static std::once_flag started;
    std::call_once(started, [] {
        bridge.start();
        STEPWISE_LOG_DEBUG("bridge scheduler started");
    });
    return bridge;
}

/// Number of block_on calls currently parked on the bridge thread
inline std::atomic<int>& bridge_blocked() noexcept {
    static std::atomic<int> count{0};
    return count;
}

/// Marks the bridge as unable to make progress while its thread waits
class bridge_block_guard {
public:
    bridge_block_guard()
        : active_(scheduler::current() != nullptr && scheduler::current() == &bridge_scheduler()) {
        if (active_) bridge_blocked().fetch_add(1, std::memory_order_acq_rel);
    }
    ~bridge_block_guard() {
        if (active_) bridge_blocked().fetch_sub(1, std::memory_order_acq_rel);
    }

    bridge_block_guard(const bridge_block_guard&) = delete;
    bridge_block_guard& operator=(const bridge_block_guard&) = delete;

private:
    bool active_;
};

/// Pick the scheduler that can drive a task for a caller on this thread
/// without waiting on itself. Returns nullptr when a private scheduler is
/// needed (the target is not running, or the caller is a worker and the
/// bridge is itself blocked).
inline scheduler* pick_driver(scheduler& target) {
    auto* here = scheduler::current();
    if (here == nullptr) {
        return target.is_running() ? &target : nullptr;
    }
    auto& bridge = bridge_scheduler();
    if (here == &bridge || bridge_blocked().load(std::memory_order_acquire) > 0) {
        return nullptr;
    }
    return &bridge;
}

} // namespace detail

/// Drive `t` to completion from synchronous code and return its result.
///
/// Safe to call from any thread, including a worker of `sched` or of any
/// other scheduler: such callers are routed through the bridge scheduler
/// (or a private one-thread scheduler when already on the bridge), so the
/// blocked worker is never the one expected to make progress.
/// Exceptions thrown by the task are rethrown here.
template<typename T>
T block_on(scheduler& sched, coro::task<T> t) {
    auto signal = std::make_shared<detail::completion_signal<T>>();
    auto wrapper = detail::completion_wrapper(std::move(t), signal);

    detail::bridge_block_guard guard;
    if (auto* driver = detail::pick_driver(sched)) {
        driver->spawn(wrapper.release());
        return signal->wait();
    }

    scheduler local(1);
    local.start();
    local.spawn(wrapper.release());
    return signal->wait();
}

/// Result of try_block_on: an optional value, or a completion flag for void
template<typename T>
using try_result_t = std::conditional_t<std::is_void_v<T>, bool, std::optional<T>>;

/// Like block_on, but gives up after `timeout`.
/// On timeout the task keeps running on its driver and its result is dropped.
template<typename T, typename Rep, typename Period>
try_result_t<T> try_block_on(scheduler& sched, coro::task<T> t,
                             std::chrono::duration<Rep, Period> timeout) {
    auto signal = std::make_shared<detail::completion_signal<T>>();
    auto wrapper = detail::completion_wrapper(std::move(t), signal);
    auto wait_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(timeout);

    detail::bridge_block_guard guard;
    std::unique_ptr<scheduler> local;
    auto* driver = detail::pick_driver(sched);
    if (driver == nullptr) {
        local = std::make_unique<scheduler>(1);
        local->start();
        driver = local.get();
    }
    driver->spawn(wrapper.release());

    bool done = signal->wait_for(wait_ns);
    if (local) {
        local->shutdown();
    }
    if (!done) {
        STEPWISE_LOG_DEBUG("try_block_on: gave up after {} ns", wait_ns.count());
        if constexpr (std::is_void_v<T>) {
            return false;
        } else {
            return std::nullopt;
        }
    }
    if constexpr (std::is_void_v<T>) {
        signal->take();
        return true;
    } else {
        return signal->take();
    }
}

/// Run a task on a fresh scheduler and return its result (for main())
template<typename T>
T run(coro::task<T> task, const run_config& config = {}) {
    size_t threads = config.num_threads;
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 1;
    }

    scheduler sched(threads);
    sched.start();
    if constexpr (std::is_void_v<T>) {
        block_on(sched, std::move(task));
        sched.shutdown();
    } else {
        T result = block_on(sched, std::move(task));
        sched.shutdown();
        return result;
    }
}

} // namespace stepwise::runtime

namespace stepwise {

using runtime::block_on;
using runtime::try_block_on;
using runtime::run;
using runtime::run_config;

} // namespace stepwise
