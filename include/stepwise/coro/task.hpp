#pragma once

#include "promise_base.hpp"
#include <coroutine>
#include <optional>
#include <exception>
#include <utility>
#include <type_traits>

namespace stepwise::runtime {
class scheduler;
scheduler* get_current_scheduler() noexcept;
void schedule_handle(std::coroutine_handle<> handle) noexcept;
}

namespace stepwise::coro {

template<typename T = void>
class task;

namespace detail {

struct final_awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
        auto& promise = h.promise();
        if (promise.state() != coroutine_state::failed) {
            promise.set_state(coroutine_state::completed);
        }
        auto continuation = promise.continuation_;
        if (continuation) {
            return continuation;
        }
        if (promise.detached_) {
            // Nobody owns the frame any more
            h.destroy();
        }
        return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
};

} // namespace detail

/// Lazily started coroutine returning T.
///
/// A task does nothing until it is awaited, handed to a scheduler with
/// release(), or launched fire-and-forget with go().
template<typename T>
class task {
public:
    struct promise_type : promise_base {
        std::optional<T> value_;
        std::coroutine_handle<> continuation_;
        bool detached_ = false;

        [[nodiscard]] task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        [[nodiscard]] std::suspend_always initial_suspend() noexcept { return {}; }
        [[nodiscard]] detail::final_awaiter final_suspend() noexcept { return {}; }

        template<typename U>
        void return_value(U&& value) {
            value_.emplace(std::forward<U>(value));
        }
    };

    using handle_type = std::coroutine_handle<promise_type>;
    using value_type = T;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { if (handle_) handle_.destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }

    /// Give up ownership; the frame destroys itself when it finishes
    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().detached_ = true;
        return std::exchange(handle_, nullptr);
    }

    /// Fire-and-forget on the current scheduler
    void go() {
        runtime::schedule_handle(release());
    }

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    T await_resume() {
        auto& promise = handle_.promise();
        if (promise.exception()) {
            std::rethrow_exception(promise.exception());
        }
        return std::move(*promise.value_);
    }

private:
    handle_type handle_;
};

template<>
class task<void> {
public:
    struct promise_type : promise_base {
        std::coroutine_handle<> continuation_;
        bool detached_ = false;

        [[nodiscard]] task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        [[nodiscard]] std::suspend_always initial_suspend() noexcept { return {}; }
        [[nodiscard]] detail::final_awaiter final_suspend() noexcept { return {}; }

        void return_void() noexcept {}
    };

    using handle_type = std::coroutine_handle<promise_type>;
    using value_type = void;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { if (handle_) handle_.destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }

    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().detached_ = true;
        return std::exchange(handle_, nullptr);
    }

    void go() {
        runtime::schedule_handle(release());
    }

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    void await_resume() {
        auto& promise = handle_.promise();
        if (promise.exception()) {
            std::rethrow_exception(promise.exception());
        }
    }

private:
    handle_type handle_;
};

} // namespace stepwise::coro
