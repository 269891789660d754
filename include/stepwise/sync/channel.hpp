#pragma once

#include <stepwise/coro/task.hpp>
#include <stepwise/runtime/scheduler.hpp>
#include <coroutine>
#include <mutex>
#include <deque>
#include <optional>
#include <vector>

namespace stepwise::sync {

namespace detail {

/// Suspended coroutine plus the scheduler it was running on.
/// Wakers may be plain threads (the interpreter), so the waiter is sent
/// back to its own scheduler instead of the waker's.
struct waiter {
    std::coroutine_handle<> handle;
    runtime::scheduler* home = nullptr;

    static waiter capture(std::coroutine_handle<> h) noexcept {
        return waiter{h, runtime::scheduler::current()};
    }

    void wake() const noexcept {
        runtime::schedule_handle(handle, home);
    }
};

} // namespace detail

/// Bounded multi-producer multi-consumer channel.
///
/// Producers never suspend: try_send() fails when the channel is full or
/// closed, which is what a producer that must not block (the interpreter
/// thread) needs. Consumers either poll with try_recv() or co_await recv().
template<typename T>
class channel {
public:
    /// @param capacity Maximum number of queued items (0 = unbounded)
    explicit channel(size_t capacity = 0)
        : capacity_(capacity), closed_(false) {}

    ~channel() {
        close();
    }

    channel(const channel&) = delete;
    channel& operator=(const channel&) = delete;

    class recv_awaitable {
    public:
        explicit recv_awaitable(channel& ch) : channel_(ch) {}

        bool await_ready() const noexcept {
            std::lock_guard<std::mutex> guard(channel_.mutex_);
            return !channel_.queue_.empty() || channel_.closed_;
        }

        bool await_suspend(std::coroutine_handle<> awaiter) noexcept {
            std::lock_guard<std::mutex> guard(channel_.mutex_);
            if (!channel_.queue_.empty() || channel_.closed_) {
                return false;
            }
            channel_.recv_waiters_.push_back(detail::waiter::capture(awaiter));
            return true;
        }

        /// nullopt once the channel is closed and drained
        std::optional<T> await_resume() {
            std::lock_guard<std::mutex> guard(channel_.mutex_);
            if (channel_.queue_.empty()) {
                return std::nullopt;
            }
            std::optional<T> result(std::move(channel_.queue_.front()));
            channel_.queue_.pop_front();
            return result;
        }

    private:
        channel& channel_;
    };

    /// Enqueue without waiting. Returns false if full or closed.
    bool try_send(T value) {
        std::optional<detail::waiter> to_wake;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_) {
                return false;
            }
            if (capacity_ > 0 && queue_.size() >= capacity_) {
                return false;
            }
            queue_.push_back(std::move(value));
            if (!recv_waiters_.empty()) {
                to_wake = recv_waiters_.front();
                recv_waiters_.pop_front();
            }
        }
        if (to_wake) {
            to_wake->wake();
        }
        return true;
    }

    /// Next item, or nullopt once the channel is closed and drained.
    /// A wakeup whose item was taken by a concurrent try_recv waits again.
    coro::task<std::optional<T>> recv() {
        while (true) {
            auto item = co_await recv_awaitable(*this);
            if (item || is_closed()) {
                co_return item;
            }
        }
    }

    std::optional<T> try_recv() {
        std::lock_guard<std::mutex> guard(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> result(std::move(queue_.front()));
        queue_.pop_front();
        return result;
    }

    /// Take everything currently queued
    std::vector<T> drain() {
        std::vector<T> items;
        std::lock_guard<std::mutex> guard(mutex_);
        items.reserve(queue_.size());
        for (auto& item : queue_) {
            items.push_back(std::move(item));
        }
        queue_.clear();
        return items;
    }

    /// Refuse further sends and wake every receiver
    void close() {
        std::vector<detail::waiter> to_resume;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            to_resume.assign(recv_waiters_.begin(), recv_waiters_.end());
            recv_waiters_.clear();
        }
        for (auto& w : to_resume) {
            w.wake();
        }
    }

    bool is_closed() const noexcept {
        std::lock_guard<std::mutex> guard(mutex_);
        return closed_;
    }

    size_t size() const noexcept {
        std::lock_guard<std::mutex> guard(mutex_);
        return queue_.size();
    }

    bool empty() const noexcept {
        std::lock_guard<std::mutex> guard(mutex_);
        return queue_.empty();
    }

    size_t capacity() const noexcept { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::deque<T> queue_;
    std::deque<detail::waiter> recv_waiters_;
    size_t capacity_;
    bool closed_;
};

} // namespace stepwise::sync
