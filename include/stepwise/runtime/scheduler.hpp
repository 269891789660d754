#pragma once

#include "worker_thread.hpp"
#include <stepwise/log/macros.hpp>
#include <vector>
#include <memory>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <coroutine>
#include <thread>
#include <queue>
#include <chrono>

namespace stepwise::runtime {

/// Multi-threaded coroutine scheduler for the session control plane.
///
/// Handles are spread round-robin over the workers. A single timer thread
/// holds delayed handles (see schedule_after) and hands them back to the
/// workers when they come due.
class scheduler {
    friend class worker_thread;

public:
    using clock = std::chrono::steady_clock;

    explicit scheduler(size_t num_threads = std::thread::hardware_concurrency())
        : num_threads_(num_threads == 0 ? 1 : num_threads)
        , running_(false)
        , spawn_index_(0) {
        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.push_back(std::make_unique<worker_thread>(this, i));
        }
    }

    ~scheduler() {
        if (running_.load(std::memory_order_relaxed)) {
            shutdown();
        }
    }

    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;
    scheduler(scheduler&&) = delete;
    scheduler& operator=(scheduler&&) = delete;

    void start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            return;
        }
        for (auto& worker : workers_) {
            worker->start();
        }
        timer_running_ = true;
        timer_thread_ = std::thread(&scheduler::run_timers, this);
        STEPWISE_LOG_DEBUG("scheduler started with {} workers", num_threads_);
    }

    void shutdown() {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(timer_mutex_);
            timer_running_ = false;
        }
        timer_cv_.notify_all();
        if (timer_thread_.joinable()) timer_thread_.join();

        for (auto& worker : workers_) {
            worker->stop();
        }
        for (auto& worker : workers_) {
            worker->drain_remaining_tasks();
        }

        // Sleepers that never came due are dropped the same way
        std::lock_guard<std::mutex> lock(timer_mutex_);
        while (!timers_.empty()) {
            auto handle = timers_.top().handle;
            timers_.pop();
            if (handle) handle.destroy();
        }
    }

    void spawn(std::coroutine_handle<> handle) {
        if (!handle) [[unlikely]] return;
        if (!running_.load(std::memory_order_acquire)) [[unlikely]] {
            handle.destroy();
            return;
        }
        size_t index = spawn_index_.fetch_add(1, std::memory_order_relaxed) % num_threads_;
        workers_[index]->schedule(handle);
    }

    /// Resume `handle` on a worker once `delay` has elapsed
    void schedule_after(clock::duration delay, std::coroutine_handle<> handle) {
        if (!handle) [[unlikely]] return;
        if (delay <= clock::duration::zero()) {
            spawn(handle);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(timer_mutex_);
            if (!timer_running_) {
                handle.destroy();
                return;
            }
            timers_.push(timer_entry{clock::now() + delay, timer_seq_++, handle});
        }
        timer_cv_.notify_one();
    }

    [[nodiscard]] size_t num_threads() const noexcept { return num_threads_; }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t pending_tasks() const noexcept {
        size_t total = 0;
        for (auto& worker : workers_) {
            total += worker->queue_size();
        }
        return total;
    }

    [[nodiscard]] size_t pending_timers() const noexcept {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        return timers_.size();
    }

    [[nodiscard]] size_t total_tasks_executed() const noexcept {
        size_t total = 0;
        for (auto& worker : workers_) {
            total += worker->tasks_executed();
        }
        return total;
    }

    /// Scheduler whose worker is running on the calling thread, if any
    [[nodiscard]] static scheduler* current() noexcept {
        return current_scheduler_;
    }

    /// True when the calling thread belongs to this scheduler's pool
    [[nodiscard]] bool owns_current_thread() const noexcept {
        return current_scheduler_ == this;
    }

private:
    struct timer_entry {
        clock::time_point deadline;
        uint64_t seq;
        std::coroutine_handle<> handle;

        bool operator>(const timer_entry& other) const noexcept {
            if (deadline != other.deadline) return deadline > other.deadline;
            return seq > other.seq;
        }
    };

    void run_timers() {
        std::unique_lock<std::mutex> lock(timer_mutex_);
        while (timer_running_) {
            if (timers_.empty()) {
                timer_cv_.wait(lock);
                continue;
            }
            auto deadline = timers_.top().deadline;
            if (clock::now() < deadline) {
                timer_cv_.wait_until(lock, deadline);
                continue;
            }
            auto handle = timers_.top().handle;
            timers_.pop();
            lock.unlock();
            spawn(handle);
            lock.lock();
        }
    }

    std::vector<std::unique_ptr<worker_thread>> workers_;
    size_t num_threads_;
    std::atomic<bool> running_;
    std::atomic<size_t> spawn_index_;

    std::thread timer_thread_;
    mutable std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    std::priority_queue<timer_entry, std::vector<timer_entry>, std::greater<>> timers_;
    uint64_t timer_seq_ = 0;
    bool timer_running_ = false;

    static inline thread_local scheduler* current_scheduler_ = nullptr;
};

inline scheduler* get_current_scheduler() noexcept {
    return scheduler::current();
}

/// Queue `handle` on the scheduler it should continue on.
/// With no running scheduler the handle is resumed inline.
inline void schedule_handle(std::coroutine_handle<> handle, scheduler* sched) noexcept {
    if (!handle) return;
    if (sched && sched->is_running()) {
        sched->spawn(handle);
    } else if (!handle.done()) {
        handle.resume();
    }
}

inline void schedule_handle(std::coroutine_handle<> handle) noexcept {
    schedule_handle(handle, scheduler::current());
}

inline void worker_thread::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    thread_ = std::thread(&worker_thread::run, this);
}

inline void worker_thread::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false,
                std::memory_order_release, std::memory_order_relaxed)) return;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

inline void worker_thread::drain_remaining_tasks() noexcept {
    std::deque<std::coroutine_handle<>> leftovers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftovers.swap(queue_);
    }
    for (auto handle : leftovers) {
        if (handle) handle.destroy();
    }
}

inline void worker_thread::run() {
    scheduler::current_scheduler_ = scheduler_;
    current_worker_ = this;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] {
            return !queue_.empty() || !running_.load(std::memory_order_acquire);
        });
        if (!running_.load(std::memory_order_acquire)) break;

        auto handle = queue_.front();
        queue_.pop_front();
        lock.unlock();

        if (handle && !handle.done()) {
            handle.resume();
        }
        tasks_executed_.fetch_add(1, std::memory_order_relaxed);

        lock.lock();
    }

    scheduler::current_scheduler_ = nullptr;
    current_worker_ = nullptr;
}

} // namespace stepwise::runtime
