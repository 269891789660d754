#pragma once

#include <coroutine>
#include <condition_variable>
#include <deque>
#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>

namespace stepwise::runtime {

class scheduler;

/// Worker thread that executes coroutine handles from its own queue.
///
/// Control-plane work (sessions, event pumps, client commands) is light and
/// mostly waiting, so a locked deque with a condition variable replaces
/// lock-free stealing here.
class worker_thread {
public:
    worker_thread(scheduler* sched, size_t worker_id)
        : scheduler_(sched)
        , worker_id_(worker_id)
        , running_(false)
        , tasks_executed_(0) {}

    ~worker_thread() {
        stop();
    }

    worker_thread(const worker_thread&) = delete;
    worker_thread& operator=(const worker_thread&) = delete;
    worker_thread(worker_thread&&) = delete;
    worker_thread& operator=(worker_thread&&) = delete;

    void start();
    void stop();

    /// Destroy whatever is still queued - only call after the thread has joined
    void drain_remaining_tasks() noexcept;

    void schedule(std::coroutine_handle<> handle) {
        if (!handle) [[unlikely]] return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(handle);
        }
        cv_.notify_one();
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t worker_id() const noexcept { return worker_id_; }

    [[nodiscard]] size_t tasks_executed() const noexcept {
        return tasks_executed_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] size_t queue_size() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    /// Worker running on the calling thread, if any
    [[nodiscard]] static worker_thread* current() noexcept {
        return current_worker_;
    }

    [[nodiscard]] scheduler* owner() const noexcept { return scheduler_; }

private:
    void run();

    scheduler* scheduler_;
    size_t worker_id_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::coroutine_handle<>> queue_;
    std::atomic<bool> running_;
    std::atomic<size_t> tasks_executed_;

    static inline thread_local worker_thread* current_worker_ = nullptr;
};

} // namespace stepwise::runtime
