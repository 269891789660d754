#include <catch2/catch_test_macros.hpp>
#include <stepwise/runtime/scheduler.hpp>
#include <stepwise/coro/task.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include "../test_main.cpp"  // For scaled timeouts

using namespace stepwise::runtime;
using namespace stepwise::coro;
using namespace stepwise::test;

TEST_CASE("Scheduler construction", "[scheduler]") {
    scheduler sched(4);
    REQUIRE(sched.num_threads() == 4);
    REQUIRE(!sched.is_running());

    scheduler single(0);
    REQUIRE(single.num_threads() == 1);
}

TEST_CASE("Scheduler start/shutdown", "[scheduler]") {
    scheduler sched(2);
    REQUIRE(!sched.is_running());

    sched.start();
    REQUIRE(sched.is_running());

    sched.shutdown();
    REQUIRE(!sched.is_running());

    // Second shutdown is a no-op
    sched.shutdown();
    REQUIRE(!sched.is_running());
}

TEST_CASE("Scheduler spawn and execute simple coroutine", "[scheduler]") {
    scheduler sched(2);
    sched.start();

    std::atomic<bool> executed{false};
    auto coro = [&]() -> task<void> {
        executed.store(true);
        co_return;
    };

    sched.spawn(coro().release());
    REQUIRE(wait_until([&] { return executed.load(); }, scaled_ms(1000)));

    sched.shutdown();
}

TEST_CASE("Scheduler spawn multiple coroutines", "[scheduler]") {
    scheduler sched(4);
    sched.start();

    const int num_tasks = 100;
    std::atomic<int> completed{0};
    std::mutex ids_mutex;
    std::set<std::thread::id> ids;

    auto coro = [&]() -> task<void> {
        {
            std::lock_guard<std::mutex> lock(ids_mutex);
            ids.insert(std::this_thread::get_id());
        }
        completed.fetch_add(1);
        co_return;
    };

    for (int i = 0; i < num_tasks; ++i) {
        sched.spawn(coro().release());
    }

    REQUIRE(wait_until([&] { return completed.load() == num_tasks; }, scaled_sec(10)));
    REQUIRE(sched.total_tasks_executed() >= static_cast<size_t>(num_tasks));

    // Round-robin placement uses more than one worker
    std::lock_guard<std::mutex> lock(ids_mutex);
    REQUIRE(ids.size() > 1);

    sched.shutdown();
}

TEST_CASE("Scheduler thread-local current", "[scheduler]") {
    scheduler sched(2);
    REQUIRE(scheduler::current() == nullptr);

    sched.start();
    // The starting thread is not a worker
    REQUIRE(scheduler::current() == nullptr);
    REQUIRE_FALSE(sched.owns_current_thread());

    std::atomic<scheduler*> seen{nullptr};
    std::atomic<bool> owned{false};
    auto coro = [&]() -> task<void> {
        seen.store(scheduler::current());
        owned.store(sched.owns_current_thread());
        co_return;
    };
    sched.spawn(coro().release());

    REQUIRE(wait_until([&] { return seen.load() != nullptr; }, scaled_ms(1000)));
    REQUIRE(seen.load() == &sched);
    REQUIRE(owned.load());

    sched.shutdown();
}

TEST_CASE("Scheduler handles empty spawn", "[scheduler]") {
    scheduler sched(2);
    sched.start();
    sched.spawn(nullptr);
    REQUIRE(sched.pending_tasks() == 0);
    sched.shutdown();
}

TEST_CASE("Scheduler drops spawns when not running", "[scheduler]") {
    scheduler sched(2);
    std::atomic<bool> executed{false};
    auto coro = [&]() -> task<void> {
        executed.store(true);
        co_return;
    };

    // The frame is destroyed, not queued
    sched.spawn(coro().release());
    sched.start();
    std::this_thread::sleep_for(scaled_ms(50));
    REQUIRE_FALSE(executed.load());
    sched.shutdown();
}

TEST_CASE("Scheduler schedule_after resumes after the delay", "[scheduler][timer]") {
    scheduler sched(2);
    sched.start();

    std::atomic<bool> resumed{false};
    auto coro = [&]() -> task<void> {
        resumed.store(true);
        co_return;
    };

    auto started = std::chrono::steady_clock::now();
    sched.schedule_after(std::chrono::milliseconds(50), coro().release());
    REQUIRE(sched.pending_timers() == 1);

    REQUIRE(wait_until([&] { return resumed.load(); }, scaled_ms(2000)));
    REQUIRE(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(50));
    REQUIRE(sched.pending_timers() == 0);

    sched.shutdown();
}

TEST_CASE("Scheduler timers fire in deadline order", "[scheduler][timer]") {
    scheduler sched(1);
    sched.start();

    std::mutex order_mutex;
    std::vector<int> order;
    auto mark = [&](int n) -> task<void> {
        std::lock_guard<std::mutex> lock(order_mutex);
        order.push_back(n);
        co_return;
    };

    sched.schedule_after(std::chrono::milliseconds(60), mark(3).release());
    sched.schedule_after(std::chrono::milliseconds(20), mark(1).release());
    sched.schedule_after(std::chrono::milliseconds(40), mark(2).release());

    REQUIRE(wait_until([&] {
        std::lock_guard<std::mutex> lock(order_mutex);
        return order.size() == 3;
    }, scaled_ms(2000)));
    REQUIRE(order == std::vector<int>{1, 2, 3});

    sched.shutdown();
}

TEST_CASE("Scheduler shutdown drops pending timers", "[scheduler][timer]") {
    scheduler sched(1);
    sched.start();

    std::atomic<bool> resumed{false};
    auto coro = [&]() -> task<void> {
        resumed.store(true);
        co_return;
    };
    sched.schedule_after(std::chrono::seconds(60), coro().release());
    REQUIRE(sched.pending_timers() == 1);

    sched.shutdown();
    REQUIRE(sched.pending_timers() == 0);
    REQUIRE_FALSE(resumed.load());
}

TEST_CASE("schedule_handle without a scheduler resumes inline", "[scheduler]") {
    std::atomic<bool> executed{false};
    auto coro = [&]() -> task<void> {
        executed.store(true);
        co_return;
    };

    schedule_handle(coro().release());
    REQUIRE(executed.load());
}
