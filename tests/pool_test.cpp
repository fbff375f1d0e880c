#include <forkjoin-cpp/error.hpp>
#include <forkjoin-cpp/pool.hpp>
#include <forkjoin-cpp/task.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <latch>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace forkjoin_cpp;

namespace {

auto fib(Pool& pool, int n) -> long {
    if (n < 2) return n;
    auto left = Task{[&pool, n] { return fib(pool, n - 1); }};
    pool.fork(left);
    auto right = fib(pool, n - 2);
    return pool.join(left) + right;
}

auto fib_sequential(int n) -> long {
    return n < 2 ? n : fib_sequential(n - 1) + fib_sequential(n - 2);
}

}  // namespace

// =============================================================================
// Construction and options
// =============================================================================

TEST(Pool, default_uses_hardware_concurrency) {
    auto pool = Pool{};
    const auto expected = std::max(1u, std::thread::hardware_concurrency());
    EXPECT_EQ(pool.worker_count(), expected);
    EXPECT_TRUE(pool.is_running());
}

TEST(Pool, explicit_worker_count) {
    auto pool = Pool{3u};
    EXPECT_EQ(pool.worker_count(), 3u);
    EXPECT_EQ(pool.worker_states().size(), 3u);
}

TEST(Pool, zero_worker_count_means_hardware_concurrency) {
    auto pool = Pool{0u};
    EXPECT_GE(pool.worker_count(), 1u);
}

TEST(Pool, options_are_resolved) {
    auto pool = Pool{PoolOptions{.worker_count = 3, .idle_backoff = std::chrono::microseconds{-5}}};
    EXPECT_EQ(pool.options().worker_count, 3u);
    EXPECT_EQ(pool.options().steal_rounds, 8u);
    EXPECT_EQ(pool.options().idle_backoff, std::chrono::microseconds{0});
}

TEST(Pool, explicit_steal_rounds_are_kept) {
    auto pool = Pool{PoolOptions{.worker_count = 2, .steal_rounds = 5}};
    EXPECT_EQ(pool.options().steal_rounds, 5u);
}

// =============================================================================
// invoke / fork / join
// =============================================================================

TEST(Pool, invoke_callable_from_outside) {
    auto pool = Pool{2u};
    EXPECT_EQ(pool.invoke([] { return 40 + 2; }), 42);
}

TEST(Pool, invoke_void_callable) {
    auto pool = Pool{2u};
    auto ran = false;
    pool.invoke([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(Pool, nested_fork_join_with_one_worker) {
    // A single worker must make progress by running its own forked work
    // while joining.
    auto pool = Pool{1u};
    EXPECT_EQ(pool.invoke([&] { return fib(pool, 18); }), fib_sequential(18));
}

TEST(Pool, nested_fork_join_with_many_workers) {
    auto pool = Pool{4u};
    EXPECT_EQ(pool.invoke([&] { return fib(pool, 22); }), fib_sequential(22));
}

TEST(Pool, many_forks_joined_in_reverse_order) {
    auto pool = Pool{4u};
    auto total = pool.invoke([&] {
        auto tasks = std::vector<std::unique_ptr<Task<int>>>{};
        for (int i = 0; i < 100; ++i) {
            tasks.push_back(std::make_unique<Task<int>>([i] { return i; }));
            pool.fork(*tasks.back());
        }
        auto sum = 0;
        for (auto it = tasks.rbegin(); it != tasks.rend(); ++it) {
            sum += pool.join(**it);
        }
        return sum;
    });
    EXPECT_EQ(total, 4950);
}

TEST(Pool, join_task_forked_on_another_pool) {
    auto first = Pool{1u};
    auto second = Pool{1u};
    auto task = Task{[] { return 7; }};
    second.fork(task);
    EXPECT_EQ(first.invoke([&] { return first.join(task); }), 7);
}

TEST(Pool, cross_pool_join_keeps_running_own_work) {
    // The task on `second` can only finish after `first`'s single worker has
    // run the task sitting in its own queue, so the joining worker must keep
    // executing while it waits.
    auto first = Pool{1u};
    auto second = Pool{1u};
    auto local_ran = std::atomic<bool>{false};

    auto result = first.invoke([&] {
        auto local = Task{[&] { local_ran = true; }};
        first.fork(local);
        auto foreign = Task{[&] {
            while (!local_ran.load()) std::this_thread::yield();
            return 11;
        }};
        second.fork(foreign);
        auto value = first.join(foreign);
        first.join(local);
        return value;
    });

    EXPECT_EQ(result, 11);
    EXPECT_TRUE(local_ran.load());
}

TEST(Pool, idle_worker_steals_from_busy_worker) {
    // Both halves wait for each other, so they can only complete when a
    // second worker steals the forked one.
    auto pool = Pool{2u};
    auto rendezvous = std::latch{2};
    pool.invoke([&] {
        auto other = Task{[&] { rendezvous.arrive_and_wait(); }};
        pool.fork(other);
        rendezvous.arrive_and_wait();
        pool.join(other);
    });
    EXPECT_GT(pool.stats().tasks_stolen, 0u);
}

TEST(Pool, tasks_run_only_on_worker_threads) {
    auto pool = Pool{3u};
    auto mutex = std::mutex{};
    auto ids = std::set<std::thread::id>{};
    pool.invoke([&] {
        auto tasks = std::vector<std::unique_ptr<Task<void>>>{};
        for (int i = 0; i < 200; ++i) {
            tasks.push_back(std::make_unique<Task<void>>([&] {
                auto lock = std::scoped_lock{mutex};
                ids.insert(std::this_thread::get_id());
            }));
            pool.fork(*tasks.back());
        }
        for (auto& t : tasks) pool.join(*t);
    });
    EXPECT_GE(ids.size(), 1u);
    EXPECT_LE(ids.size(), 3u);
    EXPECT_EQ(ids.count(std::this_thread::get_id()), 0u);
}

TEST(Pool, concurrent_external_submitters) {
    auto pool = Pool{4u};
    auto total = std::atomic<long>{0};
    {
        auto submitters = std::vector<std::jthread>{};
        for (int t = 0; t < 8; ++t) {
            submitters.emplace_back([&, t] {
                for (int i = 0; i < 100; ++i) {
                    total += pool.invoke([t, i] { return static_cast<long>(t * 100 + i); });
                }
            });
        }
    }  // join all
    EXPECT_EQ(total.load(), 799L * 800L / 2L);
    EXPECT_EQ(pool.stats().tasks_submitted, 800u);
}

// =============================================================================
// Failure
// =============================================================================

TEST(Pool, failing_task_leaves_pool_usable) {
    auto pool = Pool{2u};
    EXPECT_THROW(pool.invoke([] { throw std::runtime_error{"bad"}; }), TaskExecutionError);
    EXPECT_EQ(pool.invoke([] { return 5; }), 5);
    EXPECT_TRUE(pool.is_running());
}

TEST(Pool, sibling_runs_when_other_fails) {
    auto pool = Pool{2u};
    auto sibling_ran = std::atomic<bool>{false};
    EXPECT_THROW(pool.invoke([&] {
        auto failing = Task{[] { throw std::invalid_argument{"left"}; }};
        auto sibling = Task{[&] { sibling_ran = true; }};
        pool.fork(failing);
        pool.fork(sibling);
        pool.join(sibling);
        pool.join(failing);
    }), TaskExecutionError);
    EXPECT_TRUE(sibling_ran.load());
}

TEST(Pool, failure_propagates_through_nested_joins) {
    auto pool = Pool{4u};
    try {
        pool.invoke([&] {
            auto middle = Task{[&] {
                auto leaf = Task{[]() -> int { throw std::domain_error{"leaf"}; }};
                pool.fork(leaf);
                return pool.join(leaf);
            }};
            pool.fork(middle);
            return pool.join(middle);
        });
        FAIL() << "invoke did not throw";
    } catch (const TaskExecutionError& e) {
        EXPECT_THROW(std::rethrow_if_nested(e), std::domain_error);
    }
}

// =============================================================================
// Shutdown
// =============================================================================

TEST(Pool, submit_after_shutdown_throws) {
    auto pool = Pool{2u};
    pool.shutdown();
    EXPECT_FALSE(pool.is_running());

    auto task = Task{[] { return 1; }};
    EXPECT_THROW(pool.fork(task), PoolShutdownError);
    EXPECT_EQ(task.state(), TaskState::pending);
    EXPECT_THROW(pool.invoke([] { return 1; }), PoolShutdownError);
}

TEST(Pool, shutdown_is_idempotent) {
    auto pool = Pool{2u};
    pool.shutdown();
    EXPECT_NO_THROW(pool.shutdown());
    EXPECT_FALSE(pool.is_running());
}

TEST(Pool, shutdown_waits_for_submitted_tasks) {
    auto pool = Pool{2u};
    auto task = Task{[] {
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
        return 3;
    }};
    pool.fork(task);
    pool.shutdown();
    EXPECT_EQ(task.state(), TaskState::completed);
    EXPECT_EQ(pool.join(task), 3);
}

TEST(Pool, shutdown_from_worker_is_invalid) {
    auto pool = Pool{2u};
    try {
        pool.invoke([&] { pool.shutdown(); });
        FAIL() << "invoke did not throw";
    } catch (const TaskExecutionError& e) {
        try {
            std::rethrow_if_nested(e);
            FAIL() << "no nested exception";
        } catch (const Exception& inner) {
            EXPECT_EQ(inner.kind(), ErrorKind::invalid_operation);
        }
    }
    EXPECT_TRUE(pool.is_running());
}

TEST(Pool, workers_report_shutting_down_after_shutdown) {
    auto pool = Pool{3u};
    pool.shutdown();
    for (auto state : pool.worker_states()) {
        EXPECT_EQ(state, WorkerState::shutting_down);
    }
}

// =============================================================================
// Introspection
// =============================================================================

TEST(Pool, current_worker_index) {
    auto pool = Pool{2u};
    auto other = Pool{1u};
    EXPECT_FALSE(pool.current_worker_index().has_value());

    pool.invoke([&] {
        auto index = pool.current_worker_index();
        ASSERT_TRUE(index.has_value());
        EXPECT_LT(*index, pool.worker_count());
        EXPECT_FALSE(other.current_worker_index().has_value());
    });
}

TEST(Pool, stats_count_submitted_forked_and_executed) {
    auto pool = Pool{2u};
    pool.invoke([&] {
        auto tasks = std::vector<std::unique_ptr<Task<int>>>{};
        for (int i = 0; i < 10; ++i) {
            tasks.push_back(std::make_unique<Task<int>>([i] { return i; }));
            pool.fork(*tasks.back());
        }
        for (auto& t : tasks) pool.join(*t);
    });

    const auto stats = pool.stats();
    EXPECT_EQ(stats.tasks_submitted, 1u);
    EXPECT_EQ(stats.tasks_forked, 10u);
    EXPECT_EQ(stats.tasks_executed, 11u);
    EXPECT_EQ(stats.tasks_failed, 0u);
    EXPECT_LE(stats.tasks_stolen, stats.tasks_forked);
}

TEST(Pool, stats_count_failures) {
    auto pool = Pool{1u};
    EXPECT_THROW(pool.invoke([] { throw std::runtime_error{"x"}; }), TaskExecutionError);
    const auto stats = pool.stats();
    EXPECT_EQ(stats.tasks_submitted, 1u);
    EXPECT_EQ(stats.tasks_executed, 1u);
    EXPECT_EQ(stats.tasks_failed, 1u);
}

TEST(Pool, idle_workers_park) {
    auto pool = Pool{PoolOptions{.worker_count = 2, .steal_rounds = 1}};
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    EXPECT_GT(pool.stats().idle_parks, 0u);
}

TEST(PoolTypes, worker_state_names) {
    EXPECT_EQ(to_string_view(WorkerState::idle),          "idle");
    EXPECT_EQ(to_string_view(WorkerState::running),       "running");
    EXPECT_EQ(to_string_view(WorkerState::stealing),      "stealing");
    EXPECT_EQ(to_string_view(WorkerState::shutting_down), "shutting_down");
}
