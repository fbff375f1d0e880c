#include "../src/task_queue.hpp"
#include "../src/submission_queue.hpp"

#include <forkjoin-cpp/task.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace forkjoin_cpp;
using forkjoin_cpp::detail::SubmissionQueue;
using forkjoin_cpp::detail::TaskQueue;

namespace {

// Tasks are only used as distinct addresses here; none is ever run.
auto make_tasks(std::size_t count) -> std::vector<std::unique_ptr<Task<void>>> {
    auto tasks = std::vector<std::unique_ptr<Task<void>>>{};
    tasks.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        tasks.push_back(std::make_unique<Task<void>>([] {}));
    }
    return tasks;
}

}  // namespace

// -- Owner end ----------------------------------------------------------------

TEST(TaskQueue, new_queue_is_empty) {
    auto queue = TaskQueue{};
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_EQ(queue.pop_own(), nullptr);
    EXPECT_EQ(queue.steal(), nullptr);
}

TEST(TaskQueue, capacity_is_rounded_to_power_of_two) {
    EXPECT_EQ(TaskQueue{5}.capacity(), 8u);
    EXPECT_EQ(TaskQueue{64}.capacity(), 64u);
    EXPECT_EQ(TaskQueue{0}.capacity(), 2u);
}

TEST(TaskQueue, pop_own_is_lifo) {
    auto tasks = make_tasks(3);
    auto queue = TaskQueue{};
    for (auto& t : tasks) queue.push_own(t.get());

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.pop_own(), tasks[2].get());
    EXPECT_EQ(queue.pop_own(), tasks[1].get());
    EXPECT_EQ(queue.pop_own(), tasks[0].get());
    EXPECT_EQ(queue.pop_own(), nullptr);
}

TEST(TaskQueue, steal_is_fifo) {
    auto tasks = make_tasks(3);
    auto queue = TaskQueue{};
    for (auto& t : tasks) queue.push_own(t.get());

    EXPECT_EQ(queue.steal(), tasks[0].get());
    EXPECT_EQ(queue.steal(), tasks[1].get());
    EXPECT_EQ(queue.steal(), tasks[2].get());
    EXPECT_EQ(queue.steal(), nullptr);
}

TEST(TaskQueue, owner_and_thief_take_opposite_ends) {
    auto tasks = make_tasks(4);
    auto queue = TaskQueue{};
    for (auto& t : tasks) queue.push_own(t.get());

    EXPECT_EQ(queue.steal(), tasks[0].get());
    EXPECT_EQ(queue.pop_own(), tasks[3].get());
    EXPECT_EQ(queue.steal(), tasks[1].get());
    EXPECT_EQ(queue.pop_own(), tasks[2].get());
    EXPECT_TRUE(queue.empty());
}

TEST(TaskQueue, grows_past_initial_capacity) {
    auto tasks = make_tasks(100);
    auto queue = TaskQueue{4};
    for (auto& t : tasks) queue.push_own(t.get());

    EXPECT_GE(queue.capacity(), 100u);
    EXPECT_EQ(queue.size(), 100u);
    // Growth preserves order at both ends.
    EXPECT_EQ(queue.steal(), tasks.front().get());
    for (auto i = tasks.size(); i-- > 1;) {
        EXPECT_EQ(queue.pop_own(), tasks[i].get());
    }
    EXPECT_TRUE(queue.empty());
}

TEST(TaskQueue, reusable_after_draining) {
    auto tasks = make_tasks(2);
    auto queue = TaskQueue{2};
    for (int round = 0; round < 10; ++round) {
        queue.push_own(tasks[0].get());
        queue.push_own(tasks[1].get());
        EXPECT_EQ(queue.pop_own(), tasks[1].get());
        EXPECT_EQ(queue.steal(), tasks[0].get());
    }
    EXPECT_EQ(queue.capacity(), 2u);
}

// -- Concurrency --------------------------------------------------------------

TEST(TaskQueue, every_task_taken_exactly_once_under_contention) {
    constexpr std::size_t task_count = 20000;
    constexpr int thief_count = 4;

    auto tasks = make_tasks(task_count);
    auto queue = TaskQueue{8};
    auto done = std::atomic<bool>{false};

    auto mutex = std::mutex{};
    auto taken = std::vector<TaskBase*>{};
    taken.reserve(task_count);

    auto thieves = std::vector<std::jthread>{};
    for (int i = 0; i < thief_count; ++i) {
        thieves.emplace_back([&] {
            auto local = std::vector<TaskBase*>{};
            while (!done.load(std::memory_order_acquire) || !queue.empty()) {
                if (auto* t = queue.steal()) local.push_back(t);
            }
            auto lock = std::scoped_lock{mutex};
            taken.insert(taken.end(), local.begin(), local.end());
        });
    }

    // Owner: push everything, popping one task after every third push.
    auto owned = std::vector<TaskBase*>{};
    for (std::size_t i = 0; i < task_count; ++i) {
        queue.push_own(tasks[i].get());
        if (i % 3 == 2) {
            if (auto* t = queue.pop_own()) owned.push_back(t);
        }
    }
    while (auto* t = queue.pop_own()) owned.push_back(t);
    done.store(true, std::memory_order_release);
    thieves.clear();  // join all

    taken.insert(taken.end(), owned.begin(), owned.end());
    ASSERT_EQ(taken.size(), task_count);
    std::ranges::sort(taken);
    EXPECT_EQ(std::ranges::adjacent_find(taken), taken.end());
}

// -- SubmissionQueue ----------------------------------------------------------

TEST(SubmissionQueue, fifo_order) {
    auto tasks = make_tasks(3);
    auto queue = SubmissionQueue{};
    EXPECT_TRUE(queue.empty());
    for (auto& t : tasks) queue.push(t.get());

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.try_pop(), tasks[0].get());
    EXPECT_EQ(queue.try_pop(), tasks[1].get());
    EXPECT_EQ(queue.try_pop(), tasks[2].get());
    EXPECT_EQ(queue.try_pop(), nullptr);
}

TEST(SubmissionQueue, concurrent_producers) {
    constexpr std::size_t per_producer = 1000;
    auto tasks = make_tasks(per_producer * 4);
    auto queue = SubmissionQueue{};
    {
        auto producers = std::vector<std::jthread>{};
        for (std::size_t p = 0; p < 4; ++p) {
            producers.emplace_back([&, p] {
                for (std::size_t i = 0; i < per_producer; ++i) {
                    queue.push(tasks[p * per_producer + i].get());
                }
            });
        }
    }
    EXPECT_EQ(queue.size(), tasks.size());

    auto popped = std::size_t{0};
    while (queue.try_pop() != nullptr) ++popped;
    EXPECT_EQ(popped, tasks.size());
}
