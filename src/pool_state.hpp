#pragma once

// Internal representation of a Pool: workers, queues, and bookkeeping.
// Internal header — not installed.

#include <forkjoin-cpp/pool.hpp>
#include <forkjoin-cpp/task.hpp>

#include "submission_queue.hpp"
#include "task_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

namespace forkjoin_cpp::detail {

struct PoolState;

// Scheduler-side access to TaskBase internals.
struct TaskAccess {
    // pending -> forked, or throws Exception (invalid_operation).
    static void mark_forked(TaskBase& task, Pool& pool, bool external);

    // forked -> pending, for a task whose fork failed before it was queued.
    static void reset_pending(TaskBase& task) noexcept {
        task.pool_ = nullptr;
        task.external_ = false;
        task.state_.store(TaskState::pending, std::memory_order_relaxed);
    }

    // Runs the work and records the error if any. Returns the terminal
    // state to publish; does not publish it.
    static auto execute(TaskBase& task) noexcept -> TaskState;

    // Publishes the terminal state. The task may be destroyed by its
    // joiner as soon as this returns.
    static void publish(TaskBase& task, TaskState outcome) noexcept {
        task.state_.store(outcome, std::memory_order_release);
    }

    static auto is_external(const TaskBase& task) noexcept -> bool { return task.external_; }
};

// Written only by the owning worker; read by stats().
struct alignas(64) WorkerCounters {
    std::atomic<std::uint64_t> forked{0};
    std::atomic<std::uint64_t> executed{0};
    std::atomic<std::uint64_t> failed{0};
    std::atomic<std::uint64_t> stolen{0};
    std::atomic<std::uint64_t> parks{0};

    static void bump(std::atomic<std::uint64_t>& counter) noexcept {
        counter.store(counter.load(std::memory_order_relaxed) + 1, std::memory_order_relaxed);
    }
};

struct Worker {
    Worker(PoolState& owner, unsigned int idx, std::uint32_t seed)
        : pool{owner}, index{idx}, rng{seed} {}

    PoolState& pool;
    unsigned int index;
    TaskQueue queue;
    std::default_random_engine rng;
    std::atomic<WorkerState> state{WorkerState::idle};
    WorkerCounters counters;
    std::jthread thread;
};

struct PoolState {
    explicit PoolState(PoolOptions opts) : options{opts} {}

    PoolOptions options;
    SubmissionQueue submissions;
    std::atomic<std::uint64_t> submitted{0};

    // Parking for idle workers. Waits are bounded by options.idle_backoff,
    // so a missed notification costs at most one backoff period.
    std::mutex idle_mutex;
    std::condition_variable_any idle_cv;
    std::atomic<unsigned int> sleepers{0};
    std::atomic<std::uint64_t> work_epoch{0};

    // Completion of external submissions. Guards accepting and in_flight,
    // and the terminal-state store of external tasks, so that a blocked
    // caller cannot observe completion (and destroy its task) before the
    // worker is done touching it.
    std::mutex done_mutex;
    std::condition_variable done_cv;
    bool accepting = true;
    std::size_t in_flight = 0;

    std::mutex shutdown_mutex;
    bool stopped = false;

    std::vector<std::unique_ptr<Worker>> workers;

    // Normally Pool::shutdown() has joined everything already. This covers a
    // constructor that throws after starting some threads: stop them all
    // before any worker (and the queue peers may be stealing from) goes away.
    ~PoolState() {
        for (auto& w : workers) {
            w->thread.request_stop();
        }
        idle_cv.notify_all();
        for (auto& w : workers) {
            if (w->thread.joinable()) w->thread.join();
        }
    }

    PoolState(const PoolState&) = delete;
    auto operator=(const PoolState&) -> PoolState& = delete;

    void wake_one() {
        if (sleepers.load(std::memory_order_acquire) > 0) {
            work_epoch.fetch_add(1, std::memory_order_release);
            idle_cv.notify_one();
        }
    }
};

}  // namespace forkjoin_cpp::detail
