/// @file pool.hpp
/// @brief The Pool class -- a fixed set of work-stealing worker threads.

#pragma once

#include <forkjoin-cpp/error.hpp>
#include <forkjoin-cpp/task.hpp>

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace forkjoin_cpp {

namespace detail {
struct PoolState;
}  // namespace detail

/// Construction parameters for a Pool.
struct PoolOptions {
    /// Number of worker threads. 0 = std::thread::hardware_concurrency().
    unsigned int worker_count = 0;

    /// Consecutive failed steal sweeps a worker tolerates (yielding between
    /// them) before it parks. 0 = 2 * (worker_count + 1).
    std::size_t steal_rounds = 0;

    /// Upper bound on how long an idle worker parks before looking for
    /// work again.
    std::chrono::microseconds idle_backoff{100};

    auto operator==(const PoolOptions&) const -> bool = default;
};

/// Observable state of one worker thread.
enum class WorkerState : std::uint8_t {
    idle,           ///< Parked, waiting for work.
    running,        ///< Executing a task.
    stealing,       ///< Sweeping peer queues for work.
    shutting_down,  ///< Left the scheduling loop.
};

/// Convert a WorkerState to its string representation.
constexpr auto to_string_view(WorkerState state) noexcept -> std::string_view {
    switch (state) {
        case WorkerState::idle:          return "idle";
        case WorkerState::running:       return "running";
        case WorkerState::stealing:      return "stealing";
        case WorkerState::shutting_down: return "shutting_down";
    }
    return "unknown";
}

/// Scheduler counters, aggregated over all workers.
struct PoolStats {
    std::uint64_t tasks_submitted = 0;  ///< Forked from outside the pool.
    std::uint64_t tasks_forked = 0;     ///< Forked by the pool's own workers.
    std::uint64_t tasks_executed = 0;   ///< Ran to a terminal state.
    std::uint64_t tasks_failed = 0;     ///< Ran and raised an exception.
    std::uint64_t tasks_stolen = 0;     ///< Taken from a peer worker's queue.
    std::uint64_t idle_parks = 0;       ///< Times a worker parked for lack of work.

    auto operator==(const PoolStats&) const -> bool = default;
};

/// A fixed-size work-stealing fork/join pool.
///
/// Each worker owns a deque of forked tasks: it pushes and pops at one end
/// (most recent split first) while idle workers steal from the other end
/// (oldest, largest work first). Tasks forked from a thread that is not a
/// worker of this pool go through a shared submission queue.
///
/// join() never parks a worker on another task: while the joined task is
/// still running elsewhere the joining worker executes other queued work.
/// Only a thread that is no pool's worker blocks in join().
///
/// The pool is an ordinary owned object. It starts its threads in the
/// constructor and stops them in shutdown() or the destructor.
///
/// @code
/// auto pool = Pool{};
/// auto fib = [&](auto& self, int n) -> long {
///     if (n < 2) return n;
///     auto left = Task{[&] { return self(self, n - 1); }};
///     pool.fork(left);
///     auto right = self(self, n - 2);
///     return pool.join(left) + right;
/// };
/// auto result = pool.invoke([&] { return fib(fib, 30); });
/// @endcode
class Pool {
public:
    /// Construct with hardware_concurrency() workers.
    Pool();

    /// Construct with an explicit worker count. 0 = hardware_concurrency().
    explicit Pool(unsigned int worker_count);

    /// Construct from options.
    explicit Pool(PoolOptions options);

    /// Shuts the pool down (see shutdown()).
    ~Pool();

    Pool(const Pool&) = delete;
    auto operator=(const Pool&) -> Pool& = delete;
    Pool(Pool&&) = delete;
    auto operator=(Pool&&) -> Pool& = delete;

    // -- Lifecycle ------------------------------------------------------------

    /// Stop accepting external submissions, wait for the submitted tasks
    /// still in flight, then stop and join every worker thread.
    /// Idempotent.
    /// @throws Exception (invalid_operation) when called from one of this
    ///   pool's workers.
    void shutdown();

    /// True until shutdown() has been called.
    auto is_running() const -> bool;

    // -- Introspection --------------------------------------------------------

    /// Number of worker threads.
    auto worker_count() const noexcept -> unsigned int;

    /// Options with defaults resolved (worker_count and steal_rounds are
    /// never 0).
    auto options() const noexcept -> const PoolOptions&;

    /// Snapshot of the scheduler counters.
    auto stats() const -> PoolStats;

    /// Snapshot of each worker's state, indexed by worker.
    auto worker_states() const -> std::vector<WorkerState>;

    /// Index of the calling thread if it is one of this pool's workers.
    auto current_worker_index() const noexcept -> std::optional<unsigned int>;

    // -- Fork / join ----------------------------------------------------------

    /// Schedule a pending task for execution and return immediately.
    ///
    /// On a worker of this pool the task goes onto that worker's own queue,
    /// where peers may steal it. From any other thread it goes onto the
    /// submission queue and counts as in flight until it finishes.
    /// @throws PoolShutdownError for a submission from outside the pool
    ///   after shutdown().
    /// @throws Exception (invalid_operation) if the task is not pending.
    /// If queueing fails (std::bad_alloc) the task is left pending.
    void fork(TaskBase& task);

    /// Wait until a forked task is terminal, without rethrowing its error.
    ///
    /// On a worker of any pool this executes that worker's pool's queued
    /// work in the meantime, also when the task was forked on another pool.
    /// @throws Exception (invalid_operation) if the task was never forked.
    void wait(TaskBase& task);

    /// Wait for a forked task and return its result.
    ///
    /// Returns immediately when the task is already terminal; repeated
    /// joins return the same outcome.
    /// @throws TaskExecutionError if the task failed. The exception raised
    ///   by its work is nested inside.
    template <typename R>
    auto join(Task<R>& task) -> R {
        wait(task);
        if (task.state() == TaskState::failed) {
            task.rethrow_error();
        }
        return task.result();
    }

    /// Fork a task and join it.
    template <typename R>
    auto invoke(Task<R>& task) -> R {
        fork(task);
        return join(task);
    }

    /// Run a callable as a task in this pool and return its result.
    template <typename Fn>
        requires std::invocable<Fn&> && (!std::derived_from<std::remove_cvref_t<Fn>, TaskBase>)
    auto invoke(Fn&& fn) -> std::invoke_result_t<Fn&> {
        using R = std::invoke_result_t<Fn&>;
        auto task = Task<R>{std::forward<Fn>(fn)};
        return invoke(task);
    }

private:
    std::unique_ptr<detail::PoolState> state_;
};

}  // namespace forkjoin_cpp
