#include <forkjoin-cpp/pool.hpp>

#include "pool_state.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <stop_token>
#include <string>
#include <thread>

namespace forkjoin_cpp {

namespace {

using detail::PoolState;
using detail::TaskAccess;
using detail::Worker;
using detail::WorkerCounters;

thread_local Worker* this_worker = nullptr;

auto resolve(PoolOptions options) -> PoolOptions {
    if (options.worker_count == 0) {
        options.worker_count = std::max(1u, std::thread::hardware_concurrency());
    }
    if (options.steal_rounds == 0) {
        options.steal_rounds = 2 * (static_cast<std::size_t>(options.worker_count) + 1);
    }
    if (options.idle_backoff.count() < 0) {
        options.idle_backoff = std::chrono::microseconds{0};
    }
    return options;
}

// The calling thread's worker, if it belongs to this pool.
auto worker_of(const PoolState& state) noexcept -> Worker* {
    return (this_worker != nullptr && &this_worker->pool == &state) ? this_worker : nullptr;
}

void execute(Worker& w, TaskBase& task) {
    w.state.store(WorkerState::running, std::memory_order_relaxed);
    const auto external = TaskAccess::is_external(task);
    const auto outcome = TaskAccess::execute(task);
    if (outcome == TaskState::failed) {
        WorkerCounters::bump(w.counters.failed);
    }
    WorkerCounters::bump(w.counters.executed);

    // Nothing below may touch the task once its state is published.
    if (!external) {
        TaskAccess::publish(task, outcome);
        return;
    }
    auto& pool = w.pool;
    {
        auto lock = std::scoped_lock{pool.done_mutex};
        TaskAccess::publish(task, outcome);
        --pool.in_flight;
    }
    pool.done_cv.notify_all();
}

// One sweep over every peer queue plus the submission queue, starting at a
// random victim.
auto steal_task(Worker& w) -> TaskBase* {
    auto& pool = w.pool;
    const auto peers = pool.workers.size();
    const auto victims = peers + 1;
    w.state.store(WorkerState::stealing, std::memory_order_relaxed);

    const auto start = std::uniform_int_distribution<std::size_t>{0, victims - 1}(w.rng);
    for (std::size_t i = 0; i < victims; ++i) {
        const auto victim = (start + i) % victims;
        if (victim == w.index) continue;
        if (victim == peers) {
            if (auto* task = pool.submissions.try_pop()) return task;
        } else if (auto* task = pool.workers[victim]->queue.steal()) {
            WorkerCounters::bump(w.counters.stolen);
            return task;
        }
    }
    return nullptr;
}

auto find_task(Worker& w) -> TaskBase* {
    if (auto* task = w.queue.pop_own()) return task;
    return steal_task(w);
}

void park(Worker& w, std::stop_token st) {
    auto& pool = w.pool;
    w.state.store(WorkerState::idle, std::memory_order_relaxed);
    WorkerCounters::bump(w.counters.parks);

    pool.sleepers.fetch_add(1, std::memory_order_acq_rel);
    const auto seen = pool.work_epoch.load(std::memory_order_acquire);
    {
        auto lock = std::unique_lock{pool.idle_mutex};
        pool.idle_cv.wait_for(lock, st, pool.options.idle_backoff, [&] {
            return pool.work_epoch.load(std::memory_order_acquire) != seen ||
                   !pool.submissions.empty();
        });
    }
    pool.sleepers.fetch_sub(1, std::memory_order_release);
}

void run_worker(Worker& w, std::stop_token st) {
    this_worker = &w;
    auto failed_sweeps = std::size_t{0};
    while (!st.stop_requested()) {
        if (auto* task = find_task(w)) {
            execute(w, *task);
            failed_sweeps = 0;
            continue;
        }
        if (++failed_sweeps <= w.pool.options.steal_rounds) {
            std::this_thread::yield();
            continue;
        }
        park(w, st);
    }
    w.state.store(WorkerState::shutting_down, std::memory_order_relaxed);
    this_worker = nullptr;
}

// Join on a worker: run other work until the task is terminal. Never parks.
void help_until_done(Worker& w, TaskBase& task) {
    auto failed_sweeps = std::size_t{0};
    while (!task.is_done()) {
        if (auto* other = find_task(w)) {
            execute(w, *other);
            failed_sweeps = 0;
        } else if (++failed_sweeps > w.pool.options.steal_rounds) {
            std::this_thread::yield();
        }
    }
    w.state.store(WorkerState::running, std::memory_order_relaxed);
}

// Join from outside the pool: the caller is not a worker, so it may block.
void block_until_done(PoolState& state, const TaskBase& task) {
    auto lock = std::unique_lock{state.done_mutex};
    if (TaskAccess::is_external(task)) {
        state.done_cv.wait(lock, [&] { return task.is_done(); });
        return;
    }
    // Forked by a worker; nobody signals its completion, so poll.
    while (!task.is_done()) {
        state.done_cv.wait_for(lock, std::chrono::milliseconds{1});
    }
}

}  // anonymous namespace

Pool::Pool() : Pool{PoolOptions{}} {}

Pool::Pool(unsigned int worker_count) : Pool{PoolOptions{.worker_count = worker_count}} {}

Pool::Pool(PoolOptions options)
    : state_{std::make_unique<PoolState>(resolve(options))} {
    auto& state = *state_;
    auto seeds = std::random_device{};
    state.workers.reserve(state.options.worker_count);
    for (unsigned int i = 0; i < state.options.worker_count; ++i) {
        state.workers.push_back(std::make_unique<Worker>(state, i, seeds()));
    }
    // Start threads only once every queue exists: workers steal from each other.
    for (auto& w : state.workers) {
        w->thread = std::jthread{[worker = w.get()](std::stop_token st) { run_worker(*worker, st); }};
    }
}

Pool::~Pool() {
    shutdown();
}

void Pool::shutdown() {
    auto& state = *state_;
    if (worker_of(state) != nullptr) {
        throw Exception{Error{ErrorKind::invalid_operation,
                              "shutdown() called from a worker of the same pool"}};
    }

    auto guard = std::scoped_lock{state.shutdown_mutex};
    if (state.stopped) return;
    {
        auto lock = std::unique_lock{state.done_mutex};
        state.accepting = false;
        state.done_cv.wait(lock, [&] { return state.in_flight == 0; });
    }
    for (auto& w : state.workers) {
        w->thread.request_stop();
    }
    state.idle_cv.notify_all();
    for (auto& w : state.workers) {
        if (w->thread.joinable()) w->thread.join();
    }
    state.stopped = true;
}

auto Pool::is_running() const -> bool {
    auto lock = std::scoped_lock{state_->done_mutex};
    return state_->accepting;
}

auto Pool::worker_count() const noexcept -> unsigned int {
    return state_->options.worker_count;
}

auto Pool::options() const noexcept -> const PoolOptions& {
    return state_->options;
}

auto Pool::stats() const -> PoolStats {
    auto result = PoolStats{};
    result.tasks_submitted = state_->submitted.load(std::memory_order_relaxed);
    for (const auto& w : state_->workers) {
        result.tasks_forked += w->counters.forked.load(std::memory_order_relaxed);
        result.tasks_executed += w->counters.executed.load(std::memory_order_relaxed);
        result.tasks_failed += w->counters.failed.load(std::memory_order_relaxed);
        result.tasks_stolen += w->counters.stolen.load(std::memory_order_relaxed);
        result.idle_parks += w->counters.parks.load(std::memory_order_relaxed);
    }
    return result;
}

auto Pool::worker_states() const -> std::vector<WorkerState> {
    auto result = std::vector<WorkerState>{};
    result.reserve(state_->workers.size());
    for (const auto& w : state_->workers) {
        result.push_back(w->state.load(std::memory_order_relaxed));
    }
    return result;
}

auto Pool::current_worker_index() const noexcept -> std::optional<unsigned int> {
    if (auto* w = worker_of(*state_)) return w->index;
    return std::nullopt;
}

void Pool::fork(TaskBase& task) {
    auto& state = *state_;
    if (auto* w = worker_of(state)) {
        TaskAccess::mark_forked(task, *this, false);
        try {
            w->queue.push_own(&task);
        } catch (...) {
            // Growing the queue failed; the task was never queued.
            TaskAccess::reset_pending(task);
            throw;
        }
        WorkerCounters::bump(w->counters.forked);
        state.wake_one();
        return;
    }

    {
        auto lock = std::scoped_lock{state.done_mutex};
        if (!state.accepting) {
            throw PoolShutdownError{"cannot submit task " + std::to_string(task.id()) +
                                    ": pool has been shut down"};
        }
        TaskAccess::mark_forked(task, *this, true);
        ++state.in_flight;
    }
    try {
        state.submissions.push(&task);
    } catch (...) {
        {
            auto lock = std::scoped_lock{state.done_mutex};
            TaskAccess::reset_pending(task);
            --state.in_flight;
        }
        state.done_cv.notify_all();
        throw;
    }
    state.submitted.fetch_add(1, std::memory_order_relaxed);
    state.wake_one();
}

void Pool::wait(TaskBase& task) {
    const auto current = task.state();
    if (is_terminal(current)) return;
    if (current == TaskState::pending) {
        throw Exception{Error{ErrorKind::invalid_operation,
                              "task " + std::to_string(task.id()) + " was never forked"}};
    }
    // A worker of any pool keeps running its own pool's work, even while
    // the task it waits for belongs to another pool.
    if (this_worker != nullptr) {
        help_until_done(*this_worker, task);
        return;
    }
    if (task.pool_ != this) {
        task.pool_->wait(task);
        return;
    }
    block_until_done(*state_, task);
}

}  // namespace forkjoin_cpp
