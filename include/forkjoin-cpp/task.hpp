/// @file task.hpp
/// @brief Fork/join tasks: TaskState lifecycle, TaskBase, and Task<R>.

#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace forkjoin_cpp {

class Pool;

namespace detail {
struct TaskAccess;
}  // namespace detail

/// Lifecycle of a task. Transitions only move forward:
/// pending -> forked -> completed, or pending -> forked -> failed.
enum class TaskState : std::uint8_t {
    pending,    ///< Created, not yet queued.
    forked,     ///< Queued or currently executing.
    completed,  ///< Work returned normally; the result slot is filled.
    failed,     ///< Work raised an exception; the error slot is filled.
};

/// Convert a TaskState to its string representation.
constexpr auto to_string_view(TaskState state) noexcept -> std::string_view {
    switch (state) {
        case TaskState::pending:   return "pending";
        case TaskState::forked:    return "forked";
        case TaskState::completed: return "completed";
        case TaskState::failed:    return "failed";
    }
    return "unknown";
}

/// True for completed and failed.
constexpr auto is_terminal(TaskState state) noexcept -> bool {
    return state == TaskState::completed || state == TaskState::failed;
}

/// Opaque task identity, unique per task instantiation within a process.
using TaskId = std::uint64_t;

/// Type-erased part of a task, as seen by the scheduler.
///
/// The scheduler queues raw TaskBase pointers, so a task must stay at a
/// fixed address while it is forked: tasks are neither copyable nor
/// movable, and Task<R> waits for an outstanding execution in its
/// destructor.
///
/// The state is the publication point of the result slot: it is stored
/// with release ordering after the result or error has been written, and
/// read with acquire ordering, so a thread that observes a terminal state
/// also observes the outcome.
class TaskBase {
public:
    TaskBase(const TaskBase&) = delete;
    auto operator=(const TaskBase&) -> TaskBase& = delete;
    TaskBase(TaskBase&&) = delete;
    auto operator=(TaskBase&&) -> TaskBase& = delete;

    /// Unique identity of this task.
    auto id() const noexcept -> TaskId { return id_; }

    /// Current lifecycle state.
    auto state() const noexcept -> TaskState {
        return state_.load(std::memory_order_acquire);
    }

    /// True once the task is completed or failed.
    auto is_done() const noexcept -> bool { return is_terminal(state()); }

    /// The exception raised by the task's work, or nullptr.
    /// Only meaningful once state() is failed.
    auto error() const noexcept -> std::exception_ptr {
        return state() == TaskState::failed ? error_ : nullptr;
    }

protected:
    TaskBase();
    ~TaskBase() = default;

    // Waits for a forked task to become terminal. Must be called from the
    // destructor of the most-derived class, before its members go away.
    void await_if_forked() noexcept;

private:
    friend class Pool;
    friend struct detail::TaskAccess;

    virtual void compute() = 0;

    // Throws TaskExecutionError describing error_, with error_ nested.
    // An error that already is a TaskExecutionError is rethrown as is.
    [[noreturn]] void rethrow_error() const;

    TaskId id_;
    Pool* pool_ = nullptr;
    bool external_ = false;
    std::exception_ptr error_;
    std::atomic<TaskState> state_{TaskState::pending};
};

/// A unit of fork/join work producing a value of type R (or nothing).
///
/// @code
/// auto pool = Pool{4u};
/// auto task = Task{[] { return 6 * 7; }};
/// auto answer = pool.invoke(task);  // 42
/// @endcode
template <typename R>
class Task final : public TaskBase {
public:
    using result_type = R;

    /// Wrap a callable. The callable runs at most once, on a pool worker.
    explicit Task(std::function<R()> fn) : fn_{std::move(fn)} {}

    ~Task() { await_if_forked(); }

private:
    friend class Pool;

    void compute() override {
        if constexpr (std::is_void_v<R>) {
            fn_();
        } else {
            result_.emplace(fn_());
        }
    }

    auto result() -> R {
        if constexpr (!std::is_void_v<R>) {
            if constexpr (std::is_copy_constructible_v<R>) {
                return *result_;
            } else {
                return std::move(*result_);
            }
        }
    }

    using Storage = std::conditional_t<std::is_void_v<R>, std::monostate, std::optional<R>>;

    std::function<R()> fn_;
    Storage result_{};
};

template <typename Fn>
Task(Fn) -> Task<std::invoke_result_t<Fn&>>;

}  // namespace forkjoin_cpp
