#include <forkjoin-cpp/task.hpp>
#include <forkjoin-cpp/error.hpp>
#include <forkjoin-cpp/pool.hpp>

#include "pool_state.hpp"

#include <atomic>
#include <exception>
#include <string>

namespace forkjoin_cpp {

namespace {

auto next_task_id() noexcept -> TaskId {
    static auto counter = std::atomic<TaskId>{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

}  // anonymous namespace

TaskBase::TaskBase() : id_{next_task_id()} {}

void TaskBase::await_if_forked() noexcept {
    if (state() == TaskState::forked) {
        pool_->wait(*this);
    }
}

void TaskBase::rethrow_error() const {
    try {
        std::rethrow_exception(error_);
    } catch (const TaskExecutionError&) {
        throw;
    } catch (const std::exception& e) {
        std::throw_with_nested(TaskExecutionError{
            "task " + std::to_string(id_) + " failed: " + e.what()});
    } catch (...) {
        std::throw_with_nested(TaskExecutionError{
            "task " + std::to_string(id_) + " failed with a non-standard exception"});
    }
}

namespace detail {

void TaskAccess::mark_forked(TaskBase& task, Pool& pool, bool external) {
    if (task.state_.load(std::memory_order_relaxed) != TaskState::pending) {
        throw Exception{Error{ErrorKind::invalid_operation,
            "task " + std::to_string(task.id_) + " is " +
            std::string{to_string_view(task.state())} + ", only a pending task can be forked"}};
    }
    task.pool_ = &pool;
    task.external_ = external;
    // Release so that whoever dequeues the task sees pool_ and external_.
    task.state_.store(TaskState::forked, std::memory_order_release);
}

auto TaskAccess::execute(TaskBase& task) noexcept -> TaskState {
    try {
        task.compute();
        return TaskState::completed;
    } catch (...) {
        task.error_ = std::current_exception();
        return TaskState::failed;
    }
}

}  // namespace detail

}  // namespace forkjoin_cpp
