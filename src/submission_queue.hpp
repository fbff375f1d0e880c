#pragma once

// Shared FIFO for tasks forked from threads outside the pool.
// Internal header — not installed.
//
// Any number of producers and consumers, so a plain mutex around a deque;
// it only sees top-level submissions, never the recursive fork traffic.

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>

namespace forkjoin_cpp {
class TaskBase;
}  // namespace forkjoin_cpp

namespace forkjoin_cpp::detail {

class SubmissionQueue {
public:
    void push(TaskBase* task) {
        auto lock = std::scoped_lock{mutex_};
        tasks_.push_back(task);
        size_.fetch_add(1, std::memory_order_release);
    }

    // Oldest submission first; nullptr when empty.
    auto try_pop() -> TaskBase* {
        if (empty()) return nullptr;
        auto lock = std::scoped_lock{mutex_};
        if (tasks_.empty()) return nullptr;
        auto* task = tasks_.front();
        tasks_.pop_front();
        size_.fetch_sub(1, std::memory_order_relaxed);
        return task;
    }

    auto size() const noexcept -> std::size_t {
        return size_.load(std::memory_order_acquire);
    }

    auto empty() const noexcept -> bool { return size() == 0; }

private:
    std::mutex mutex_;
    std::deque<TaskBase*> tasks_;
    std::atomic<std::size_t> size_{0};
};

}  // namespace forkjoin_cpp::detail
