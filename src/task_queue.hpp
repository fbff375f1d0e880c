#pragma once

// Per-worker work-stealing deque of task pointers.
// Internal header — not installed.
//
// Lock-free dynamic circular deque after
//   D. Chase and Y. Lev, "Dynamic circular work-stealing deque", SPAA 2005,
// with the C11 memory orderings of
//   N. M. Lê, A. Pop, A. Cohen, F. Zappa Nardelli, "Correct and efficient
//   work-stealing for weak memory models", PPoPP 2013.
//
// The owner pushes and pops at the bottom; thieves take from the top with a
// CAS on the top index. A lost CAS makes steal() return nullptr even though
// the queue may still hold work; callers treat that like an empty queue and
// move on to the next victim.
//
// Retired buffers stay alive until the queue is destroyed: a thief may still
// be reading through a buffer pointer it loaded before the owner grew it.

#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace forkjoin_cpp {
class TaskBase;
}  // namespace forkjoin_cpp

namespace forkjoin_cpp::detail {

class TaskQueue {
public:
    static constexpr std::size_t default_capacity = 64;

    explicit TaskQueue(std::size_t capacity = default_capacity) {
        auto initial = std::make_unique<Buffer>(std::bit_ceil(capacity < 2 ? std::size_t{2} : capacity));
        buffer_.store(initial.get(), std::memory_order_relaxed);
        buffers_.push_back(std::move(initial));
    }

    TaskQueue(const TaskQueue&) = delete;
    auto operator=(const TaskQueue&) -> TaskQueue& = delete;
    TaskQueue(TaskQueue&&) = delete;
    auto operator=(TaskQueue&&) -> TaskQueue& = delete;

    // Owner only. Never blocks; grows the buffer when full.
    void push_own(TaskBase* task) {
        auto bottom = bottom_.load(std::memory_order_relaxed);
        auto top = top_.load(std::memory_order_acquire);
        auto* buffer = buffer_.load(std::memory_order_relaxed);
        if (bottom - top > static_cast<std::int64_t>(buffer->capacity()) - 1) {
            buffer = grow(buffer, top, bottom);
        }
        buffer->slot(bottom).store(task, std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_release);
        bottom_.store(bottom + 1, std::memory_order_relaxed);
    }

    // Owner only. Most recently pushed task first; nullptr when empty.
    auto pop_own() -> TaskBase* {
        auto bottom = bottom_.load(std::memory_order_relaxed) - 1;
        auto* buffer = buffer_.load(std::memory_order_relaxed);
        bottom_.store(bottom, std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_seq_cst);
        auto top = top_.load(std::memory_order_relaxed);

        if (top > bottom) {
            bottom_.store(bottom + 1, std::memory_order_relaxed);
            return nullptr;
        }

        auto* task = buffer->slot(bottom).load(std::memory_order_relaxed);
        if (top == bottom) {
            // Last element: race the thieves for it.
            if (!top_.compare_exchange_strong(top, top + 1,
                                              std::memory_order_seq_cst,
                                              std::memory_order_relaxed)) {
                task = nullptr;
            }
            bottom_.store(bottom + 1, std::memory_order_relaxed);
        }
        return task;
    }

    // Any thread. Oldest task first; nullptr when empty or on a lost race.
    auto steal() -> TaskBase* {
        auto top = top_.load(std::memory_order_acquire);
        std::atomic_thread_fence(std::memory_order_seq_cst);
        auto bottom = bottom_.load(std::memory_order_acquire);
        if (top >= bottom) {
            return nullptr;
        }

        auto* buffer = buffer_.load(std::memory_order_acquire);
        auto* task = buffer->slot(top).load(std::memory_order_relaxed);
        if (!top_.compare_exchange_strong(top, top + 1,
                                          std::memory_order_seq_cst,
                                          std::memory_order_relaxed)) {
            return nullptr;
        }
        return task;
    }

    // Approximate when other threads are active.
    auto size() const noexcept -> std::size_t {
        auto bottom = bottom_.load(std::memory_order_relaxed);
        auto top = top_.load(std::memory_order_relaxed);
        return bottom > top ? static_cast<std::size_t>(bottom - top) : 0;
    }

    auto empty() const noexcept -> bool { return size() == 0; }

    auto capacity() const noexcept -> std::size_t {
        return buffer_.load(std::memory_order_relaxed)->capacity();
    }

private:
    struct Buffer {
        explicit Buffer(std::size_t capacity)
            : mask{capacity - 1},
              slots{std::make_unique<std::atomic<TaskBase*>[]>(capacity)} {}

        auto capacity() const noexcept -> std::size_t { return mask + 1; }

        auto slot(std::int64_t index) const noexcept -> std::atomic<TaskBase*>& {
            return slots[static_cast<std::size_t>(index) & mask];
        }

        std::size_t mask;
        std::unique_ptr<std::atomic<TaskBase*>[]> slots;
    };

    auto grow(Buffer* old, std::int64_t top, std::int64_t bottom) -> Buffer* {
        auto bigger = std::make_unique<Buffer>(old->capacity() * 2);
        for (auto i = top; i != bottom; ++i) {
            bigger->slot(i).store(old->slot(i).load(std::memory_order_relaxed),
                                  std::memory_order_relaxed);
        }
        auto* raw = bigger.get();
        buffers_.push_back(std::move(bigger));
        buffer_.store(raw, std::memory_order_release);
        return raw;
    }

    alignas(64) std::atomic<std::int64_t> top_{0};
    alignas(64) std::atomic<std::int64_t> bottom_{0};
    alignas(64) std::atomic<Buffer*> buffer_{nullptr};
    std::vector<std::unique_ptr<Buffer>> buffers_;  // owner only
};

}  // namespace forkjoin_cpp::detail
