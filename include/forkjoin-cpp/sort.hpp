/// @file sort.hpp
/// @brief Parallel stable merge sort on top of the fork/join Pool.

#pragma once

#include <forkjoin-cpp/pool.hpp>
#include <forkjoin-cpp/task.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <ranges>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace forkjoin_cpp {

/// Default problem size below which the sort stops forking.
inline constexpr std::size_t default_sequential_threshold = 4096;

/// A mutating phase of the sort, reported to SortOptions::trace.
struct RangeEvent {
    enum class Kind : std::uint8_t {
        sort_begin,   ///< Sequential base-case sort starts on the range.
        sort_end,     ///< ...and has finished.
        merge_begin,  ///< Merge of the range's two sorted halves starts.
        merge_end,    ///< ...and has finished.
    };

    Kind kind;
    std::size_t offset;  ///< Offset into the array passed to sort().
    std::size_t length;

    auto operator==(const RangeEvent&) const -> bool = default;
};

/// Convert a RangeEvent::Kind to its string representation.
constexpr auto to_string_view(RangeEvent::Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case RangeEvent::Kind::sort_begin:  return "sort_begin";
        case RangeEvent::Kind::sort_end:    return "sort_end";
        case RangeEvent::Kind::merge_begin: return "merge_begin";
        case RangeEvent::Kind::merge_end:   return "merge_end";
    }
    return "unknown";
}

/// Instrumentation hook. Called concurrently from several workers.
using SortTrace = std::function<void(const RangeEvent&)>;

/// Tuning and instrumentation for sort().
struct SortOptions {
    /// Ranges of at most this many elements are sorted sequentially
    /// (std::stable_sort) instead of being split. 0 behaves like 1.
    std::size_t sequential_threshold = default_sequential_threshold;

    /// Optional hook invoked around every base-case sort and merge.
    SortTrace trace;
};

/// A validated [offset, offset + length) window over an array.
///
/// Sub-problems are produced by split(), which always yields two disjoint
/// halves; concurrently running sort tasks therefore never share elements.
struct SortRange {
    std::size_t offset = 0;
    std::size_t length = 0;

    /// Validate a window over an array of array_size elements.
    /// @throws InvalidRangeError if offset + length overflows or exceeds
    ///   array_size.
    static auto make(std::size_t array_size, std::size_t offset, std::size_t length) -> SortRange;

    /// One past the last index.
    constexpr auto end() const noexcept -> std::size_t { return offset + length; }

    constexpr auto empty() const noexcept -> bool { return length == 0; }

    /// Left half has floor(length / 2) elements, right half the rest.
    constexpr auto split() const noexcept -> std::pair<SortRange, SortRange> {
        const auto half = length / 2;
        return {SortRange{offset, half}, SortRange{offset + half, length - half}};
    }

    /// True if the two windows share at least one index.
    constexpr auto overlaps(const SortRange& other) const noexcept -> bool {
        return offset < other.end() && other.offset < end() && !empty() && !other.empty();
    }

    auto operator==(const SortRange&) const -> bool = default;
};

namespace detail {

// Merge slice[0, mid) and slice[mid, size) in place, taking from the left
// half on ties. The left half is moved out into a buffer first; the right
// half is read in place, since the write position never passes it.
template <typename T, typename Compare>
void merge_halves(std::span<T> slice, std::size_t mid, Compare& comp) {
    const auto first = slice.begin();
    const auto middle = first + static_cast<std::ptrdiff_t>(mid);
    const auto last = slice.end();

    // Already in order: nothing to move.
    if (!comp(*middle, *(middle - 1))) return;

    auto buffer = std::vector<T>(std::make_move_iterator(first), std::make_move_iterator(middle));
    auto left = buffer.begin();
    auto right = middle;
    auto out = first;
    try {
        while (left != buffer.end() && right != last) {
            if (comp(*right, *left)) {
                *out++ = std::move(*right++);
            } else {
                *out++ = std::move(*left++);
            }
        }
    } catch (...) {
        // The unmerged buffered elements fill exactly the gap [out, right).
        std::move(left, buffer.end(), out);
        throw;
    }
    // Whatever remains on the right is already in its final place.
    std::move(left, buffer.end(), out);
}

template <typename T, typename Compare>
struct SortJob {
    Pool& pool;
    std::span<T> data;
    Compare& comp;
    std::size_t threshold;
    const SortTrace& trace;

    void emit(RangeEvent::Kind kind, const SortRange& range) const {
        if (trace) trace(RangeEvent{kind, range.offset, range.length});
    }

    // Sorts data[range]. The left half is forked so an idle worker can
    // steal it; the right half runs here, then the left is joined.
    void run(SortRange range) {
        auto slice = data.subspan(range.offset, range.length);
        if (range.length <= threshold) {
            emit(RangeEvent::Kind::sort_begin, range);
            std::stable_sort(slice.begin(), slice.end(), comp);
            emit(RangeEvent::Kind::sort_end, range);
            return;
        }

        const auto halves = range.split();
        const auto left = halves.first;
        const auto right = halves.second;
        auto left_task = Task<void>{[this, left] { run(left); }};
        pool.fork(left_task);
        run(right);
        pool.join(left_task);

        emit(RangeEvent::Kind::merge_begin, range);
        merge_halves(slice, left.length, comp);
        emit(RangeEvent::Kind::merge_end, range);
    }
};

template <typename T, typename Compare>
void sort_window(Pool& pool, std::span<T> data, SortRange range, Compare& comp,
                 const SortOptions& options) {
    if (range.empty()) return;
    auto job = SortJob<T, Compare>{pool, data, comp,
                                   std::max<std::size_t>(options.sequential_threshold, 1),
                                   options.trace};
    pool.invoke([&job, range] { job.run(range); });
}

template <typename Range>
auto as_span(Range& range) {
    return std::span{std::ranges::data(range), std::ranges::size(range)};
}

}  // namespace detail

/// Stable parallel merge sort of a contiguous range, in place.
///
/// Submits one top-level task to the pool and returns when it is done; from
/// a worker of the same pool the call joins it without blocking the worker.
/// An empty range returns immediately without submitting anything.
///
/// comp must be a strict weak ordering that is safe to call from several
/// threads at once.
///
/// @throws TaskExecutionError if comp (or an element move) throws; the
///   original exception is nested inside. The range is then left in an
///   unspecified order. A throw from comp during a merge keeps every
///   element in the range; a throw inside the sequential base case has
///   std::stable_sort's guarantees.
/// @throws PoolShutdownError if called from outside the pool after shutdown().
///
/// @code
/// auto pool = Pool{};
/// auto values = std::vector<int>{5, 3, 1, 4, 2};
/// sort(pool, values);  // {1, 2, 3, 4, 5}
/// @endcode
template <std::ranges::contiguous_range Range, typename Compare = std::less<>>
    requires std::ranges::sized_range<Range> &&
             std::sortable<std::ranges::iterator_t<Range>, Compare>
void sort(Pool& pool, Range&& range, Compare comp = {}, const SortOptions& options = {}) {
    auto data = detail::as_span(range);
    detail::sort_window(pool, data, SortRange{0, data.size()}, comp, options);
}

/// Stable parallel sort with the default ordering and explicit options.
template <std::ranges::contiguous_range Range>
    requires std::ranges::sized_range<Range> &&
             std::sortable<std::ranges::iterator_t<Range>>
void sort(Pool& pool, Range&& range, const SortOptions& options) {
    sort(pool, std::forward<Range>(range), std::less<>{}, options);
}

/// Sort only range[offset, offset + length), leaving the rest untouched.
/// @throws InvalidRangeError if the window does not fit the range; nothing
///   is submitted in that case.
template <std::ranges::contiguous_range Range, typename Compare = std::less<>>
    requires std::ranges::sized_range<Range> &&
             std::sortable<std::ranges::iterator_t<Range>, Compare>
void sort_range(Pool& pool, Range&& range, std::size_t offset, std::size_t length,
                Compare comp = {}, const SortOptions& options = {}) {
    auto data = detail::as_span(range);
    const auto window = SortRange::make(data.size(), offset, length);
    detail::sort_window(pool, data, window, comp, options);
}

}  // namespace forkjoin_cpp
