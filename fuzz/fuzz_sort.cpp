// Fuzz target for the parallel merge sort. The output must equal
// std::stable_sort's for any input, threshold, and window.
//
// Input layout: byte 0 = sequential threshold, bytes 1-2 = window start and
// length as fractions of the array, remaining bytes = element keys. Each
// element carries its input position so that stability is checked too.

#include <forkjoin-cpp/forkjoin.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace {

// One pool for the whole fuzzing session.
auto pool() -> forkjoin_cpp::Pool& {
    static auto instance = forkjoin_cpp::Pool{4u};
    return instance;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 3) return 0;

    auto options = forkjoin_cpp::SortOptions{};
    options.sequential_threshold = data[0];

    auto values = std::vector<std::pair<std::uint8_t, std::size_t>>{};
    for (std::size_t i = 3; i < size; ++i) {
        values.emplace_back(data[i], i);
    }
    const auto n = values.size();
    const auto offset = n * data[1] / 256;
    const auto length = (n - offset) * data[2] / 255;

    auto by_key = [](const auto& a, const auto& b) { return a.first < b.first; };

    auto expected = values;
    std::stable_sort(expected.begin() + static_cast<std::ptrdiff_t>(offset),
                     expected.begin() + static_cast<std::ptrdiff_t>(offset + length), by_key);

    forkjoin_cpp::sort_range(pool(), values, offset, length, by_key, options);
    if (values != expected) __builtin_trap();

    // Whole-array sort on top of the windowed one.
    std::stable_sort(expected.begin(), expected.end(), by_key);
    forkjoin_cpp::sort(pool(), values, by_key, options);
    if (values != expected) __builtin_trap();

    return 0;
}
