// Reference merge sort on Taskflow's work-stealing executor, recursing with
// Subflow the way forkjoin_cpp::sort recurses with fork/join.

#include <forkjoin-cpp/forkjoin.hpp>

#include <benchmark/benchmark.h>
#include <taskflow/taskflow.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <vector>

namespace {

auto random_array(std::size_t size) -> std::vector<int> {
    auto rng = std::mt19937{20240601};
    auto dist = std::uniform_int_distribution<int>{
        std::numeric_limits<int>::min(), std::numeric_limits<int>::max()};
    auto values = std::vector<int>(size);
    for (auto& v : values) v = dist(rng);
    return values;
}

void subflow_sort(tf::Subflow& sf, std::vector<int>& values, std::size_t first,
                  std::size_t last, std::size_t threshold) {
    const auto begin = values.begin() + static_cast<std::ptrdiff_t>(first);
    const auto end = values.begin() + static_cast<std::ptrdiff_t>(last);
    if (last - first <= threshold) {
        std::stable_sort(begin, end);
        return;
    }
    const auto mid = first + (last - first) / 2;
    sf.emplace([&values, first, mid, threshold](tf::Subflow& child) {
        subflow_sort(child, values, first, mid, threshold);
    });
    sf.emplace([&values, mid, last, threshold](tf::Subflow& child) {
        subflow_sort(child, values, mid, last, threshold);
    });
    sf.join();
    std::inplace_merge(begin, values.begin() + static_cast<std::ptrdiff_t>(mid), end);
}

}  // namespace

// range(0) = array size, range(1) = sequential threshold.
static void bm_taskflow_sort(benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    const auto threshold = static_cast<std::size_t>(state.range(1));
    const auto input = random_array(size);
    auto executor = tf::Executor{};
    for (auto _ : state) {
        state.PauseTiming();
        auto values = input;
        auto taskflow = tf::Taskflow{};
        taskflow.emplace([&](tf::Subflow& sf) { subflow_sort(sf, values, 0, size, threshold); });
        state.ResumeTiming();
        executor.run(taskflow).wait();
        benchmark::DoNotOptimize(values.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_taskflow_sort)
    ->ArgsProduct({{1'000'000, 20'000'000}, {4096, 20'000}})
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

// The same sizes and thresholds on forkjoin_cpp::Pool, for a side-by-side run.
static void bm_pool_sort(benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    const auto input = random_array(size);
    auto pool = forkjoin_cpp::Pool{};
    auto options = forkjoin_cpp::SortOptions{};
    options.sequential_threshold = static_cast<std::size_t>(state.range(1));
    for (auto _ : state) {
        state.PauseTiming();
        auto values = input;
        state.ResumeTiming();
        forkjoin_cpp::sort(pool, values, options);
        benchmark::DoNotOptimize(values.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_pool_sort)
    ->ArgsProduct({{1'000'000, 20'000'000}, {4096, 20'000}})
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();
