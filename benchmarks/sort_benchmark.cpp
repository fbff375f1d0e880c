// forkjoin-cpp benchmarks — parallel merge sort against std::stable_sort.

#include <forkjoin-cpp/forkjoin.hpp>

#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <vector>

using namespace forkjoin_cpp;

namespace {

auto random_array(std::size_t size) -> std::vector<int> {
    auto rng = std::mt19937{20240601};
    auto dist = std::uniform_int_distribution<int>{
        std::numeric_limits<int>::min(), std::numeric_limits<int>::max()};
    auto values = std::vector<int>(size);
    for (auto& v : values) v = dist(rng);
    return values;
}

}  // namespace

// =============================================================================
// Baseline
// =============================================================================

static void bm_stable_sort(benchmark::State& state) {
    const auto input = random_array(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        state.PauseTiming();
        auto values = input;
        state.ResumeTiming();
        std::stable_sort(values.begin(), values.end());
        benchmark::DoNotOptimize(values.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_stable_sort)->RangeMultiplier(10)->Range(100'000, 20'000'000)
    ->Unit(benchmark::kMillisecond);

// =============================================================================
// Pool sort: worker count
// =============================================================================

// range(0) = array size, range(1) = worker count (0 = hardware).
static void bm_pool_sort_workers(benchmark::State& state) {
    const auto input = random_array(static_cast<std::size_t>(state.range(0)));
    auto pool = Pool{static_cast<unsigned int>(state.range(1))};
    for (auto _ : state) {
        state.PauseTiming();
        auto values = input;
        state.ResumeTiming();
        sort(pool, values);
        benchmark::DoNotOptimize(values.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
    const auto stats = pool.stats();
    state.counters["stolen/iter"] = benchmark::Counter(
        static_cast<double>(stats.tasks_stolen), benchmark::Counter::kAvgIterations);
}
BENCHMARK(bm_pool_sort_workers)
    ->ArgsProduct({{1'000'000, 20'000'000}, {1, 2, 4, 8, 0}})
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

// =============================================================================
// Pool sort: sequential threshold
// =============================================================================

// range(0) = sequential threshold; hardware worker count, 20M elements.
static void bm_pool_sort_threshold(benchmark::State& state) {
    const auto input = random_array(20'000'000);
    auto pool = Pool{};
    auto options = SortOptions{};
    options.sequential_threshold = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        state.PauseTiming();
        auto values = input;
        state.ResumeTiming();
        sort(pool, values, options);
        benchmark::DoNotOptimize(values.data());
    }
    state.SetItemsProcessed(state.iterations() * 20'000'000);
}
BENCHMARK(bm_pool_sort_threshold)
    ->Arg(512)->Arg(4096)->Arg(20'000)->Arg(100'000)->Arg(1'000'000)
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

// =============================================================================
// Scheduler overhead: fork/join of empty tasks
// =============================================================================

static void bm_fork_join_empty(benchmark::State& state) {
    auto pool = Pool{};
    const auto n = state.range(0);
    for (auto _ : state) {
        pool.invoke([&] {
            auto storage = std::vector<std::unique_ptr<Task<void>>>{};
            storage.reserve(static_cast<std::size_t>(n));
            for (std::int64_t i = 0; i < n; ++i) {
                storage.push_back(std::make_unique<Task<void>>([] {}));
                pool.fork(*storage.back());
            }
            for (auto& t : storage) pool.join(*t);
        });
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_fork_join_empty)->Range(64, 65536)->UseRealTime();
