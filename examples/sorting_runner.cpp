// sorting_runner — times the parallel merge sort against std::stable_sort
//
// Generates arrays of random ints, sorts each with the sequential baseline
// and with forkjoin_cpp::sort at several thresholds, and prints the time of
// every trial followed by count/min/average/max. Every output is checked
// against the baseline.
//
// An optional JSON file configures the run; any key may be omitted:
//
//   {
//     "array_size": 20000000,
//     "trials": 10,
//     "seed": 42,
//     "pool": {"worker_count": 0, "steal_rounds": 0, "idle_backoff_us": 100},
//     "thresholds": [4096, 20000, 100000]
//   }
//
// Build: cmake --build build -DCMAKE_BUILD_TYPE=Release
// Run:   ./build/sorting_runner [config.json]

#include <forkjoin-cpp/forkjoin.hpp>
#include <forkjoin-cpp/json.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <fstream>
#include <functional>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace fj = forkjoin_cpp;
using json = nlohmann::json;

struct Timer {
    std::chrono::steady_clock::time_point start =
        std::chrono::steady_clock::now();
    auto ms() const -> double {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
    }
};

namespace {

struct RunnerConfig {
    std::size_t array_size = 20'000'000;
    int trials = 10;
    std::uint32_t seed = 42;
    fj::PoolOptions pool{};
    std::vector<std::size_t> thresholds{fj::default_sequential_threshold, 20'000, 100'000};
};

void from_json(const json& j, RunnerConfig& config) {
    const auto defaults = RunnerConfig{};
    config.array_size = j.value("array_size", defaults.array_size);
    config.trials = j.value("trials", defaults.trials);
    config.seed = j.value("seed", defaults.seed);
    config.pool = j.value("pool", defaults.pool);
    config.thresholds = j.value("thresholds", defaults.thresholds);
    if (config.trials < 1) {
        throw std::runtime_error{"trials must be at least 1"};
    }
}

auto load_config(int argc, char** argv) -> RunnerConfig {
    if (argc < 2) return RunnerConfig{};
    auto in = std::ifstream{argv[1]};
    if (!in) {
        throw std::runtime_error{std::string{"cannot open "} + argv[1]};
    }
    return json::parse(in).get<RunnerConfig>();
}

// Summary of per-trial wall times, in milliseconds.
struct Summary {
    std::size_t count = 0;
    double sum = 0.0;
    double min = std::numeric_limits<double>::max();
    double max = 0.0;

    void add(double ms) {
        ++count;
        sum += ms;
        min = std::min(min, ms);
        max = std::max(max, ms);
    }

    auto average() const -> double { return count == 0 ? 0.0 : sum / static_cast<double>(count); }
};

void print_summary(const Summary& s) {
    std::printf("  count=%zu, min=%.1f ms, average=%.1f ms, max=%.1f ms\n",
                s.count, s.min, s.average(), s.max);
}

auto random_array(std::size_t size, std::mt19937& rng) -> std::vector<int> {
    auto dist = std::uniform_int_distribution<int>{
        std::numeric_limits<int>::min(), std::numeric_limits<int>::max()};
    auto values = std::vector<int>(size);
    for (auto& v : values) v = dist(rng);
    return values;
}

// Runs `trials` timed sorts of fresh random arrays with `sorter`.
// Returns false if any output differs from std::stable_sort.
auto run_trials(const RunnerConfig& config, std::uint32_t seed,
                const std::function<void(std::vector<int>&)>& sorter) -> bool {
    auto rng = std::mt19937{seed};
    auto summary = Summary{};
    auto verified = true;
    for (int trial = 0; trial < config.trials; ++trial) {
        auto values = random_array(config.array_size, rng);
        auto expected = values;

        auto t = Timer{};
        sorter(values);
        const auto elapsed = t.ms();
        summary.add(elapsed);
        std::printf("  %.1f ms\n", elapsed);

        std::stable_sort(expected.begin(), expected.end());
        if (values != expected) {
            std::printf("  trial %d: output is not sorted correctly\n", trial);
            verified = false;
        }
    }
    print_summary(summary);
    return verified;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto config = load_config(argc, argv);
        auto pool = fj::Pool{config.pool};

        std::printf("Workers: %u, array size: %zu, trials: %d\n",
                    pool.worker_count(), config.array_size, config.trials);
        std::printf("Pool options: %s\n", json(pool.options()).dump().c_str());

        auto ok = true;

        std::printf("\nSequential std::stable_sort:\n");
        ok &= run_trials(config, config.seed, [](std::vector<int>& values) {
            std::stable_sort(values.begin(), values.end());
        });

        for (auto threshold : config.thresholds) {
            auto options = fj::SortOptions{};
            options.sequential_threshold = threshold;
            std::printf("\nParallel merge sort, threshold %zu:\n", threshold);
            ok &= run_trials(config, config.seed, [&](std::vector<int>& values) {
                fj::sort(pool, values, options);
            });
        }

        std::printf("\nPool: %s\n", fj::json::describe(pool).dump().c_str());
        pool.shutdown();

        if (!ok) {
            std::fprintf(stderr, "verification failed\n");
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "sorting_runner: %s\n", e.what());
        return 1;
    }
}
