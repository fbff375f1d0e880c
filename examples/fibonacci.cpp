// fibonacci — recursive fork/join beyond sorting
//
// Computes Fibonacci numbers the naive doubly-recursive way: each call
// forks fib(n - 1) as a task and computes fib(n - 2) itself. Below a cutoff
// the recursion runs sequentially. Compares a 1-worker pool against one
// with every hardware thread.
//
// Build: cmake --build build -DCMAKE_BUILD_TYPE=Release
// Run:   ./build/fibonacci [n]

#include <forkjoin-cpp/forkjoin.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <thread>

namespace fj = forkjoin_cpp;

struct Timer {
    std::chrono::steady_clock::time_point start =
        std::chrono::steady_clock::now();
    auto ms() const -> double {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
    }
};

namespace {

constexpr int sequential_cutoff = 20;

auto fib_sequential(int n) -> long long {
    return n < 2 ? n : fib_sequential(n - 1) + fib_sequential(n - 2);
}

auto fib(fj::Pool& pool, int n) -> long long {
    if (n <= sequential_cutoff) return fib_sequential(n);
    auto left = fj::Task{[&pool, n] { return fib(pool, n - 1); }};
    pool.fork(left);
    auto right = fib(pool, n - 2);
    return pool.join(left) + right;
}

void run(unsigned int workers, int n) {
    auto pool = fj::Pool{workers};
    auto t = Timer{};
    auto result = pool.invoke([&] { return fib(pool, n); });
    const auto elapsed = t.ms();
    const auto stats = pool.stats();
    std::printf("  %2u workers: fib(%d) = %lld in %.1f ms (%llu tasks, %llu stolen)\n",
                pool.worker_count(), n, result, elapsed,
                static_cast<unsigned long long>(stats.tasks_executed),
                static_cast<unsigned long long>(stats.tasks_stolen));
}

}  // namespace

int main(int argc, char** argv) {
    const auto n = argc > 1 ? std::atoi(argv[1]) : 36;
    if (n < 0) {
        std::fprintf(stderr, "usage: fibonacci [n >= 0]\n");
        return 1;
    }

    std::printf("=== Fork/join Fibonacci ===\n");
    run(1, n);
    run(std::thread::hardware_concurrency(), n);
    return 0;
}
