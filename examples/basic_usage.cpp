// basic_usage — demonstrates the core forkjoin-cpp API
//
// Shows owning a Pool, forking and joining Task<R> values, Pool::invoke
// with a plain callable, failure propagation, sorting a vector, sorting
// a window of it, and reading the scheduler counters.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <forkjoin-cpp/forkjoin.hpp>

#include <cstdio>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fj = forkjoin_cpp;

namespace {

void print_values(const char* label, const std::vector<int>& values) {
    std::printf("%s:", label);
    for (auto v : values) std::printf(" %d", v);
    std::printf("\n");
}

}  // namespace

int main() {
    // -- One pool, owned by main ----------------------------------------------
    auto pool = fj::Pool{4u};
    std::printf("Pool with %u workers\n", pool.worker_count());

    // -- Fork two tasks, join both ---------------------------------------------
    auto sum = pool.invoke([&] {
        auto left = fj::Task{[] { return 20; }};
        auto right = fj::Task{[] { return 22; }};
        pool.fork(left);
        pool.fork(right);
        return pool.join(left) + pool.join(right);
    });
    std::printf("20 + 22 = %d\n", sum);

    // -- A task that fails -----------------------------------------------------
    try {
        pool.invoke([]() -> int { throw std::invalid_argument{"negative input"}; });
    } catch (const fj::TaskExecutionError& e) {
        std::printf("Caught %s: %s\n",
                    std::string{fj::to_string_view(e.kind())}.c_str(), e.what());
    }

    // -- Sort -----------------------------------------------------------------
    auto values = std::vector<int>{5, 3, 1, 4, 2, 9, 8, 7, 6, 0};
    print_values("Unsorted", values);

    fj::sort_range(pool, values, 0, 5);
    print_values("First five sorted", values);

    fj::sort(pool, values);
    print_values("Sorted", values);

    fj::sort(pool, values, std::greater<>{});
    print_values("Descending", values);

    // -- Invalid window -------------------------------------------------------
    try {
        fj::sort_range(pool, values, 8, 5);
    } catch (const fj::InvalidRangeError& e) {
        std::printf("Rejected window: %s\n", e.what());
    }

    // -- Counters --------------------------------------------------------------
    const auto stats = pool.stats();
    std::printf("Submitted %llu, forked %llu, executed %llu, failed %llu, stolen %llu\n",
                static_cast<unsigned long long>(stats.tasks_submitted),
                static_cast<unsigned long long>(stats.tasks_forked),
                static_cast<unsigned long long>(stats.tasks_executed),
                static_cast<unsigned long long>(stats.tasks_failed),
                static_cast<unsigned long long>(stats.tasks_stolen));

    pool.shutdown();
    return 0;
}
