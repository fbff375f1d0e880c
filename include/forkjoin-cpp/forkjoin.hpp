/// @file forkjoin.hpp
/// @brief Umbrella header for the forkjoin-cpp library.
///
/// Include this single header for access to all public types:
/// Pool, Task, TaskState, PoolOptions, PoolStats, sort, SortOptions,
/// SortRange, and Error.

#pragma once

#include <forkjoin-cpp/error.hpp>
#include <forkjoin-cpp/pool.hpp>
#include <forkjoin-cpp/sort.hpp>
#include <forkjoin-cpp/task.hpp>
