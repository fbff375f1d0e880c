/// @file json.hpp
/// @brief nlohmann/json interoperability for forkjoin-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the configuration
/// structs, so pools and sorts can be configured from JSON files, and for
/// the observable state (stats, task/worker states, errors) for reporting.

#pragma once

#include <forkjoin-cpp/error.hpp>
#include <forkjoin-cpp/pool.hpp>
#include <forkjoin-cpp/sort.hpp>
#include <forkjoin-cpp/task.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

namespace forkjoin_cpp {

// -- Enumerations (as their to_string_view names) -----------------------------

void to_json(nlohmann::json& j, TaskState state);
void from_json(const nlohmann::json& j, TaskState& state);

void to_json(nlohmann::json& j, WorkerState state);
void from_json(const nlohmann::json& j, WorkerState& state);

void to_json(nlohmann::json& j, ErrorKind kind);
void from_json(const nlohmann::json& j, ErrorKind& kind);

// -- Configuration ------------------------------------------------------------

/// {"worker_count": 0, "steal_rounds": 0, "idle_backoff_us": 100}
/// Missing keys keep their defaults.
void to_json(nlohmann::json& j, const PoolOptions& options);
void from_json(const nlohmann::json& j, PoolOptions& options);

/// {"sequential_threshold": 4096}. The trace hook is not serialized.
void to_json(nlohmann::json& j, const SortOptions& options);
void from_json(const nlohmann::json& j, SortOptions& options);

// -- Reporting ----------------------------------------------------------------

void to_json(nlohmann::json& j, const PoolStats& stats);
void to_json(nlohmann::json& j, const Error& error);
void to_json(nlohmann::json& j, const RangeEvent& event);

namespace json {

/// Parse a TaskState name. Returns nullopt for an unknown name.
auto parse_task_state(std::string_view name) -> std::optional<TaskState>;

/// Parse a WorkerState name. Returns nullopt for an unknown name.
auto parse_worker_state(std::string_view name) -> std::optional<WorkerState>;

/// Parse an ErrorKind name. Returns nullopt for an unknown name.
auto parse_error_kind(std::string_view name) -> std::optional<ErrorKind>;

/// Snapshot of a pool: resolved options, counters, and worker states.
auto describe(const Pool& pool) -> nlohmann::json;

}  // namespace json

}  // namespace forkjoin_cpp
