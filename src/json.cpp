#include <forkjoin-cpp/json.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace forkjoin_cpp {

namespace {

// Linear lookup of an enumerator by its to_string_view name.
template <typename Enum, std::size_t N>
auto parse_name(std::string_view name, const std::array<Enum, N>& all) -> std::optional<Enum> {
    for (auto value : all) {
        if (to_string_view(value) == name) return value;
    }
    return std::nullopt;
}

constexpr auto all_task_states = std::array{
    TaskState::pending, TaskState::forked, TaskState::completed, TaskState::failed};

constexpr auto all_worker_states = std::array{
    WorkerState::idle, WorkerState::running, WorkerState::stealing, WorkerState::shutting_down};

constexpr auto all_error_kinds = std::array{
    ErrorKind::task_execution, ErrorKind::pool_shutdown,
    ErrorKind::invalid_range, ErrorKind::invalid_operation};

template <typename Enum>
auto require(std::optional<Enum> value, const nlohmann::json& j, const char* what) -> Enum {
    if (!value) {
        throw std::runtime_error{std::string{"unknown "} + what + ": " + j.dump()};
    }
    return *value;
}

// Counts are read signed so that a negative value is rejected instead of
// wrapping around.
template <typename Count>
auto read_count(const nlohmann::json& j, const char* key, Count fallback) -> Count {
    const auto value = j.value(key, static_cast<std::int64_t>(fallback));
    if (value < 0) {
        throw std::runtime_error{std::string{key} + " must not be negative: " +
                                 std::to_string(value)};
    }
    if (static_cast<std::uint64_t>(value) > std::numeric_limits<Count>::max()) {
        throw std::runtime_error{std::string{key} + " is out of range: " +
                                 std::to_string(value)};
    }
    return static_cast<Count>(value);
}

}  // anonymous namespace

// =============================================================================
// Enumerations
// =============================================================================

void to_json(nlohmann::json& j, TaskState state) {
    j = std::string{to_string_view(state)};
}

void from_json(const nlohmann::json& j, TaskState& state) {
    state = require(json::parse_task_state(j.get<std::string>()), j, "task state");
}

void to_json(nlohmann::json& j, WorkerState state) {
    j = std::string{to_string_view(state)};
}

void from_json(const nlohmann::json& j, WorkerState& state) {
    state = require(json::parse_worker_state(j.get<std::string>()), j, "worker state");
}

void to_json(nlohmann::json& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, ErrorKind& kind) {
    kind = require(json::parse_error_kind(j.get<std::string>()), j, "error kind");
}

// =============================================================================
// Configuration
// =============================================================================

void to_json(nlohmann::json& j, const PoolOptions& options) {
    j = nlohmann::json{
        {"worker_count", options.worker_count},
        {"steal_rounds", options.steal_rounds},
        {"idle_backoff_us", options.idle_backoff.count()},
    };
}

void from_json(const nlohmann::json& j, PoolOptions& options) {
    if (!j.is_object()) {
        throw std::runtime_error{"pool options must be a JSON object"};
    }
    const auto defaults = PoolOptions{};
    options.worker_count = read_count(j, "worker_count", defaults.worker_count);
    options.steal_rounds = read_count(j, "steal_rounds", defaults.steal_rounds);
    options.idle_backoff = std::chrono::microseconds{
        j.value("idle_backoff_us", static_cast<std::int64_t>(defaults.idle_backoff.count()))};
}

void to_json(nlohmann::json& j, const SortOptions& options) {
    j = nlohmann::json{{"sequential_threshold", options.sequential_threshold}};
}

void from_json(const nlohmann::json& j, SortOptions& options) {
    if (!j.is_object()) {
        throw std::runtime_error{"sort options must be a JSON object"};
    }
    options.sequential_threshold = j.value("sequential_threshold", default_sequential_threshold);
}

// =============================================================================
// Reporting
// =============================================================================

void to_json(nlohmann::json& j, const PoolStats& stats) {
    j = nlohmann::json{
        {"tasks_submitted", stats.tasks_submitted},
        {"tasks_forked", stats.tasks_forked},
        {"tasks_executed", stats.tasks_executed},
        {"tasks_failed", stats.tasks_failed},
        {"tasks_stolen", stats.tasks_stolen},
        {"idle_parks", stats.idle_parks},
    };
}

void to_json(nlohmann::json& j, const Error& error) {
    j = nlohmann::json{{"kind", error.kind}, {"message", error.message}};
}

void to_json(nlohmann::json& j, const RangeEvent& event) {
    j = nlohmann::json{
        {"kind", std::string{to_string_view(event.kind)}},
        {"offset", event.offset},
        {"length", event.length},
    };
}

// =============================================================================
// forkjoin_cpp::json
// =============================================================================

namespace json {

auto parse_task_state(std::string_view name) -> std::optional<TaskState> {
    return parse_name(name, all_task_states);
}

auto parse_worker_state(std::string_view name) -> std::optional<WorkerState> {
    return parse_name(name, all_worker_states);
}

auto parse_error_kind(std::string_view name) -> std::optional<ErrorKind> {
    return parse_name(name, all_error_kinds);
}

auto describe(const Pool& pool) -> nlohmann::json {
    return nlohmann::json{
        {"running", pool.is_running()},
        {"options", pool.options()},
        {"stats", pool.stats()},
        {"workers", pool.worker_states()},
    };
}

}  // namespace json

}  // namespace forkjoin_cpp
