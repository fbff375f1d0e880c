/// @file error.hpp
/// @brief Error types for the forkjoin-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace forkjoin_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    task_execution,     ///< A task's work raised an exception.
    pool_shutdown,      ///< Work was submitted to a pool that has shut down.
    invalid_range,      ///< A sort range does not fit its backing array.
    invalid_operation,  ///< An operation is invalid in the current context.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::task_execution:    return "task_execution";
        case ErrorKind::pool_shutdown:     return "pool_shutdown";
        case ErrorKind::invalid_range:     return "invalid_range";
        case ErrorKind::invalid_operation: return "invalid_operation";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Base class of every exception thrown by the library.
///
/// Carries the structured Error so callers can branch on the kind
/// without string matching.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

/// Raised by join when the joined task failed.
///
/// When thrown from Pool::join the exception that escaped the task's
/// work is attached as a std::nested_exception; use
/// std::rethrow_if_nested to recover it.
class TaskExecutionError : public Exception {
public:
    explicit TaskExecutionError(std::string message)
        : Exception{Error{ErrorKind::task_execution, std::move(message)}} {}
};

/// Raised when work is submitted to a pool after shutdown().
class PoolShutdownError : public Exception {
public:
    explicit PoolShutdownError(std::string message)
        : Exception{Error{ErrorKind::pool_shutdown, std::move(message)}} {}
};

/// Raised when a sort range is malformed for its backing array.
class InvalidRangeError : public Exception {
public:
    explicit InvalidRangeError(std::string message)
        : Exception{Error{ErrorKind::invalid_range, std::move(message)}} {}
};

}  // namespace forkjoin_cpp
