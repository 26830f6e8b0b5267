// =============================================================================
// AdbFleet - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that holds either a success value or an error, so that
// validation and loading steps report failures as values instead of throwing.
//
// Usage:
//   Result<std::uintmax_t> checkSize(const std::string& path) {
//       if (path.empty()) return Err<std::uintmax_t>("empty path", ErrorKind::ValidationFailure);
//       return Ok(std::uintmax_t{42});
//   }
//
//   auto r = checkSize(p);
//   if (!r) FLOG_ERROR("tag", "%s", r.error().message.c_str());
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace fleet {

// =============================================================================
// Error Types
// =============================================================================

// Failure classes shared by every bridge-facing operation
enum class ErrorKind {
    None = 0,
    ToolUnavailable,     // bridge executable could not be located
    ExecutionTimeout,    // call exceeded its time budget
    ExecutionFailure,    // nonzero exit / explicit failure text from the tool
    ValidationFailure,   // precondition rejected before any bridge call
    AmbiguousOutcome,    // tool output did not confirm intent, re-verification failed
    Busy                 // single-flight slot already taken
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:              return "none";
        case ErrorKind::ToolUnavailable:   return "tool-unavailable";
        case ErrorKind::ExecutionTimeout:  return "timeout";
        case ErrorKind::ExecutionFailure:  return "execution-failure";
        case ErrorKind::ValidationFailure: return "validation-failure";
        case ErrorKind::AmbiguousOutcome:  return "ambiguous-outcome";
        case ErrorKind::Busy:              return "busy";
    }
    return "unknown";
}

// Generic error with message
struct Error {
    std::string message;
    ErrorKind kind = ErrorKind::ExecutionFailure;

    Error() = default;
    explicit Error(std::string msg, ErrorKind k = ErrorKind::ExecutionFailure)
        : message(std::move(msg)), kind(k) {}
    explicit Error(const char* msg, ErrorKind k = ErrorKind::ExecutionFailure)
        : message(msg), kind(k) {}

    bool operator==(const Error& other) const {
        return kind == other.kind && message == other.message;
    }
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E> &&
                                                        !std::is_convertible_v<Err, T>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(std::string message, ErrorKind kind = ErrorKind::ExecutionFailure) {
    return Result<T, Error>(Error(std::move(message), kind));
}

template<typename T>
Result<T, Error> Err(const char* message, ErrorKind kind = ErrorKind::ExecutionFailure) {
    return Result<T, Error>(Error(message, kind));
}

} // namespace fleet
