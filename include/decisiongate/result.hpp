#pragma once

#include "decisiongate/types.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace decisiongate {

enum class ErrorKind {
    RateLimitExceeded,
    CircuitOpen,
    EvaluatorFailure,
    OperationFailed,
    Configuration
};

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::RateLimitExceeded: return "RateLimitExceeded";
        case ErrorKind::CircuitOpen:       return "CircuitOpen";
        case ErrorKind::EvaluatorFailure:  return "EvaluatorFailure";
        case ErrorKind::OperationFailed:   return "OperationFailed";
        case ErrorKind::Configuration:     return "Configuration";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind{ErrorKind::OperationFailed};
    std::string message;
    // Limit name, dependency name or evaluator name, depending on kind
    std::string source;
    std::optional<Seconds> retry_after;

    bool is_recoverable() const noexcept {
        return kind == ErrorKind::RateLimitExceeded || kind == ErrorKind::CircuitOpen;
    }
};

// Value-or-error carrier used where failures are ordinary data rather than
// stack unwinding (protected calls seen from the orchestrator).
template <typename T>
class Result {
public:
    Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : storage_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return storage_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    const T& value() const& { return std::get<0>(storage_); }
    T& value() & { return std::get<0>(storage_); }
    T&& value() && { return std::get<0>(std::move(storage_)); }

    const Error& error() const& { return std::get<1>(storage_); }

    T value_or(T fallback) const {
        return ok() ? std::get<0>(storage_) : std::move(fallback);
    }

private:
    std::variant<T, Error> storage_;
};

// Result of an operation that produces no value.
template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    const Error& error() const& { return *error_; }

private:
    std::optional<Error> error_;
};

} // namespace decisiongate
