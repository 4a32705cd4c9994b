#pragma once

#include "decisiongate/types.hpp"
#include <stdexcept>
#include <string>

namespace decisiongate {

class DecisionGateException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Recoverable: the caller should wait retry_after and try again.
class RateLimitExceededException : public DecisionGateException {
public:
    RateLimitExceededException(std::string limit_name, Seconds retry_after)
        : DecisionGateException(
            "Rate limit exceeded: " + limit_name +
            " (retry after " + std::to_string(retry_after.count()) + "s)")
        , limit_name_(std::move(limit_name))
        , retry_after_(retry_after) {}

    const std::string& limit_name() const noexcept { return limit_name_; }
    Seconds retry_after() const noexcept { return retry_after_; }

private:
    std::string limit_name_;
    Seconds retry_after_;
};

// Recoverable: signals a dependency-health problem, not a logic error.
class CircuitOpenException : public DecisionGateException {
public:
    CircuitOpenException(std::string dependency, Seconds retry_after)
        : DecisionGateException(
            "Circuit breaker '" + dependency + "' is open" +
            " (retry after " + std::to_string(retry_after.count()) + "s)")
        , dependency_(std::move(dependency))
        , retry_after_(retry_after) {}

    const std::string& dependency() const noexcept { return dependency_; }
    Seconds retry_after() const noexcept { return retry_after_; }

private:
    std::string dependency_;
    Seconds retry_after_;
};

// Raised by evaluators that cannot produce a verdict. The orchestrator turns
// it (and any other exception escaping an evaluator) into a veto.
class EvaluatorFailureException : public DecisionGateException {
public:
    EvaluatorFailureException(std::string evaluator, std::string cause)
        : DecisionGateException("Evaluator '" + evaluator + "' failed: " + cause)
        , evaluator_(std::move(evaluator))
        , cause_(std::move(cause)) {}

    const std::string& evaluator() const noexcept { return evaluator_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    std::string evaluator_;
    std::string cause_;
};

// Fatal at startup only; never thrown during a decision cycle.
class ConfigurationException : public DecisionGateException {
public:
    ConfigurationException(std::string key, const std::string& message)
        : DecisionGateException("Invalid configuration '" + key + "': " + message)
        , key_(std::move(key)) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class InvalidRequestException : public DecisionGateException {
public:
    using DecisionGateException::DecisionGateException;
};

class WeightExceedsCapacityException : public InvalidRequestException {
public:
    WeightExceedsCapacityException(const std::string& limit_name,
                                   RequestWeight weight,
                                   double capacity)
        : InvalidRequestException(
            "Requested weight " + std::to_string(weight) +
            " exceeds capacity " + std::to_string(capacity) +
            " of rate limit " + limit_name) {}
};

} // namespace decisiongate
