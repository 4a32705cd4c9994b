#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace decisiongate {

// Unique identifiers
using DecisionId = std::uint64_t;

// Request weight (integer units charged against the weighted rate limit)
using RequestWeight = std::int64_t;

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Fractional seconds, used for refill rates, waits and retry-after hints
using Seconds = std::chrono::duration<double>;

// Circuit breaker state
enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

// Terminal outcome of one decision cycle
enum class DecisionOutcome {
    Execute,
    Recommend,
    Reject,
    Paused
};

// How approved decisions are acted upon
enum class ExecutionMode {
    Hybrid,   // Approved decisions are only recommended to a human
    Auto,     // Approved decisions above the execute threshold are executed
    NoTrade   // Nothing is evaluated, every cycle is rejected
};

// Fixed evaluation order. Evaluators run phase by phase, in registration
// order inside a phase.
enum class EvaluationPhase {
    Preliminary,
    Analysis,
    Context,
    Historical,
    Scoring,
    Simulation
};

// Health report recommendation
enum class HealthRecommendation {
    ContinueNormal,
    SwitchToSafeMode
};

// One recorded breaker failure
struct RecentError {
    Timestamp time{};
    std::string message;
};

// Read-only breaker snapshot for observability collectors
struct CircuitBreakerStatus {
    std::string name;
    CircuitState state{CircuitState::Closed};
    bool can_proceed{true};

    std::uint64_t total_calls{0};
    std::uint64_t total_successes{0};
    std::uint64_t total_failures{0};
    std::uint64_t rejected_calls{0};
    std::uint64_t state_changes{0};
    std::size_t consecutive_failures{0};
    std::size_t consecutive_successes{0};
    double success_rate{0.0};   // percent of admitted calls

    std::size_t failure_threshold{0};
    std::size_t success_threshold{0};
    Duration open_timeout{};

    Seconds time_until_retry{0.0};
    std::optional<Timestamp> last_failure;
    std::optional<Timestamp> last_success;
    std::vector<RecentError> recent_errors;
};

struct BucketStatus {
    std::string name;
    double available_tokens{0.0};
    double capacity{0.0};
    double refill_rate_per_second{0.0};
    double utilization{0.0};    // percent of capacity in use
    bool weighted{false};
};

struct RateLimiterStatus {
    std::vector<BucketStatus> buckets;
    std::uint64_t total_requests{0};
    std::uint64_t total_blocked{0};
    Seconds total_wait{0.0};
    double block_rate{0.0};     // percent of attempts blocked
};

struct CacheStats {
    std::size_t size{0};
    std::size_t max_size{0};
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    double hit_rate{0.0};       // percent
    double utilization{0.0};    // percent
};

struct ModuleHealth {
    std::string module;
    std::size_t consecutive_failures{0};
    std::size_t consecutive_successes{0};
    std::uint64_t total_failures{0};
    std::uint64_t total_reports{0};
    bool healthy{true};
    Timestamp last_report{};
};

struct HealthStatus {
    double system_health{100.0};
    bool safe_mode_active{false};
    std::vector<ModuleHealth> modules;
    HealthRecommendation recommendation{HealthRecommendation::ContinueNormal};
};

// System-wide snapshot for monitoring
struct SystemSnapshot {
    Timestamp timestamp{};
    ExecutionMode mode{ExecutionMode::Hybrid};
    bool paused{false};
    std::size_t executions_in_flight{0};
    std::vector<CircuitBreakerStatus> breakers;
    RateLimiterStatus rate_limiter;
    std::unordered_map<std::string, CacheStats> caches;
    HealthStatus health;
};

inline const char* to_string(CircuitState s) {
    switch (s) {
        case CircuitState::Closed:   return "Closed";
        case CircuitState::Open:     return "Open";
        case CircuitState::HalfOpen: return "HalfOpen";
    }
    return "Unknown";
}

inline const char* to_string(DecisionOutcome o) {
    switch (o) {
        case DecisionOutcome::Execute:   return "Execute";
        case DecisionOutcome::Recommend: return "Recommend";
        case DecisionOutcome::Reject:    return "Reject";
        case DecisionOutcome::Paused:    return "Paused";
    }
    return "Unknown";
}

inline const char* to_string(ExecutionMode m) {
    switch (m) {
        case ExecutionMode::Hybrid:  return "Hybrid";
        case ExecutionMode::Auto:    return "Auto";
        case ExecutionMode::NoTrade: return "NoTrade";
    }
    return "Unknown";
}

inline const char* to_string(EvaluationPhase p) {
    switch (p) {
        case EvaluationPhase::Preliminary: return "Preliminary";
        case EvaluationPhase::Analysis:    return "Analysis";
        case EvaluationPhase::Context:     return "Context";
        case EvaluationPhase::Historical:  return "Historical";
        case EvaluationPhase::Scoring:     return "Scoring";
        case EvaluationPhase::Simulation:  return "Simulation";
    }
    return "Unknown";
}

inline const char* to_string(HealthRecommendation r) {
    switch (r) {
        case HealthRecommendation::ContinueNormal:   return "ContinueNormal";
        case HealthRecommendation::SwitchToSafeMode: return "SwitchToSafeMode";
    }
    return "Unknown";
}

inline Seconds to_seconds(Duration d) {
    return std::chrono::duration_cast<Seconds>(d);
}

} // namespace decisiongate
