#pragma once

#include "decisiongate/types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace decisiongate {

// Circuit breaker configuration (one breaker per external dependency)
struct CircuitBreakerConfig {
    // Consecutive failures in Closed that open the breaker
    std::size_t failure_threshold = 5;

    // Consecutive successes in HalfOpen that close the breaker
    std::size_t success_threshold = 2;

    // How long an open breaker rejects calls before probing
    Duration open_timeout = std::chrono::seconds(60);

    // Calls admitted while HalfOpen
    std::size_t half_open_max_probes = 3;

    // Number of recent errors kept for status reports
    std::size_t recent_error_capacity = 10;
};

enum class RateWindow { PerSecond, PerMinute, PerHour, PerDay };

inline Duration window_duration(RateWindow window) {
    switch (window) {
        case RateWindow::PerSecond: return std::chrono::seconds(1);
        case RateWindow::PerMinute: return std::chrono::minutes(1);
        case RateWindow::PerHour:   return std::chrono::hours(1);
        case RateWindow::PerDay:    return std::chrono::hours(24);
    }
    return std::chrono::minutes(1);
}

// Named throughput ceiling, backed 1:1 by a token bucket
struct RateLimit {
    std::string name;
    double max_units = 1.0;
    Duration window = std::chrono::seconds(1);

    // The weighted limit is charged the caller's request weight; every other
    // limit is charged one unit per call.
    bool weighted = false;

    static RateLimit per(std::string name, double max_units, RateWindow window,
                         bool weighted = false) {
        return RateLimit{std::move(name), max_units, window_duration(window), weighted};
    }

    double refill_rate_per_second() const {
        return max_units / to_seconds(window).count();
    }
};

// Venue ceilings: 50 orders/s, 1200 weight/min, 200000 orders/day
inline std::vector<RateLimit> default_venue_limits() {
    return {
        RateLimit::per("orders_per_second", 50, RateWindow::PerSecond),
        RateLimit::per("weight_per_minute", 1200, RateWindow::PerMinute, true),
        RateLimit::per("orders_per_day", 200000, RateWindow::PerDay),
    };
}

struct RateLimitConfig {
    std::vector<RateLimit> limits = default_venue_limits();

    // Longest single sleep inside a blocking acquire
    Duration poll_interval = std::chrono::milliseconds(100);
};

struct CacheConfig {
    std::size_t max_size = 1000;

    // nullopt = entries never expire unless a per-entry TTL is given
    std::optional<Duration> default_ttl;
};

// Limits in force for one decision cycle. The orchestrator uses the
// configured normal settings, or the health monitor's fallback settings while
// safe mode is active.
struct OperatingSettings {
    // Combined confidence required for Execute in Auto mode
    double execute_confidence_threshold = 0.8;

    // Combined confidence below this rejects the cycle (0 = disabled)
    double min_recommend_confidence = 0.0;

    // Position size handed to the execution layer
    double position_size = 0.01;

    // Executions allowed in flight at once
    std::size_t max_concurrent_actions = 3;

    bool require_multiple_confirmations = false;
    bool conservative_only = false;
};

inline OperatingSettings default_fallback_settings() {
    OperatingSettings s;
    s.execute_confidence_threshold = 0.95;
    s.position_size = 0.001;
    s.max_concurrent_actions = 1;
    s.require_multiple_confirmations = true;
    s.conservative_only = true;
    return s;
}

struct HealthConfig {
    // Consecutive failures that flag a module unhealthy
    std::size_t failure_threshold = 3;

    // Consecutive successes that clear an unhealthy module
    std::size_t recovery_threshold = 1;

    // System health (0-100) below which safe mode is active
    double min_health_for_normal_mode = 50.0;

    // Health above which the status report recommends normal operation
    double continue_normal_health = 70.0;

    // If true a cycle in safe mode is paused instead of running with the
    // fallback settings. Evaluators still run and report their health, so
    // safe mode ends once they recover; their verdicts are discarded.
    bool pause_in_safe_mode = false;

    OperatingSettings fallback = default_fallback_settings();
};

struct DecisionConfig {
    ExecutionMode mode = ExecutionMode::Hybrid;

    OperatingSettings normal;

    // Per-evaluator weights for the weighted-average confidence policy.
    // Evaluators not listed weigh 1.0.
    std::unordered_map<std::string, double> confidence_weights;

    // Run evaluators on separate threads
    bool parallel_evaluation = false;

    // Evaluators that take longer are treated as a veto. The overrunning
    // call keeps its worker thread until it returns; until then that
    // evaluator is not started again and times out immediately.
    std::optional<Duration> evaluator_timeout;

    // Longest wait for rate-limit admission when executing (nullopt = wait
    // indefinitely)
    std::optional<Duration> execution_acquire_timeout = std::chrono::seconds(5);
};

struct Config {
    CircuitBreakerConfig circuit_breaker;
    RateLimitConfig rate_limits;
    CacheConfig cache;
    HealthConfig health;
    DecisionConfig decision;

    // How often the background maintenance sweeps expired cache entries
    Duration maintenance_interval = std::chrono::seconds(1);

    // How often to emit system snapshots to the monitor
    Duration snapshot_interval = std::chrono::seconds(5);
};

// Each validate() throws ConfigurationException naming the offending key.
void validate(const CircuitBreakerConfig& config);
void validate(const RateLimitConfig& config);
void validate(const CacheConfig& config);
void validate(const OperatingSettings& settings, const std::string& prefix);
void validate(const HealthConfig& config);
void validate(const DecisionConfig& config);
void validate(const Config& config);

} // namespace decisiongate
