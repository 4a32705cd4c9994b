#include "decisiongate/config.hpp"
#include "decisiongate/exceptions.hpp"

#include <cmath>
#include <unordered_set>

namespace decisiongate {

namespace {

void require(bool condition, const std::string& key, const std::string& message) {
    if (!condition) {
        throw ConfigurationException(key, message);
    }
}

bool is_probability(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

} // anonymous namespace

void validate(const CircuitBreakerConfig& config) {
    require(config.failure_threshold > 0, "circuit_breaker.failure_threshold",
            "must be at least 1");
    require(config.success_threshold > 0, "circuit_breaker.success_threshold",
            "must be at least 1");
    require(config.half_open_max_probes > 0, "circuit_breaker.half_open_max_probes",
            "must be at least 1");
    require(config.success_threshold <= config.half_open_max_probes,
            "circuit_breaker.success_threshold",
            "cannot exceed half_open_max_probes or the breaker can never close");
    require(config.open_timeout >= Duration::zero(), "circuit_breaker.open_timeout",
            "must be non-negative");
}

void validate(const RateLimitConfig& config) {
    std::unordered_set<std::string> names;
    std::size_t weighted = 0;
    for (const auto& limit : config.limits) {
        require(!limit.name.empty(), "rate_limits.name", "must not be empty");
        require(names.insert(limit.name).second, "rate_limits." + limit.name,
                "duplicate limit name");
        require(std::isfinite(limit.max_units) && limit.max_units > 0.0,
                "rate_limits." + limit.name + ".max_units", "must be positive");
        require(limit.window > Duration::zero(),
                "rate_limits." + limit.name + ".window", "must be positive");
        if (limit.weighted) ++weighted;
    }
    require(weighted <= 1, "rate_limits.weighted",
            "at most one limit can be charged the request weight");
    require(config.poll_interval > Duration::zero(), "rate_limits.poll_interval",
            "must be positive");
}

void validate(const CacheConfig& config) {
    require(config.max_size > 0, "cache.max_size", "must be at least 1");
    if (config.default_ttl.has_value()) {
        require(*config.default_ttl > Duration::zero(), "cache.default_ttl",
                "must be positive when set");
    }
}

void validate(const OperatingSettings& settings, const std::string& prefix) {
    require(is_probability(settings.execute_confidence_threshold),
            prefix + ".execute_confidence_threshold", "must be within [0, 1]");
    require(is_probability(settings.min_recommend_confidence),
            prefix + ".min_recommend_confidence", "must be within [0, 1]");
    require(std::isfinite(settings.position_size) && settings.position_size >= 0.0,
            prefix + ".position_size", "must be non-negative");
    require(settings.max_concurrent_actions > 0,
            prefix + ".max_concurrent_actions", "must be at least 1");
}

void validate(const HealthConfig& config) {
    require(config.failure_threshold > 0, "health.failure_threshold",
            "must be at least 1");
    require(config.recovery_threshold > 0, "health.recovery_threshold",
            "must be at least 1");
    require(config.min_health_for_normal_mode >= 0.0 &&
            config.min_health_for_normal_mode <= 100.0,
            "health.min_health_for_normal_mode", "must be within [0, 100]");
    require(config.continue_normal_health >= 0.0 &&
            config.continue_normal_health <= 100.0,
            "health.continue_normal_health", "must be within [0, 100]");
    validate(config.fallback, "health.fallback");
}

void validate(const DecisionConfig& config) {
    validate(config.normal, "decision.normal");
    for (const auto& [name, weight] : config.confidence_weights) {
        require(std::isfinite(weight) && weight >= 0.0,
                "decision.confidence_weights." + name, "must be non-negative");
    }
    if (config.evaluator_timeout.has_value()) {
        require(*config.evaluator_timeout > Duration::zero(),
                "decision.evaluator_timeout", "must be positive when set");
    }
    if (config.execution_acquire_timeout.has_value()) {
        require(*config.execution_acquire_timeout >= Duration::zero(),
                "decision.execution_acquire_timeout", "must be non-negative when set");
    }
}

void validate(const Config& config) {
    validate(config.circuit_breaker);
    validate(config.rate_limits);
    validate(config.cache);
    validate(config.health);
    validate(config.decision);
    require(config.maintenance_interval > Duration::zero(), "maintenance_interval",
            "must be positive");
    require(config.snapshot_interval > Duration::zero(), "snapshot_interval",
            "must be positive");
}

} // namespace decisiongate
