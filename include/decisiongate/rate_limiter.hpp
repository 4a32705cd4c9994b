#pragma once

#include "decisiongate/config.hpp"
#include "decisiongate/monitor.hpp"
#include "decisiongate/token_bucket.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace decisiongate {

// Enforces several throughput ceilings at once (per-second, per-minute,
// per-day, ...), each backed by its own token bucket. An operation is only as
// fast as its tightest ceiling: the reported wait is the maximum across all
// buckets, and a call is admitted only when every bucket admits it.
class RateLimiter {
public:
    struct Admission {
        bool allowed{false};
        Seconds wait{0.0};
        std::string limit_name;   // tightest ceiling when blocked
    };

    explicit RateLimiter(RateLimitConfig config = RateLimitConfig{});

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Single non-blocking attempt. Either every bucket is charged or none is.
    Admission try_acquire(RequestWeight weight = 1);

    // Blocks until admitted, polling in steps of at most poll_interval.
    // Throws RateLimitExceededException once the timeout elapses; a zero
    // timeout makes exactly one attempt, no timeout waits indefinitely.
    void acquire(RequestWeight weight = 1, std::optional<Duration> timeout = std::nullopt);

    RateLimiterStatus get_status() const;
    std::vector<std::string> limit_names() const;
    const RateLimitConfig& config() const noexcept;

    // Refill every bucket and clear metrics
    void reset();

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    struct Limit {
        RateLimit definition;
        std::unique_ptr<TokenBucket> bucket;
    };

    RateLimitConfig config_;
    std::vector<Limit> limits_;

    mutable std::mutex mutex_;
    std::uint64_t total_requests_{0};
    std::uint64_t total_blocked_{0};
    Seconds total_wait_{0.0};
    std::shared_ptr<Monitor> monitor_;

    double charge_for(const Limit& limit, RequestWeight weight) const;
    void validate_weight(RequestWeight weight) const;
    Admission check(RequestWeight weight, bool record_metrics);
    std::shared_ptr<Monitor> monitor() const;
};

} // namespace decisiongate
