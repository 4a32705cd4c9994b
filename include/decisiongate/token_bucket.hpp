#pragma once

#include "decisiongate/types.hpp"
#include <mutex>

namespace decisiongate {

// Token-bucket rate primitive. Tokens refill continuously at a fixed rate up
// to capacity and are spent by consume(). All operations are thread-safe.
//
// Invariant: 0 <= tokens <= capacity at every observation. Refill is clamped
// at capacity, so long idle periods never accumulate extra credit, and an
// observation time earlier than the last refill adds nothing.
class TokenBucket {
public:
    struct ConsumeResult {
        bool allowed{false};
        Seconds wait{0.0};   // time until the request could succeed, 0 if allowed
    };

    // Starts full.
    TokenBucket(double capacity, double refill_rate_per_second);

    TokenBucket(const TokenBucket&) = delete;
    TokenBucket& operator=(const TokenBucket&) = delete;

    double capacity() const noexcept;
    double refill_rate_per_second() const noexcept;

    // Spend n tokens if available. A rejected attempt consumes nothing.
    ConsumeResult consume(double n = 1.0);
    ConsumeResult consume_at(double n, Timestamp now);

    // Current tokens after refill, without consuming
    double peek();
    double peek_at(Timestamp now);

    // Wait until n tokens would be available, without consuming
    Seconds time_until_available(double n);
    Seconds time_until_available_at(double n, Timestamp now);

    // Refill to capacity
    void reset();

private:
    const double capacity_;
    const double refill_rate_;

    mutable std::mutex mutex_;
    double tokens_;
    Timestamp last_refill_;

    // Caller holds mutex_
    void refill(Timestamp now);
    Seconds wait_for(double n) const;
};

} // namespace decisiongate
