#include "decisiongate/token_bucket.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace decisiongate {

TokenBucket::TokenBucket(double capacity, double refill_rate_per_second)
    : capacity_(capacity)
    , refill_rate_(refill_rate_per_second)
    , tokens_(capacity)
    , last_refill_(Clock::now())
{
    if (!std::isfinite(capacity_) || capacity_ <= 0.0) {
        throw std::invalid_argument("TokenBucket capacity must be positive");
    }
    if (!std::isfinite(refill_rate_) || refill_rate_ <= 0.0) {
        throw std::invalid_argument("TokenBucket refill rate must be positive");
    }
}

double TokenBucket::capacity() const noexcept { return capacity_; }
double TokenBucket::refill_rate_per_second() const noexcept { return refill_rate_; }

TokenBucket::ConsumeResult TokenBucket::consume(double n) {
    return consume_at(n, Clock::now());
}

TokenBucket::ConsumeResult TokenBucket::consume_at(double n, Timestamp now) {
    if (n < 0.0 || !std::isfinite(n)) {
        throw std::invalid_argument("TokenBucket cannot consume a negative amount");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    refill(now);

    if (tokens_ >= n) {
        tokens_ -= n;
        return ConsumeResult{true, Seconds{0.0}};
    }
    return ConsumeResult{false, wait_for(n)};
}

double TokenBucket::peek() {
    return peek_at(Clock::now());
}

double TokenBucket::peek_at(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    refill(now);
    return tokens_;
}

Seconds TokenBucket::time_until_available(double n) {
    return time_until_available_at(n, Clock::now());
}

Seconds TokenBucket::time_until_available_at(double n, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    refill(now);
    if (tokens_ >= n) {
        return Seconds{0.0};
    }
    return wait_for(n);
}

void TokenBucket::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = capacity_;
    last_refill_ = Clock::now();
}

void TokenBucket::refill(Timestamp now) {
    if (now <= last_refill_) {
        return;
    }
    double elapsed = to_seconds(now - last_refill_).count();
    tokens_ = std::min(capacity_, tokens_ + elapsed * refill_rate_);
    last_refill_ = now;
}

Seconds TokenBucket::wait_for(double n) const {
    return Seconds{(n - tokens_) / refill_rate_};
}

} // namespace decisiongate
