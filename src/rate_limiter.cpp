#include "decisiongate/rate_limiter.hpp"
#include "decisiongate/exceptions.hpp"

#include <algorithm>
#include <thread>

namespace decisiongate {

RateLimiter::RateLimiter(RateLimitConfig config)
    : config_(std::move(config))
{
    validate(config_);
    limits_.reserve(config_.limits.size());
    for (const auto& definition : config_.limits) {
        Limit limit;
        limit.definition = definition;
        limit.bucket = std::make_unique<TokenBucket>(definition.max_units,
                                                     definition.refill_rate_per_second());
        limits_.push_back(std::move(limit));
    }
}

double RateLimiter::charge_for(const Limit& limit, RequestWeight weight) const {
    return limit.definition.weighted ? static_cast<double>(weight) : 1.0;
}

void RateLimiter::validate_weight(RequestWeight weight) const {
    if (weight <= 0) {
        throw InvalidRequestException("Request weight must be positive, got " +
                                      std::to_string(weight));
    }
    for (const auto& limit : limits_) {
        if (charge_for(limit, weight) > limit.bucket->capacity()) {
            throw WeightExceedsCapacityException(limit.definition.name, weight,
                                                 limit.bucket->capacity());
        }
    }
}

RateLimiter::Admission RateLimiter::try_acquire(RequestWeight weight) {
    validate_weight(weight);
    return check(weight, true);
}

RateLimiter::Admission RateLimiter::check(RequestWeight weight, bool record_metrics) {
    Admission admission;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (record_metrics) total_requests_++;

        // One observation time for every bucket so the decision is consistent.
        auto now = Clock::now();
        for (const auto& limit : limits_) {
            Seconds wait = limit.bucket->time_until_available_at(charge_for(limit, weight), now);
            if (wait > admission.wait) {
                admission.wait = wait;
                admission.limit_name = limit.definition.name;
            }
        }

        if (admission.wait > Seconds::zero()) {
            if (record_metrics) total_blocked_++;
        } else {
            // Every bucket has the tokens and only this limiter spends them,
            // so each consume succeeds.
            for (const auto& limit : limits_) {
                limit.bucket->consume_at(charge_for(limit, weight), now);
            }
            admission.allowed = true;
        }
    }

    if (!admission.allowed && record_metrics) {
        MonitorEvent event{EventType::RequestRateLimited, {}, "Rate limited"};
        event.component = admission.limit_name;
        event.retry_after = admission.wait;
        emit(monitor(), std::move(event));
    }
    return admission;
}

void RateLimiter::acquire(RequestWeight weight, std::optional<Duration> timeout) {
    validate_weight(weight);

    auto start = Clock::now();
    std::optional<Timestamp> deadline;
    if (timeout.has_value()) {
        deadline = start + *timeout;
    }

    bool first = true;
    while (true) {
        auto admission = check(weight, first);
        if (admission.allowed) {
            if (!first) {
                std::lock_guard<std::mutex> lock(mutex_);
                total_wait_ += to_seconds(Clock::now() - start);
            }
            return;
        }
        first = false;

        auto now = Clock::now();
        if (deadline.has_value() && now >= *deadline) {
            MonitorEvent event{EventType::RateLimitTimedOut, {},
                               "Rate limit timeout after " +
                               std::to_string(to_seconds(now - start).count()) + "s"};
            event.component = admission.limit_name;
            event.retry_after = admission.wait;
            emit(monitor(), std::move(event));
            throw RateLimitExceededException(admission.limit_name, admission.wait);
        }

        // Sleep in small steps so a deadline is honoured promptly.
        Duration step = std::min(std::chrono::duration_cast<Duration>(admission.wait),
                                 config_.poll_interval);
        if (deadline.has_value()) {
            step = std::min(step, *deadline - now);
        }
        step = std::max(step, Duration(std::chrono::microseconds(50)));
        std::this_thread::sleep_for(step);
    }
}

RateLimiterStatus RateLimiter::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RateLimiterStatus status;
    status.total_requests = total_requests_;
    status.total_blocked = total_blocked_;
    status.total_wait = total_wait_;
    status.block_rate = total_requests_ > 0
        ? 100.0 * static_cast<double>(total_blocked_) / static_cast<double>(total_requests_)
        : 0.0;

    for (const auto& limit : limits_) {
        BucketStatus b;
        b.name = limit.definition.name;
        b.capacity = limit.bucket->capacity();
        b.available_tokens = limit.bucket->peek();
        b.refill_rate_per_second = limit.bucket->refill_rate_per_second();
        b.utilization = 100.0 * (1.0 - b.available_tokens / b.capacity);
        b.weighted = limit.definition.weighted;
        status.buckets.push_back(std::move(b));
    }
    return status;
}

std::vector<std::string> RateLimiter::limit_names() const {
    std::vector<std::string> names;
    names.reserve(limits_.size());
    for (const auto& limit : limits_) {
        names.push_back(limit.definition.name);
    }
    return names;
}

const RateLimitConfig& RateLimiter::config() const noexcept {
    return config_;
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& limit : limits_) {
        limit.bucket->reset();
    }
    total_requests_ = 0;
    total_blocked_ = 0;
    total_wait_ = Seconds{0.0};
}

void RateLimiter::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

std::shared_ptr<Monitor> RateLimiter::monitor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monitor_;
}

} // namespace decisiongate
