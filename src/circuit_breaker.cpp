#include "decisiongate/circuit_breaker.hpp"
#include "decisiongate/exceptions.hpp"

#include <algorithm>

namespace decisiongate {

// ========== CircuitBreaker ==========

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config)
    : name_(std::move(name))
    , config_(std::move(config))
{
    validate(config_);
}

const std::string& CircuitBreaker::name() const noexcept { return name_; }
const CircuitBreakerConfig& CircuitBreaker::config() const noexcept { return config_; }

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool CircuitBreaker::can_proceed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return can_proceed_locked(Clock::now());
}

bool CircuitBreaker::can_proceed_locked(Timestamp now) const {
    switch (state_) {
        case CircuitState::Closed:
            return true;
        case CircuitState::Open:
            return now - opened_at_ >= config_.open_timeout;
        case CircuitState::HalfOpen:
            return half_open_calls_ < config_.half_open_max_probes;
    }
    return false;
}

Seconds CircuitBreaker::time_until_retry_locked(Timestamp now) const {
    if (state_ != CircuitState::Open) {
        return Seconds{0.0};
    }
    auto remaining = config_.open_timeout - (now - opened_at_);
    if (remaining <= Duration::zero()) {
        return Seconds{0.0};
    }
    return to_seconds(remaining);
}

MonitorEvent CircuitBreaker::transition_to(CircuitState next, Timestamp now) {
    state_ = next;
    state_changes_++;
    generation_++;
    half_open_calls_ = 0;

    MonitorEvent event{EventType::CircuitClosed, {}, ""};
    switch (next) {
        case CircuitState::Open:
            opened_at_ = now;
            consecutive_successes_ = 0;
            event.type = EventType::CircuitOpened;
            event.message = "Opened after " + std::to_string(consecutive_failures_) +
                            " consecutive failures";
            event.retry_after = to_seconds(config_.open_timeout);
            break;
        case CircuitState::HalfOpen:
            consecutive_successes_ = 0;
            event.type = EventType::CircuitHalfOpened;
            event.message = "Probing after open timeout";
            break;
        case CircuitState::Closed:
            consecutive_failures_ = 0;
            consecutive_successes_ = 0;
            event.type = EventType::CircuitClosed;
            event.message = "Closed after successful probes";
            break;
    }
    event.component = name_;
    event.circuit_state = next;
    return event;
}

std::uint64_t CircuitBreaker::before_call() {
    std::vector<MonitorEvent> events;
    std::optional<Seconds> rejected_retry_after;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();

        if (state_ == CircuitState::Open && now - opened_at_ >= config_.open_timeout) {
            events.push_back(transition_to(CircuitState::HalfOpen, now));
        }

        if (can_proceed_locked(now)) {
            if (state_ == CircuitState::HalfOpen) {
                half_open_calls_++;
            }
            total_calls_++;
            generation = generation_;
        } else {
            rejected_calls_++;
            rejected_retry_after = time_until_retry_locked(now);

            MonitorEvent event{EventType::CallRejected, {}, "Call rejected"};
            event.component = name_;
            event.circuit_state = state_;
            event.retry_after = *rejected_retry_after;
            events.push_back(std::move(event));
        }
    }

    emit_all(std::move(events));

    if (rejected_retry_after.has_value()) {
        throw CircuitOpenException(name_, *rejected_retry_after);
    }
    return generation;
}

void CircuitBreaker::record_success(std::optional<std::uint64_t> generation) {
    std::vector<MonitorEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        total_successes_++;
        last_success_ = now;

        MonitorEvent event{EventType::CallSucceeded, {}, "Call succeeded"};
        event.component = name_;
        event.circuit_state = state_;
        events.push_back(std::move(event));

        // A call admitted before the last state change does not count as a probe
        bool stale = generation.has_value() && *generation != generation_;
        if (!stale && state_ == CircuitState::HalfOpen) {
            consecutive_successes_++;
            if (consecutive_successes_ >= config_.success_threshold) {
                events.push_back(transition_to(CircuitState::Closed, now));
            }
        } else if (!stale && state_ == CircuitState::Closed) {
            consecutive_failures_ = 0;
        }
    }
    emit_all(std::move(events));
}

void CircuitBreaker::record_failure(const std::string& error,
                                    std::optional<std::uint64_t> generation) {
    std::vector<MonitorEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        total_failures_++;
        last_failure_ = now;

        recent_errors_.push_back(RecentError{now, error});
        while (recent_errors_.size() > config_.recent_error_capacity) {
            recent_errors_.pop_front();
        }

        MonitorEvent event{EventType::CallFailed, {}, error};
        event.component = name_;
        event.circuit_state = state_;
        events.push_back(std::move(event));

        bool stale = generation.has_value() && *generation != generation_;
        switch (stale ? CircuitState::Open : state_) {
            case CircuitState::Closed:
                consecutive_failures_++;
                consecutive_successes_ = 0;
                if (consecutive_failures_ >= config_.failure_threshold) {
                    events.push_back(transition_to(CircuitState::Open, now));
                }
                break;
            case CircuitState::HalfOpen:
                consecutive_failures_++;
                events.push_back(transition_to(CircuitState::Open, now));
                break;
            case CircuitState::Open:
                // Admitted before the last state change; the open timeout
                // is not restarted.
                break;
        }
    }
    emit_all(std::move(events));
}

CircuitBreakerStatus CircuitBreaker::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();

    CircuitBreakerStatus status;
    status.name = name_;
    status.state = state_;
    status.can_proceed = can_proceed_locked(now);
    status.total_calls = total_calls_;
    status.total_successes = total_successes_;
    status.total_failures = total_failures_;
    status.rejected_calls = rejected_calls_;
    status.state_changes = state_changes_;
    status.consecutive_failures = consecutive_failures_;
    status.consecutive_successes = consecutive_successes_;
    status.success_rate = total_calls_ > 0
        ? 100.0 * static_cast<double>(total_successes_) / static_cast<double>(total_calls_)
        : 0.0;
    status.failure_threshold = config_.failure_threshold;
    status.success_threshold = config_.success_threshold;
    status.open_timeout = config_.open_timeout;
    status.time_until_retry = time_until_retry_locked(now);
    status.last_failure = last_failure_;
    status.last_success = last_success_;
    status.recent_errors.assign(recent_errors_.begin(), recent_errors_.end());
    return status;
}

void CircuitBreaker::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = CircuitState::Closed;
        consecutive_failures_ = 0;
        consecutive_successes_ = 0;
        half_open_calls_ = 0;
        last_failure_.reset();
        last_success_.reset();
        opened_at_ = Timestamp{};
        total_calls_ = 0;
        total_successes_ = 0;
        total_failures_ = 0;
        rejected_calls_ = 0;
        state_changes_ = 0;
        recent_errors_.clear();
        generation_++;
    }

    MonitorEvent event{EventType::CircuitReset, {}, "Breaker reset"};
    event.component = name_;
    event.circuit_state = CircuitState::Closed;
    emit_all({std::move(event)});
}

void CircuitBreaker::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

void CircuitBreaker::emit_all(std::vector<MonitorEvent> events) {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
    }
    for (auto& event : events) {
        emit(monitor, std::move(event));
    }
}

// ========== CircuitBreakerRegistry ==========

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerConfig default_config)
    : default_config_(std::move(default_config))
{
    validate(default_config_);
}

CircuitBreaker& CircuitBreakerRegistry::get(const std::string& name,
                                            std::optional<CircuitBreakerConfig> config) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(name);
    if (it != breakers_.end()) {
        return *it->second;
    }
    auto breaker = std::make_unique<CircuitBreaker>(name, config.value_or(default_config_));
    breaker->set_monitor(monitor_);
    auto& ref = *breaker;
    breakers_.emplace(name, std::move(breaker));
    return ref;
}

bool CircuitBreakerRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return breakers_.count(name) > 0;
}

std::vector<std::string> CircuitBreakerRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(breakers_.size());
    for (const auto& [name, _] : breakers_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<CircuitBreaker*> CircuitBreakerRegistry::all_breakers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CircuitBreaker*> result;
    result.reserve(breakers_.size());
    for (const auto& [_, breaker] : breakers_) {
        result.push_back(breaker.get());
    }
    return result;
}

std::vector<CircuitBreakerStatus> CircuitBreakerRegistry::get_all_status() const {
    std::vector<CircuitBreakerStatus> result;
    for (auto* breaker : all_breakers()) {
        result.push_back(breaker->get_status());
    }
    std::sort(result.begin(), result.end(),
              [](const CircuitBreakerStatus& a, const CircuitBreakerStatus& b) {
                  return a.name < b.name;
              });
    return result;
}

// Breakers are never removed, so the pointers stay valid outside the lock.
void CircuitBreakerRegistry::reset_all() {
    for (auto* breaker : all_breakers()) {
        breaker->reset();
    }
}

void CircuitBreakerRegistry::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = monitor;
    for (auto& [_, breaker] : breakers_) {
        breaker->set_monitor(monitor);
    }
}

} // namespace decisiongate
