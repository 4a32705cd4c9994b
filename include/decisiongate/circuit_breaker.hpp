#pragma once

#include "decisiongate/config.hpp"
#include "decisiongate/monitor.hpp"

#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace decisiongate {

// Guards one external dependency.
//
//   Closed   --failure_threshold consecutive failures-->  Open
//   Open     --open_timeout elapsed, next attempt------->  HalfOpen
//   HalfOpen --success_threshold consecutive successes->  Closed
//   HalfOpen --any failure------------------------------>  Open
//
// Open rejects without invoking the operation. HalfOpen admits at most
// half_open_max_probes calls. The Open -> HalfOpen move is made lazily by the
// first admission attempt after the timeout, never by a timer.
class CircuitBreaker {
public:
    explicit CircuitBreaker(std::string name,
                            CircuitBreakerConfig config = CircuitBreakerConfig{});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    const std::string& name() const noexcept;
    const CircuitBreakerConfig& config() const noexcept;

    // Stored state. An expired Open is reported as Open until the next
    // admission attempt moves it to HalfOpen.
    CircuitState state() const;

    // Whether an attempt made now would be admitted. Does not admit.
    bool can_proceed() const;

    // Admission gate. Throws CircuitOpenException when rejected. Returns the
    // generation the call was admitted in; every state change starts a new one.
    std::uint64_t before_call();

    // An outcome tagged with an older generation than the current one is
    // counted in the totals but does not move the state machine. Untagged
    // outcomes always apply to the current state.
    void record_success(std::optional<std::uint64_t> generation = std::nullopt);
    void record_failure(const std::string& error,
                        std::optional<std::uint64_t> generation = std::nullopt);

    // Gates, runs op outside the breaker lock, records the outcome and
    // rethrows whatever op threw.
    template <typename F>
    auto call(F&& op) -> std::invoke_result_t<F> {
        using R = std::invoke_result_t<F>;
        auto generation = before_call();
        if constexpr (std::is_void_v<R>) {
            run_recorded(generation, std::forward<F>(op));
            record_success(generation);
        } else {
            R result = run_recorded(generation, std::forward<F>(op));
            record_success(generation);
            return result;
        }
    }

    CircuitBreakerStatus get_status() const;

    // Back to Closed with counters and metrics cleared
    void reset();

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    const std::string name_;
    const CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    std::size_t consecutive_failures_{0};
    std::size_t consecutive_successes_{0};
    std::size_t half_open_calls_{0};
    std::optional<Timestamp> last_failure_;
    std::optional<Timestamp> last_success_;
    Timestamp opened_at_{};

    std::uint64_t total_calls_{0};
    std::uint64_t total_successes_{0};
    std::uint64_t total_failures_{0};
    std::uint64_t rejected_calls_{0};
    std::uint64_t state_changes_{0};
    std::deque<RecentError> recent_errors_;
    std::uint64_t generation_{0};

    std::shared_ptr<Monitor> monitor_;

    // Caller holds mutex_. Returns the event describing the change.
    MonitorEvent transition_to(CircuitState next, Timestamp now);
    bool can_proceed_locked(Timestamp now) const;
    Seconds time_until_retry_locked(Timestamp now) const;

    void emit_all(std::vector<MonitorEvent> events);

    // Only op runs inside the try: a failure is recorded for what op threw
    template <typename F>
    auto run_recorded(std::uint64_t generation, F&& op) -> std::invoke_result_t<F> {
        try {
            return std::forward<F>(op)();
        } catch (const std::exception& e) {
            record_failure(e.what(), generation);
            throw;
        } catch (...) {
            record_failure("unknown error", generation);
            throw;
        }
    }
};

// Lazily creates exactly one breaker per dependency name.
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(CircuitBreakerConfig default_config = CircuitBreakerConfig{});

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    // config applies only when the breaker is created. The reference stays
    // valid for the registry's lifetime.
    CircuitBreaker& get(const std::string& name,
                        std::optional<CircuitBreakerConfig> config = std::nullopt);

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    std::vector<CircuitBreakerStatus> get_all_status() const;
    void reset_all();

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    CircuitBreakerConfig default_config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;
    std::shared_ptr<Monitor> monitor_;

    std::vector<CircuitBreaker*> all_breakers() const;
};

} // namespace decisiongate
