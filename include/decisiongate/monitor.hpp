#pragma once

#include "decisiongate/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace decisiongate {

enum class EventType {
    // Rate limiting
    RequestRateLimited,
    RateLimitTimedOut,
    // Circuit breaking
    CallSucceeded,
    CallFailed,
    CallRejected,
    CircuitOpened,
    CircuitHalfOpened,
    CircuitClosed,
    CircuitReset,
    // Caching
    CacheEntryEvicted,
    CacheExpiredSwept,
    // Health
    ModuleFailureReported,
    ModuleUnhealthy,
    ModuleRecovered,
    SafeModeActivated,
    SafeModeDeactivated,
    // Decision cycle
    EvaluatorRegistered,
    EvaluatorVetoed,
    EvaluatorFailed,
    EvaluatorTimedOut,
    DecisionMade,
    DecisionPaused,
    DecisionSuperseded,
    ExecutionSucceeded,
    ExecutionFailed,
    PauseChanged
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    // Breaker, limit, cache, module or evaluator name
    std::optional<std::string> component;
    std::optional<DecisionId> decision_id;
    std::optional<DecisionOutcome> outcome;
    std::optional<CircuitState> circuit_state;
    std::optional<Seconds> retry_after;
    std::optional<double> system_health;
    std::optional<std::size_t> count;

    // Operation duration in microseconds (e.g., decision cycle duration)
    std::optional<double> duration_us;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const SystemSnapshot& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SystemSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t total_decisions{0};
        std::uint64_t executed{0};
        std::uint64_t recommended{0};
        std::uint64_t rejected{0};
        std::uint64_t paused{0};
        std::uint64_t vetoes{0};
        std::uint64_t evaluator_failures{0};
        std::uint64_t superseded_executions{0};
        std::uint64_t execution_failures{0};
        std::uint64_t circuit_trips{0};
        std::uint64_t rejected_calls{0};
        std::uint64_t rate_limited{0};
        std::uint64_t safe_mode_activations{0};
        double average_decision_duration_us{0.0};
        double last_system_health{100.0};
        std::size_t open_breakers{0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SystemSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    void set_health_alert_threshold(double threshold, AlertCallback cb);
    void set_open_breaker_alert_threshold(std::size_t threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    double health_threshold_{-1.0};  // < 0 means disabled
    AlertCallback health_cb_;
    std::size_t open_breaker_threshold_{0};
    AlertCallback open_breaker_cb_;

    std::uint64_t decision_duration_count_{0};
    double decision_duration_sum_us_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SystemSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

// Shared by components: stamps and forwards one event if a monitor is set.
// A monitor that throws is reported on std::cerr; the error never reaches
// the component that emitted the event.
void emit(const std::shared_ptr<Monitor>& monitor, MonitorEvent event);
void emit(const std::shared_ptr<Monitor>& monitor, const SystemSnapshot& snapshot);

} // namespace decisiongate
