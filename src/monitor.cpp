#include "decisiongate/monitor.hpp"

#include <iostream>
#include <iomanip>
#include <exception>

namespace decisiongate {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::RequestRateLimited:    return "RequestRateLimited";
        case EventType::RateLimitTimedOut:     return "RateLimitTimedOut";
        case EventType::CallSucceeded:         return "CallSucceeded";
        case EventType::CallFailed:            return "CallFailed";
        case EventType::CallRejected:          return "CallRejected";
        case EventType::CircuitOpened:         return "CircuitOpened";
        case EventType::CircuitHalfOpened:     return "CircuitHalfOpened";
        case EventType::CircuitClosed:         return "CircuitClosed";
        case EventType::CircuitReset:          return "CircuitReset";
        case EventType::CacheEntryEvicted:     return "CacheEntryEvicted";
        case EventType::CacheExpiredSwept:     return "CacheExpiredSwept";
        case EventType::ModuleFailureReported: return "ModuleFailureReported";
        case EventType::ModuleUnhealthy:       return "ModuleUnhealthy";
        case EventType::ModuleRecovered:       return "ModuleRecovered";
        case EventType::SafeModeActivated:     return "SafeModeActivated";
        case EventType::SafeModeDeactivated:   return "SafeModeDeactivated";
        case EventType::EvaluatorRegistered:   return "EvaluatorRegistered";
        case EventType::EvaluatorVetoed:       return "EvaluatorVetoed";
        case EventType::EvaluatorFailed:       return "EvaluatorFailed";
        case EventType::EvaluatorTimedOut:     return "EvaluatorTimedOut";
        case EventType::DecisionMade:          return "DecisionMade";
        case EventType::DecisionPaused:        return "DecisionPaused";
        case EventType::DecisionSuperseded:    return "DecisionSuperseded";
        case EventType::ExecutionSucceeded:    return "ExecutionSucceeded";
        case EventType::ExecutionFailed:       return "ExecutionFailed";
        case EventType::PauseChanged:          return "PauseChanged";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::RateLimitTimedOut:
        case EventType::CircuitOpened:
        case EventType::CircuitHalfOpened:
        case EventType::CircuitClosed:
        case EventType::ModuleUnhealthy:
        case EventType::ModuleRecovered:
        case EventType::SafeModeActivated:
        case EventType::SafeModeDeactivated:
        case EventType::EvaluatorFailed:
        case EventType::EvaluatorTimedOut:
        case EventType::DecisionMade:
        case EventType::DecisionPaused:
        case EventType::DecisionSuperseded:
        case EventType::ExecutionFailed:
        case EventType::PauseChanged:
            return true;
        default:
            return false;
    }
}

bool is_debug_event(EventType t) {
    return t == EventType::CallSucceeded || t == EventType::CacheEntryEvicted;
}

} // anonymous namespace

void emit(const std::shared_ptr<Monitor>& monitor, MonitorEvent event) {
    if (!monitor) return;
    if (event.timestamp == Timestamp{}) {
        event.timestamp = Clock::now();
    }
    try {
        monitor->on_event(event);
    } catch (const std::exception& e) {
        std::cerr << "[DecisionGate] monitor failed on " << to_string(event.type)
                  << ": " << e.what() << std::endl;
    }
}

void emit(const std::shared_ptr<Monitor>& monitor, const SystemSnapshot& snapshot) {
    if (!monitor) return;
    try {
        monitor->on_snapshot(snapshot);
    } catch (const std::exception& e) {
        std::cerr << "[DecisionGate] monitor failed on snapshot: " << e.what() << std::endl;
    }
}

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && is_debug_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[DecisionGate] " << to_string(event.type);

    if (event.component.has_value()) {
        std::cout << " component=" << event.component.value();
    }
    if (event.decision_id.has_value()) {
        std::cout << " decision=" << event.decision_id.value();
    }
    if (event.outcome.has_value()) {
        std::cout << " outcome=" << to_string(event.outcome.value());
    }
    if (event.circuit_state.has_value()) {
        std::cout << " state=" << to_string(event.circuit_state.value());
    }
    if (event.retry_after.has_value()) {
        std::cout << " retry_after=" << std::fixed << std::setprecision(3)
                  << event.retry_after->count() << "s";
    }
    if (event.system_health.has_value()) {
        std::cout << " health=" << std::fixed << std::setprecision(1)
                  << event.system_health.value() << "%";
    }
    if (event.count.has_value()) {
        std::cout << " count=" << event.count.value();
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_snapshot(const SystemSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "\n[DecisionGate] === System Snapshot ===\n";
    std::cout << "  Mode: " << to_string(snapshot.mode)
              << (snapshot.paused ? " (paused)" : "") << "\n";
    std::cout << "  Health: " << std::fixed << std::setprecision(1)
              << snapshot.health.system_health << "%"
              << (snapshot.health.safe_mode_active ? " SAFE MODE" : "") << "\n";
    std::cout << "  Executions in flight: " << snapshot.executions_in_flight << "\n";

    std::cout << "  Breakers:\n";
    for (const auto& b : snapshot.breakers) {
        std::cout << "    [" << b.name << "] " << to_string(b.state)
                  << " calls=" << b.total_calls
                  << " failures=" << b.total_failures
                  << " success=" << std::setprecision(1) << b.success_rate << "%\n";
    }

    std::cout << "  Rate limits:\n";
    for (const auto& bucket : snapshot.rate_limiter.buckets) {
        std::cout << "    [" << bucket.name << "] avail="
                  << std::setprecision(1) << bucket.available_tokens
                  << "/" << bucket.capacity
                  << " util=" << bucket.utilization << "%\n";
    }

    std::cout << "  Caches:\n";
    for (const auto& [name, stats] : snapshot.caches) {
        std::cout << "    [" << name << "] size=" << stats.size << "/" << stats.max_size
                  << " hit_rate=" << std::setprecision(1) << stats.hit_rate << "%\n";
    }
    std::cout << "  ========================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::DecisionMade:
            metrics_.total_decisions++;
            if (event.outcome.has_value()) {
                switch (event.outcome.value()) {
                    case DecisionOutcome::Execute:   metrics_.executed++; break;
                    case DecisionOutcome::Recommend: metrics_.recommended++; break;
                    case DecisionOutcome::Reject:    metrics_.rejected++; break;
                    case DecisionOutcome::Paused:    metrics_.paused++; break;
                }
            }
            if (event.duration_us.has_value()) {
                decision_duration_count_++;
                decision_duration_sum_us_ += event.duration_us.value();
                metrics_.average_decision_duration_us =
                    decision_duration_sum_us_ / static_cast<double>(decision_duration_count_);
            }
            break;
        case EventType::DecisionPaused:
            metrics_.total_decisions++;
            metrics_.paused++;
            break;
        case EventType::EvaluatorVetoed:
            metrics_.vetoes++;
            break;
        case EventType::EvaluatorFailed:
        case EventType::EvaluatorTimedOut:
            metrics_.vetoes++;
            metrics_.evaluator_failures++;
            break;
        case EventType::DecisionSuperseded:
            metrics_.superseded_executions++;
            break;
        case EventType::ExecutionFailed:
            metrics_.execution_failures++;
            break;
        case EventType::CircuitOpened:
            metrics_.circuit_trips++;
            break;
        case EventType::CallRejected:
            metrics_.rejected_calls++;
            break;
        case EventType::RequestRateLimited:
            metrics_.rate_limited++;
            break;
        case EventType::SafeModeActivated:
            metrics_.safe_mode_activations++;
            break;
        default:
            break;
    }

    if (event.system_health.has_value()) {
        metrics_.last_system_health = event.system_health.value();
    }
}

void MetricsMonitor::on_snapshot(const SystemSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    metrics_.last_system_health = snapshot.health.system_health;

    std::size_t open = 0;
    for (const auto& b : snapshot.breakers) {
        if (b.state == CircuitState::Open) open++;
    }
    metrics_.open_breakers = open;

    // Check alert thresholds
    if (health_cb_ && health_threshold_ >= 0.0 &&
        metrics_.last_system_health < health_threshold_) {
        health_cb_("System health " + std::to_string(metrics_.last_system_health) +
                   "% below threshold " + std::to_string(health_threshold_) + "%");
    }

    if (open_breaker_cb_ && open > open_breaker_threshold_) {
        open_breaker_cb_("Open breakers " + std::to_string(open) +
                         " exceeds threshold " + std::to_string(open_breaker_threshold_));
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    decision_duration_count_ = 0;
    decision_duration_sum_us_ = 0.0;
}

void MetricsMonitor::set_health_alert_threshold(double threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    health_threshold_ = threshold;
    health_cb_ = std::move(cb);
}

void MetricsMonitor::set_open_breaker_alert_threshold(std::size_t threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    open_breaker_threshold_ = threshold;
    open_breaker_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const SystemSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace decisiongate
