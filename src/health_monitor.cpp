#include "decisiongate/health_monitor.hpp"

#include <algorithm>

namespace decisiongate {

HealthMonitor::HealthMonitor(HealthConfig config)
    : config_(std::move(config))
{
    validate(config_);
}

void HealthMonitor::report_module_result(const std::string& module, bool healthy,
                                         const std::string& detail) {
    std::vector<MonitorEvent> events;
    std::shared_ptr<Monitor> monitor;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;

        auto [it, inserted] = modules_.try_emplace(module);
        auto& record = it->second;
        if (inserted) {
            record.module = module;
        }
        record.total_reports++;
        record.last_report = Clock::now();

        if (healthy) {
            record.consecutive_successes++;
            if (!record.healthy) {
                if (record.consecutive_successes >= config_.recovery_threshold) {
                    record.healthy = true;
                    record.consecutive_failures = 0;

                    MonitorEvent event{EventType::ModuleRecovered, {},
                                       "Module " + module + " recovered"};
                    event.component = module;
                    events.push_back(std::move(event));
                }
            } else {
                record.consecutive_failures = 0;
            }
        } else {
            record.consecutive_successes = 0;
            record.consecutive_failures++;
            record.total_failures++;

            MonitorEvent reported{EventType::ModuleFailureReported, {},
                                  detail.empty() ? "Module " + module + " failed" : detail};
            reported.component = module;
            reported.count = record.consecutive_failures;
            events.push_back(std::move(reported));

            if (record.healthy && record.consecutive_failures >= config_.failure_threshold) {
                record.healthy = false;

                MonitorEvent event{EventType::ModuleUnhealthy, {},
                                   "Module " + module + " unhealthy after " +
                                   std::to_string(record.consecutive_failures) +
                                   " consecutive failures"};
                event.component = module;
                event.count = record.consecutive_failures;
                event.system_health = health_locked();
                events.push_back(std::move(event));
            }
        }

        if (auto transition = update_safe_mode_locked()) {
            events.push_back(std::move(*transition));
        }
    }

    // Outside the lock: emit events
    for (auto& event : events) {
        emit(monitor, std::move(event));
    }
}

double HealthMonitor::health_locked() const {
    if (modules_.empty()) {
        return 100.0;
    }
    auto healthy = std::count_if(modules_.begin(), modules_.end(),
                                 [](const auto& entry) { return entry.second.healthy; });
    return 100.0 * static_cast<double>(healthy) / static_cast<double>(modules_.size());
}

std::optional<MonitorEvent> HealthMonitor::update_safe_mode_locked() {
    double health = health_locked();
    bool active = health < config_.min_health_for_normal_mode;
    if (active == safe_mode_) {
        return std::nullopt;
    }
    safe_mode_ = active;

    MonitorEvent event{active ? EventType::SafeModeActivated : EventType::SafeModeDeactivated,
                       {},
                       active ? "System health below normal-mode minimum, using fallback settings"
                              : "System health restored, leaving safe mode"};
    event.system_health = health;
    return event;
}

double HealthMonitor::system_health() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return health_locked();
}

bool HealthMonitor::should_activate_safe_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return health_locked() < config_.min_health_for_normal_mode;
}

const OperatingSettings& HealthMonitor::fallback_settings() const noexcept {
    return config_.fallback;
}

std::optional<ModuleHealth> HealthMonitor::get_module(const std::string& module) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = modules_.find(module);
    if (it == modules_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> HealthMonitor::unhealthy_modules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [name, record] : modules_) {
        if (!record.healthy) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

HealthStatus HealthMonitor::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    HealthStatus status;
    status.system_health = health_locked();
    status.safe_mode_active = status.system_health < config_.min_health_for_normal_mode;
    status.recommendation = status.system_health > config_.continue_normal_health
        ? HealthRecommendation::ContinueNormal
        : HealthRecommendation::SwitchToSafeMode;

    status.modules.reserve(modules_.size());
    for (const auto& [_, record] : modules_) {
        status.modules.push_back(record);
    }
    std::sort(status.modules.begin(), status.modules.end(),
              [](const ModuleHealth& a, const ModuleHealth& b) { return a.module < b.module; });
    return status;
}

const HealthConfig& HealthMonitor::config() const noexcept {
    return config_;
}

bool HealthMonitor::forget(const std::string& module) {
    std::optional<MonitorEvent> transition;
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (modules_.erase(module) == 0) {
            return false;
        }
        transition = update_safe_mode_locked();
        monitor = monitor_;
    }
    if (transition.has_value()) {
        emit(monitor, std::move(*transition));
    }
    return true;
}

void HealthMonitor::reset() {
    std::optional<MonitorEvent> transition;
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        modules_.clear();
        transition = update_safe_mode_locked();
        monitor = monitor_;
    }
    if (transition.has_value()) {
        emit(monitor, std::move(*transition));
    }
}

void HealthMonitor::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

} // namespace decisiongate
