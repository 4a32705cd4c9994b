#pragma once

#include "decisiongate/config.hpp"
#include "decisiongate/monitor.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace decisiongate {

// Tracks per-module failures and derives a 0-100 system health score.
//
// A module becomes unhealthy after failure_threshold consecutive failed
// reports and recovers after recovery_threshold consecutive successful ones.
// system_health = healthy modules / reported modules * 100, or 100 before any
// module has reported. Safe mode is active while health is below
// min_health_for_normal_mode.
class HealthMonitor {
public:
    explicit HealthMonitor(HealthConfig config = HealthConfig{});

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // Unknown modules are created on first report
    void report_module_result(const std::string& module, bool healthy,
                              const std::string& detail = "");

    double system_health() const;
    bool should_activate_safe_mode() const;

    // Settings the orchestrator switches to while safe mode is active
    const OperatingSettings& fallback_settings() const noexcept;

    std::optional<ModuleHealth> get_module(const std::string& module) const;
    std::vector<std::string> unhealthy_modules() const;
    HealthStatus get_status() const;
    const HealthConfig& config() const noexcept;

    // Drop one module's record so it no longer counts toward system health.
    // Returns false when the module was never reported.
    bool forget(const std::string& module);

    // Forget every module. Leaves safe mode if it was active.
    void reset();

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    HealthConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ModuleHealth> modules_;
    bool safe_mode_{false};
    std::shared_ptr<Monitor> monitor_;

    // Caller holds mutex_
    double health_locked() const;
    std::optional<MonitorEvent> update_safe_mode_locked();
};

} // namespace decisiongate
