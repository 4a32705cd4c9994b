#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <decisiongate/decisiongate.hpp>

using namespace decisiongate;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_decisiongate, m) {
    m.doc() = "DecisionGate: admission control and fault isolation for decision services";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_monitors(m);
    bind_policies(m);
    bind_resilience(m);
    bind_subsystems(m);
    bind_core(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<CircuitState>(m, "CircuitState")
        .value("Closed",   CircuitState::Closed)
        .value("Open",     CircuitState::Open)
        .value("HalfOpen", CircuitState::HalfOpen)
        .export_values();

    py::enum_<DecisionOutcome>(m, "DecisionOutcome")
        .value("Execute",   DecisionOutcome::Execute)
        .value("Recommend", DecisionOutcome::Recommend)
        .value("Reject",    DecisionOutcome::Reject)
        .value("Paused",    DecisionOutcome::Paused)
        .export_values();

    py::enum_<ExecutionMode>(m, "ExecutionMode")
        .value("Hybrid",  ExecutionMode::Hybrid)
        .value("Auto",    ExecutionMode::Auto)
        .value("NoTrade", ExecutionMode::NoTrade)
        .export_values();

    py::enum_<EvaluationPhase>(m, "EvaluationPhase")
        .value("Preliminary", EvaluationPhase::Preliminary)
        .value("Analysis",    EvaluationPhase::Analysis)
        .value("Context",     EvaluationPhase::Context)
        .value("Historical",  EvaluationPhase::Historical)
        .value("Scoring",     EvaluationPhase::Scoring)
        .value("Simulation",  EvaluationPhase::Simulation)
        .export_values();

    py::enum_<HealthRecommendation>(m, "HealthRecommendation")
        .value("ContinueNormal",   HealthRecommendation::ContinueNormal)
        .value("SwitchToSafeMode", HealthRecommendation::SwitchToSafeMode)
        .export_values();

    py::enum_<RateWindow>(m, "RateWindow")
        .value("PerSecond", RateWindow::PerSecond)
        .value("PerMinute", RateWindow::PerMinute)
        .value("PerHour",   RateWindow::PerHour)
        .value("PerDay",    RateWindow::PerDay)
        .export_values();

    py::enum_<ErrorKind>(m, "ErrorKind")
        .value("RateLimitExceeded", ErrorKind::RateLimitExceeded)
        .value("CircuitOpen",       ErrorKind::CircuitOpen)
        .value("EvaluatorFailure",  ErrorKind::EvaluatorFailure)
        .value("OperationFailed",   ErrorKind::OperationFailed)
        .value("Configuration",     ErrorKind::Configuration)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("RequestRateLimited",    EventType::RequestRateLimited)
        .value("RateLimitTimedOut",     EventType::RateLimitTimedOut)
        .value("CallSucceeded",         EventType::CallSucceeded)
        .value("CallFailed",            EventType::CallFailed)
        .value("CallRejected",          EventType::CallRejected)
        .value("CircuitOpened",         EventType::CircuitOpened)
        .value("CircuitHalfOpened",     EventType::CircuitHalfOpened)
        .value("CircuitClosed",         EventType::CircuitClosed)
        .value("CircuitReset",          EventType::CircuitReset)
        .value("CacheEntryEvicted",     EventType::CacheEntryEvicted)
        .value("CacheExpiredSwept",     EventType::CacheExpiredSwept)
        .value("ModuleFailureReported", EventType::ModuleFailureReported)
        .value("ModuleUnhealthy",       EventType::ModuleUnhealthy)
        .value("ModuleRecovered",       EventType::ModuleRecovered)
        .value("SafeModeActivated",     EventType::SafeModeActivated)
        .value("SafeModeDeactivated",   EventType::SafeModeDeactivated)
        .value("EvaluatorRegistered",   EventType::EvaluatorRegistered)
        .value("EvaluatorVetoed",       EventType::EvaluatorVetoed)
        .value("EvaluatorFailed",       EventType::EvaluatorFailed)
        .value("EvaluatorTimedOut",     EventType::EvaluatorTimedOut)
        .value("DecisionMade",          EventType::DecisionMade)
        .value("DecisionPaused",        EventType::DecisionPaused)
        .value("DecisionSuperseded",    EventType::DecisionSuperseded)
        .value("ExecutionSucceeded",    EventType::ExecutionSucceeded)
        .value("ExecutionFailed",       EventType::ExecutionFailed)
        .value("PauseChanged",          EventType::PauseChanged)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Configuration ----------------------------------------------------

    py::class_<CircuitBreakerConfig>(m, "CircuitBreakerConfig")
        .def(py::init<>())
        .def_readwrite("failure_threshold",     &CircuitBreakerConfig::failure_threshold)
        .def_readwrite("success_threshold",     &CircuitBreakerConfig::success_threshold)
        .def_readwrite("open_timeout",          &CircuitBreakerConfig::open_timeout)
        .def_readwrite("half_open_max_probes",  &CircuitBreakerConfig::half_open_max_probes)
        .def_readwrite("recent_error_capacity", &CircuitBreakerConfig::recent_error_capacity);

    py::class_<RateLimit>(m, "RateLimit")
        .def(py::init<>())
        .def_static("per", &RateLimit::per,
                    py::arg("name"), py::arg("max_units"), py::arg("window"),
                    py::arg("weighted") = false)
        .def_readwrite("name",      &RateLimit::name)
        .def_readwrite("max_units", &RateLimit::max_units)
        .def_readwrite("window",    &RateLimit::window)
        .def_readwrite("weighted",  &RateLimit::weighted)
        .def("refill_rate_per_second", &RateLimit::refill_rate_per_second);

    py::class_<RateLimitConfig>(m, "RateLimitConfig")
        .def(py::init<>())
        .def_readwrite("limits",        &RateLimitConfig::limits)
        .def_readwrite("poll_interval", &RateLimitConfig::poll_interval);

    py::class_<CacheConfig>(m, "CacheConfig")
        .def(py::init<>())
        .def_readwrite("max_size",    &CacheConfig::max_size)
        .def_readwrite("default_ttl", &CacheConfig::default_ttl);

    py::class_<OperatingSettings>(m, "OperatingSettings")
        .def(py::init<>())
        .def_readwrite("execute_confidence_threshold",   &OperatingSettings::execute_confidence_threshold)
        .def_readwrite("min_recommend_confidence",       &OperatingSettings::min_recommend_confidence)
        .def_readwrite("position_size",                  &OperatingSettings::position_size)
        .def_readwrite("max_concurrent_actions",         &OperatingSettings::max_concurrent_actions)
        .def_readwrite("require_multiple_confirmations", &OperatingSettings::require_multiple_confirmations)
        .def_readwrite("conservative_only",              &OperatingSettings::conservative_only);

    py::class_<HealthConfig>(m, "HealthConfig")
        .def(py::init<>())
        .def_readwrite("failure_threshold",          &HealthConfig::failure_threshold)
        .def_readwrite("recovery_threshold",         &HealthConfig::recovery_threshold)
        .def_readwrite("min_health_for_normal_mode", &HealthConfig::min_health_for_normal_mode)
        .def_readwrite("continue_normal_health",     &HealthConfig::continue_normal_health)
        .def_readwrite("pause_in_safe_mode",         &HealthConfig::pause_in_safe_mode)
        .def_readwrite("fallback",                   &HealthConfig::fallback);

    py::class_<DecisionConfig>(m, "DecisionConfig")
        .def(py::init<>())
        .def_readwrite("mode",                      &DecisionConfig::mode)
        .def_readwrite("normal",                    &DecisionConfig::normal)
        .def_readwrite("confidence_weights",        &DecisionConfig::confidence_weights)
        .def_readwrite("parallel_evaluation",       &DecisionConfig::parallel_evaluation)
        .def_readwrite("evaluator_timeout",         &DecisionConfig::evaluator_timeout)
        .def_readwrite("execution_acquire_timeout", &DecisionConfig::execution_acquire_timeout);

    // Config (top-level, embeds the sub-configs)
    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("circuit_breaker",      &Config::circuit_breaker)
        .def_readwrite("rate_limits",          &Config::rate_limits)
        .def_readwrite("cache",                &Config::cache)
        .def_readwrite("health",               &Config::health)
        .def_readwrite("decision",             &Config::decision)
        .def_readwrite("maintenance_interval", &Config::maintenance_interval)
        .def_readwrite("snapshot_interval",    &Config::snapshot_interval)
        .def("validate", [](const Config& self) { validate(self); });

    // ---- Status structs ---------------------------------------------------

    py::class_<RecentError>(m, "RecentError")
        .def(py::init<>())
        .def_readwrite("time",    &RecentError::time)
        .def_readwrite("message", &RecentError::message);

    py::class_<CircuitBreakerStatus>(m, "CircuitBreakerStatus")
        .def(py::init<>())
        .def_readwrite("name",                  &CircuitBreakerStatus::name)
        .def_readwrite("state",                 &CircuitBreakerStatus::state)
        .def_readwrite("can_proceed",           &CircuitBreakerStatus::can_proceed)
        .def_readwrite("total_calls",           &CircuitBreakerStatus::total_calls)
        .def_readwrite("total_successes",       &CircuitBreakerStatus::total_successes)
        .def_readwrite("total_failures",        &CircuitBreakerStatus::total_failures)
        .def_readwrite("rejected_calls",        &CircuitBreakerStatus::rejected_calls)
        .def_readwrite("state_changes",         &CircuitBreakerStatus::state_changes)
        .def_readwrite("consecutive_failures",  &CircuitBreakerStatus::consecutive_failures)
        .def_readwrite("consecutive_successes", &CircuitBreakerStatus::consecutive_successes)
        .def_readwrite("success_rate",          &CircuitBreakerStatus::success_rate)
        .def_readwrite("failure_threshold",     &CircuitBreakerStatus::failure_threshold)
        .def_readwrite("success_threshold",     &CircuitBreakerStatus::success_threshold)
        .def_readwrite("open_timeout",          &CircuitBreakerStatus::open_timeout)
        .def_readwrite("time_until_retry",      &CircuitBreakerStatus::time_until_retry)
        .def_readwrite("last_failure",          &CircuitBreakerStatus::last_failure)
        .def_readwrite("last_success",          &CircuitBreakerStatus::last_success)
        .def_readwrite("recent_errors",         &CircuitBreakerStatus::recent_errors);

    py::class_<BucketStatus>(m, "BucketStatus")
        .def(py::init<>())
        .def_readwrite("name",                   &BucketStatus::name)
        .def_readwrite("available_tokens",       &BucketStatus::available_tokens)
        .def_readwrite("capacity",               &BucketStatus::capacity)
        .def_readwrite("refill_rate_per_second", &BucketStatus::refill_rate_per_second)
        .def_readwrite("utilization",            &BucketStatus::utilization)
        .def_readwrite("weighted",               &BucketStatus::weighted);

    py::class_<RateLimiterStatus>(m, "RateLimiterStatus")
        .def(py::init<>())
        .def_readwrite("buckets",        &RateLimiterStatus::buckets)
        .def_readwrite("total_requests", &RateLimiterStatus::total_requests)
        .def_readwrite("total_blocked",  &RateLimiterStatus::total_blocked)
        .def_readwrite("total_wait",     &RateLimiterStatus::total_wait)
        .def_readwrite("block_rate",     &RateLimiterStatus::block_rate);

    py::class_<CacheStats>(m, "CacheStats")
        .def(py::init<>())
        .def_readwrite("size",        &CacheStats::size)
        .def_readwrite("max_size",    &CacheStats::max_size)
        .def_readwrite("hits",        &CacheStats::hits)
        .def_readwrite("misses",      &CacheStats::misses)
        .def_readwrite("hit_rate",    &CacheStats::hit_rate)
        .def_readwrite("utilization", &CacheStats::utilization);

    py::class_<ModuleHealth>(m, "ModuleHealth")
        .def(py::init<>())
        .def_readwrite("module",                &ModuleHealth::module)
        .def_readwrite("consecutive_failures",  &ModuleHealth::consecutive_failures)
        .def_readwrite("consecutive_successes", &ModuleHealth::consecutive_successes)
        .def_readwrite("total_failures",        &ModuleHealth::total_failures)
        .def_readwrite("total_reports",         &ModuleHealth::total_reports)
        .def_readwrite("healthy",               &ModuleHealth::healthy)
        .def_readwrite("last_report",           &ModuleHealth::last_report);

    py::class_<HealthStatus>(m, "HealthStatus")
        .def(py::init<>())
        .def_readwrite("system_health",    &HealthStatus::system_health)
        .def_readwrite("safe_mode_active", &HealthStatus::safe_mode_active)
        .def_readwrite("modules",          &HealthStatus::modules)
        .def_readwrite("recommendation",   &HealthStatus::recommendation);

    // SystemSnapshot
    py::class_<SystemSnapshot>(m, "SystemSnapshot")
        .def(py::init<>())
        .def_readwrite("timestamp",            &SystemSnapshot::timestamp)
        .def_readwrite("mode",                 &SystemSnapshot::mode)
        .def_readwrite("paused",               &SystemSnapshot::paused)
        .def_readwrite("executions_in_flight", &SystemSnapshot::executions_in_flight)
        .def_readwrite("breakers",             &SystemSnapshot::breakers)
        .def_readwrite("rate_limiter",         &SystemSnapshot::rate_limiter)
        .def_readwrite("caches",               &SystemSnapshot::caches)
        .def_readwrite("health",               &SystemSnapshot::health);

    // MonitorEvent
    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",          &MonitorEvent::type)
        .def_readwrite("timestamp",     &MonitorEvent::timestamp)
        .def_readwrite("message",       &MonitorEvent::message)
        .def_readwrite("component",     &MonitorEvent::component)
        .def_readwrite("decision_id",   &MonitorEvent::decision_id)
        .def_readwrite("outcome",       &MonitorEvent::outcome)
        .def_readwrite("circuit_state", &MonitorEvent::circuit_state)
        .def_readwrite("retry_after",   &MonitorEvent::retry_after)
        .def_readwrite("system_health", &MonitorEvent::system_health)
        .def_readwrite("count",         &MonitorEvent::count)
        .def_readwrite("duration_us",   &MonitorEvent::duration_us);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("total_decisions",              &MetricsMonitor::Metrics::total_decisions)
        .def_readwrite("executed",                     &MetricsMonitor::Metrics::executed)
        .def_readwrite("recommended",                  &MetricsMonitor::Metrics::recommended)
        .def_readwrite("rejected",                     &MetricsMonitor::Metrics::rejected)
        .def_readwrite("paused",                       &MetricsMonitor::Metrics::paused)
        .def_readwrite("vetoes",                       &MetricsMonitor::Metrics::vetoes)
        .def_readwrite("evaluator_failures",           &MetricsMonitor::Metrics::evaluator_failures)
        .def_readwrite("superseded_executions",        &MetricsMonitor::Metrics::superseded_executions)
        .def_readwrite("execution_failures",           &MetricsMonitor::Metrics::execution_failures)
        .def_readwrite("circuit_trips",                &MetricsMonitor::Metrics::circuit_trips)
        .def_readwrite("rejected_calls",               &MetricsMonitor::Metrics::rejected_calls)
        .def_readwrite("rate_limited",                 &MetricsMonitor::Metrics::rate_limited)
        .def_readwrite("safe_mode_activations",        &MetricsMonitor::Metrics::safe_mode_activations)
        .def_readwrite("average_decision_duration_us", &MetricsMonitor::Metrics::average_decision_duration_us)
        .def_readwrite("last_system_health",           &MetricsMonitor::Metrics::last_system_health)
        .def_readwrite("open_breakers",                &MetricsMonitor::Metrics::open_breakers);

    // ---- Decision structs -------------------------------------------------

    py::class_<EvaluationContext>(m, "EvaluationContext")
        .def(py::init<>())
        .def_readwrite("subject",    &EvaluationContext::subject)
        .def_readwrite("direction",  &EvaluationContext::direction)
        .def_readwrite("signals",    &EvaluationContext::signals)
        .def_readwrite("attributes", &EvaluationContext::attributes)
        .def_readwrite("as_of",      &EvaluationContext::as_of)
        .def("signal",    &EvaluationContext::signal,    py::arg("key"))
        .def("attribute", &EvaluationContext::attribute, py::arg("key"));

    py::class_<Verdict>(m, "Verdict")
        .def(py::init<>())
        .def_static("approve", &Verdict::approve,
                    py::arg("name"), py::arg("confidence"), py::arg("reason") = "")
        .def_static("veto", &Verdict::veto,
                    py::arg("name"), py::arg("reason"), py::arg("confidence") = 0.0)
        .def_readwrite("name",       &Verdict::name)
        .def_readwrite("approved",   &Verdict::approved)
        .def_readwrite("reason",     &Verdict::reason)
        .def_readwrite("confidence", &Verdict::confidence)
        .def("__repr__", [](const Verdict& v) {
            return "<Verdict name='" + v.name + "' "
                 + (v.approved ? "approve" : "veto")
                 + " confidence=" + std::to_string(v.confidence) + ">";
        });

    py::class_<Error>(m, "Error")
        .def(py::init<>())
        .def_readwrite("kind",        &Error::kind)
        .def_readwrite("message",     &Error::message)
        .def_readwrite("source",      &Error::source)
        .def_readwrite("retry_after", &Error::retry_after)
        .def("is_recoverable", &Error::is_recoverable);

    py::class_<ExecutionAction>(m, "ExecutionAction")
        .def(py::init<>())
        .def_readwrite("dependency", &ExecutionAction::dependency)
        .def_readwrite("weight",     &ExecutionAction::weight)
        .def_readwrite("operation",  &ExecutionAction::operation)
        .def_readwrite("cache_key",  &ExecutionAction::cache_key)
        .def_readwrite("cache_ttl",  &ExecutionAction::cache_ttl);

    py::class_<FinalDecision>(m, "FinalDecision")
        .def(py::init<>())
        .def_readwrite("id",                 &FinalDecision::id)
        .def_readwrite("outcome",            &FinalDecision::outcome)
        .def_readwrite("mode",               &FinalDecision::mode)
        .def_readwrite("safe_mode",          &FinalDecision::safe_mode)
        .def_readwrite("settings",           &FinalDecision::settings)
        .def_readwrite("confidence",         &FinalDecision::confidence)
        .def_readwrite("veto_count",         &FinalDecision::veto_count)
        .def_readwrite("veto_reasons",       &FinalDecision::veto_reasons)
        .def_readwrite("verdicts",           &FinalDecision::verdicts)
        .def_readwrite("reasons",            &FinalDecision::reasons)
        .def_readwrite("superseded_outcome", &FinalDecision::superseded_outcome)
        .def_readwrite("execution_error",    &FinalDecision::execution_error)
        .def_readwrite("execution_result",   &FinalDecision::execution_result)
        .def_readwrite("timestamp",          &FinalDecision::timestamp)
        .def("__repr__", [](const FinalDecision& d) {
            return "<FinalDecision id=" + std::to_string(d.id)
                 + " outcome=" + std::string(to_string(d.outcome))
                 + " confidence=" + std::to_string(d.confidence) + ">";
        });

    py::class_<OrchestratorStats>(m, "OrchestratorStats")
        .def(py::init<>())
        .def_readwrite("total_cycles",          &OrchestratorStats::total_cycles)
        .def_readwrite("executed",              &OrchestratorStats::executed)
        .def_readwrite("recommended",           &OrchestratorStats::recommended)
        .def_readwrite("rejected",              &OrchestratorStats::rejected)
        .def_readwrite("paused",                &OrchestratorStats::paused)
        .def_readwrite("vetoes",                &OrchestratorStats::vetoes)
        .def_readwrite("evaluator_failures",    &OrchestratorStats::evaluator_failures)
        .def_readwrite("execution_failures",    &OrchestratorStats::execution_failures)
        .def_readwrite("superseded_executions", &OrchestratorStats::superseded_executions)
        .def_readwrite("average_cycle_us",      &OrchestratorStats::average_cycle_us);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_DecisionGateError =
        py::register_exception<DecisionGateException>(m, "DecisionGateError", PyExc_RuntimeError);

    // Derived from DecisionGateError
    static auto py_RateLimitExceededError =
        py::register_exception<RateLimitExceededException>(m, "RateLimitExceededError", py_DecisionGateError.ptr());
    static auto py_CircuitOpenError =
        py::register_exception<CircuitOpenException>(m, "CircuitOpenError", py_DecisionGateError.ptr());
    static auto py_EvaluatorFailureError =
        py::register_exception<EvaluatorFailureException>(m, "EvaluatorFailureError", py_DecisionGateError.ptr());
    static auto py_ConfigurationError =
        py::register_exception<ConfigurationException>(m, "ConfigurationError", py_DecisionGateError.ptr());

    static auto py_InvalidRequestError =
        py::register_exception<InvalidRequestException>(m, "InvalidRequestError", py_DecisionGateError.ptr());

    // Derived from InvalidRequestError
    static auto py_WeightExceedsCapacityError =
        py::register_exception<WeightExceedsCapacityException>(m, "WeightExceedsCapacityError", py_InvalidRequestError.ptr());
}
