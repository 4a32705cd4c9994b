#include "decisiongate/decision_orchestrator.hpp"
#include "decisiongate/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace decisiongate {

namespace {

std::string format_fixed(double value, int precision = 2) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

// Lifecycle of one threaded evaluation
constexpr int kTaskRunning = 0;
constexpr int kTaskFinished = 1;
constexpr int kTaskAbandoned = 2;

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

} // anonymous namespace

DecisionOrchestrator::DecisionOrchestrator(Config config)
    : config_(std::move(config))
    , breakers_(config_.circuit_breaker)
    , rate_limiter_(config_.rate_limits)
    , caches_(config_.cache)
    , health_(config_.health)
    , caller_(rate_limiter_, breakers_, config_.decision.execution_acquire_timeout)
    , policy_(std::make_unique<WeightedAveragePolicy>(config_.decision.confidence_weights))
    , mode_(config_.decision.mode)
{
    validate(config_);
    caches_.get_cache(kDefaultCache);
}

DecisionOrchestrator::~DecisionOrchestrator() {
    stop();
}

// ==================== Evaluators ====================

void DecisionOrchestrator::register_evaluator(std::shared_ptr<Evaluator> evaluator) {
    if (!evaluator) {
        throw ConfigurationException("evaluators", "evaluator must not be null");
    }
    std::string name = evaluator->name();
    if (name.empty()) {
        throw ConfigurationException("evaluators", "evaluator name must not be empty");
    }

    {
        std::unique_lock lock(registry_mutex_);
        for (const auto& entry : evaluators_) {
            if (entry.name == name) {
                throw ConfigurationException("evaluators." + name, "duplicate evaluator name");
            }
        }
        auto phase = evaluator->phase();
        evaluators_.push_back(Registered{std::move(evaluator), name, phase,
                                         std::make_shared<std::atomic<std::size_t>>(0)});
        // Stable: registration order is kept inside a phase
        std::stable_sort(evaluators_.begin(), evaluators_.end(),
                         [](const Registered& a, const Registered& b) {
                             return a.phase < b.phase;
                         });
    }

    emit_event(EventType::EvaluatorRegistered, "Evaluator registered: " + name,
               std::nullopt, name);
}

bool DecisionOrchestrator::unregister_evaluator(const std::string& name) {
    {
        std::unique_lock lock(registry_mutex_);
        auto it = std::find_if(evaluators_.begin(), evaluators_.end(),
                               [&](const Registered& entry) { return entry.name == name; });
        if (it == evaluators_.end()) return false;
        evaluators_.erase(it);
    }
    // A removed evaluator no longer reports, so its record would never recover
    health_.forget(name);
    return true;
}

std::vector<std::string> DecisionOrchestrator::evaluator_names() const {
    std::shared_lock lock(registry_mutex_);
    std::vector<std::string> names;
    names.reserve(evaluators_.size());
    for (const auto& entry : evaluators_) {
        names.push_back(entry.name);
    }
    return names;
}

std::size_t DecisionOrchestrator::evaluator_count() const {
    std::shared_lock lock(registry_mutex_);
    return evaluators_.size();
}

// ==================== Decision Cycle ====================

FinalDecision DecisionOrchestrator::decide(const EvaluationContext& context) {
    auto started = Clock::now();

    FinalDecision decision;
    decision.id = next_decision_id_.fetch_add(1);
    decision.mode = mode_.load();
    decision.timestamp = started;

    // Preliminary gate: nothing is evaluated
    if (paused_.load()) {
        decision.outcome = DecisionOutcome::Paused;
        decision.reasons.push_back("decisions paused");
        record_cycle(decision, started);
        return decision;
    }
    if (decision.mode == ExecutionMode::NoTrade) {
        decision.outcome = DecisionOutcome::Reject;
        decision.reasons.push_back("mode NoTrade: no action taken");
        record_cycle(decision, started);
        return decision;
    }

    std::vector<Registered> evaluators;
    std::optional<ExecutionAction> action;
    {
        std::shared_lock lock(registry_mutex_);
        evaluators = evaluators_;
        action = action_;
    }

    // Safe mode is decided before any evaluator runs
    decision.safe_mode = health_.should_activate_safe_mode();
    decision.settings = decision.safe_mode ? health_.fallback_settings()
                                           : config_.decision.normal;
    if (decision.safe_mode) {
        decision.reasons.push_back("safe mode active (system health " +
                                   format_fixed(health_.system_health(), 1) +
                                   "%): fallback settings applied");
        if (config_.health.pause_in_safe_mode) {
            // Evaluators still run so their modules can recover; verdicts
            // are discarded.
            std::size_t failures = 0;
            for (const auto& result : run_evaluators(evaluators, context)) {
                health_.report_module_result(result.verdict.name, !result.failed, result.error);
                if (result.failed) {
                    failures++;
                    emit_event(result.timed_out ? EventType::EvaluatorTimedOut
                                                : EventType::EvaluatorFailed,
                               result.error, decision.id, result.verdict.name);
                }
            }
            decision.outcome = DecisionOutcome::Paused;
            decision.reasons.push_back("decisions paused while in safe mode");
            if (!evaluators.empty()) {
                decision.reasons.push_back("evaluators run as health checks only (" +
                                           std::to_string(failures) + " failed)");
            }
            record_cycle(decision, started, failures);
            return decision;
        }
    }

    // Evaluation: a veto never stops the remaining evaluators
    auto results = run_evaluators(evaluators, context);

    std::vector<Verdict> approved;
    std::size_t evaluator_failures = 0;
    for (auto& result : results) {
        const auto& verdict = result.verdict;
        health_.report_module_result(verdict.name, !result.failed, result.error);

        if (verdict.approved) {
            approved.push_back(verdict);
        } else {
            decision.veto_reasons.push_back(verdict.name + ": " + verdict.reason);
            if (result.failed) {
                evaluator_failures++;
                emit_event(result.timed_out ? EventType::EvaluatorTimedOut
                                            : EventType::EvaluatorFailed,
                           result.error, decision.id, verdict.name);
            } else {
                emit_event(EventType::EvaluatorVetoed, verdict.reason, decision.id, verdict.name);
            }
        }
        decision.verdicts.push_back(std::move(result.verdict));
    }
    decision.veto_count = decision.veto_reasons.size();

    // Aggregation
    const auto& settings = decision.settings;
    if (decision.veto_count > 0) {
        decision.outcome = DecisionOutcome::Reject;
        decision.reasons.insert(decision.reasons.end(),
                                decision.veto_reasons.begin(), decision.veto_reasons.end());
    } else {
        {
            std::shared_lock lock(registry_mutex_);
            decision.confidence = policy_->combine(approved);
        }

        std::string confidence = format_fixed(decision.confidence);
        if (decision.confidence < settings.min_recommend_confidence) {
            decision.outcome = DecisionOutcome::Reject;
            decision.reasons.push_back("confidence " + confidence + " below minimum " +
                                       format_fixed(settings.min_recommend_confidence));
        } else if (decision.mode == ExecutionMode::Hybrid) {
            decision.outcome = DecisionOutcome::Recommend;
            decision.reasons.push_back("hybrid mode: recommendation only (confidence " +
                                       confidence + ")");
        } else if (decision.confidence < settings.execute_confidence_threshold) {
            decision.outcome = DecisionOutcome::Recommend;
            decision.reasons.push_back("confidence " + confidence + " below execute threshold " +
                                       format_fixed(settings.execute_confidence_threshold));
        } else if (settings.require_multiple_confirmations && approved.size() < 2) {
            decision.outcome = DecisionOutcome::Recommend;
            decision.reasons.push_back("multiple confirmations required, got " +
                                       std::to_string(approved.size()));
        } else if (!try_reserve_slot(settings.max_concurrent_actions)) {
            decision.outcome = DecisionOutcome::Recommend;
            decision.reasons.push_back("execution capacity reached (" +
                                       std::to_string(settings.max_concurrent_actions) +
                                       " in flight)");
        } else {
            decision.outcome = DecisionOutcome::Execute;
            decision.reasons.push_back("confidence " + confidence + " meets execute threshold " +
                                       format_fixed(settings.execute_confidence_threshold));
        }
    }

    // Side effects of Execute; the slot reserved above is released here
    if (decision.outcome == DecisionOutcome::Execute) {
        if (action.has_value() && action->operation) {
            auto final_decision = execute(decision, *action, context);
            record_cycle(final_decision, started, evaluator_failures);
            return final_decision;
        }
        release_slot();
        decision.reasons.push_back("no execution action registered");
    }

    record_cycle(decision, started, evaluator_failures);
    return decision;
}

std::vector<DecisionOrchestrator::EvaluationResult> DecisionOrchestrator::run_evaluators(
    const std::vector<Registered>& evaluators, const EvaluationContext& context)
{
    std::vector<EvaluationResult> results;
    results.reserve(evaluators.size());

    const auto& timeout = config_.decision.evaluator_timeout;
    bool parallel = config_.decision.parallel_evaluation;

    if (!parallel && !timeout.has_value()) {
        for (const auto& entry : evaluators) {
            results.push_back(capture(entry.name, [&] {
                return entry.evaluator->evaluate(context);
            }));
        }
        return results;
    }

    // Each evaluation runs on its own detached thread with a private copy of
    // the context, so one that overruns its timeout can finish after the
    // cycle has moved on. While an abandoned evaluation is still running the
    // evaluator is not started again, which bounds the stranded threads to
    // one per evaluator.
    auto shared_context = std::make_shared<const EvaluationContext>(context);

    struct Launched {
        std::future<Verdict> future;   // invalid when not started
        std::shared_ptr<std::atomic<int>> state;
        Timestamp at;
    };

    auto launch = [&](const Registered& entry) {
        if (entry.stranded->load() > 0) {
            return Launched{std::future<Verdict>{}, nullptr, Clock::now()};
        }
        auto evaluator = entry.evaluator;
        auto stranded = entry.stranded;
        auto state = std::make_shared<std::atomic<int>>(kTaskRunning);
        auto task = std::make_shared<std::packaged_task<Verdict()>>(
            [evaluator, stranded, state, shared_context] {
                // Runs before the result is published
                struct Finish {
                    std::atomic<std::size_t>& stranded;
                    std::atomic<int>& state;
                    ~Finish() {
                        if (state.exchange(kTaskFinished) == kTaskAbandoned) {
                            stranded.fetch_sub(1);
                        }
                    }
                } finish{*stranded, *state};
                return evaluator->evaluate(*shared_context);
            });
        auto future = task->get_future();
        try {
            std::thread([task] { (*task)(); }).detach();
        } catch (const std::system_error&) {
            (*task)();
        }
        return Launched{std::move(future), std::move(state), Clock::now()};
    };

    auto timed_out = [&](const Registered& entry, const std::string& error) {
        auto result = failure(entry.name, error);
        result.timed_out = true;
        result.verdict.reason = "evaluator timeout: " + entry.name;
        return result;
    };

    auto collect = [&](const Registered& entry, Launched& launched) {
        if (!launched.future.valid()) {
            return timed_out(entry, "previous evaluation still running");
        }
        if (timeout.has_value() &&
            launched.future.wait_until(launched.at + *timeout) != std::future_status::ready) {
            entry.stranded->fetch_add(1);
            int expected = kTaskRunning;
            if (!launched.state->compare_exchange_strong(expected, kTaskAbandoned)) {
                entry.stranded->fetch_sub(1);   // finished meanwhile
            }
            return timed_out(entry, "timed out after " +
                             format_fixed(to_seconds(*timeout).count() * 1000.0, 0) + "ms");
        }
        return capture(entry.name, [&] { return launched.future.get(); });
    };

    if (parallel) {
        std::vector<Launched> pending;
        pending.reserve(evaluators.size());
        for (const auto& entry : evaluators) {
            pending.push_back(launch(entry));
        }
        for (std::size_t i = 0; i < evaluators.size(); ++i) {
            results.push_back(collect(evaluators[i], pending[i]));
        }
    } else {
        for (const auto& entry : evaluators) {
            auto launched = launch(entry);
            results.push_back(collect(entry, launched));
        }
    }
    return results;
}

DecisionOrchestrator::EvaluationResult DecisionOrchestrator::capture(
    const std::string& name, const std::function<Verdict()>& evaluate)
{
    try {
        EvaluationResult result;
        result.verdict = normalize(evaluate(), name);
        return result;
    } catch (const EvaluatorFailureException& e) {
        return failure(name, e.cause());
    } catch (const std::exception& e) {
        return failure(name, e.what());
    } catch (...) {
        return failure(name, "unknown error");
    }
}

DecisionOrchestrator::EvaluationResult DecisionOrchestrator::failure(
    const std::string& name, const std::string& error)
{
    EvaluationResult result;
    result.verdict = Verdict::veto(name, "evaluator failure: " + name);
    result.failed = true;
    result.error = error;
    return result;
}

Verdict DecisionOrchestrator::normalize(Verdict verdict, const std::string& name) {
    verdict.name = name;
    if (std::isnan(verdict.confidence)) {
        verdict.confidence = 0.0;
    }
    verdict.confidence = std::clamp(verdict.confidence, 0.0, 1.0);
    return verdict;
}

bool DecisionOrchestrator::try_reserve_slot(std::size_t max_concurrent) {
    auto current = in_flight_.load();
    while (current < max_concurrent) {
        if (in_flight_.compare_exchange_weak(current, current + 1)) {
            return true;
        }
    }
    return false;
}

void DecisionOrchestrator::release_slot() {
    in_flight_.fetch_sub(1);
}

FinalDecision DecisionOrchestrator::execute(const FinalDecision& decision,
                                            const ExecutionAction& action,
                                            const EvaluationContext& context) {
    Result<std::string> result = [&]() -> Result<std::string> {
        try {
            return caller_.try_invoke(action.dependency, action.weight, [&] {
                return action.operation(context, decision.settings);
            });
        } catch (const InvalidRequestException& e) {
            return Error{ErrorKind::OperationFailed, e.what(), action.dependency, std::nullopt};
        }
    }();
    release_slot();

    if (result.ok()) {
        if (action.cache_key.has_value()) {
            cache().set(*action.cache_key, result.value(), action.cache_ttl);
        }
        health_.report_module_result(action.dependency, true);

        FinalDecision executed = decision;
        executed.execution_result = result.value();
        executed.reasons.push_back("executed via " + action.dependency);
        emit_event(EventType::ExecutionSucceeded, "Executed via " + action.dependency,
                   decision.id, action.dependency, DecisionOutcome::Execute);
        return executed;
    }

    const Error& error = result.error();
    // Waiting on our own rate limit says nothing about the dependency
    if (error.kind != ErrorKind::RateLimitExceeded) {
        health_.report_module_result(action.dependency, false, error.message);
    }

    FinalDecision superseded = decision;
    superseded.outcome = DecisionOutcome::Reject;
    superseded.superseded_outcome = DecisionOutcome::Execute;
    superseded.execution_error = error;
    superseded.reasons.push_back(std::string("execution failed (") + to_string(error.kind) +
                                 "): " + error.message);

    emit_event(EventType::ExecutionFailed, error.message, decision.id, action.dependency);
    emit_event(EventType::DecisionSuperseded, "Execute converted to Reject",
               decision.id, action.dependency, DecisionOutcome::Reject);
    return superseded;
}

void DecisionOrchestrator::record_cycle(const FinalDecision& decision, Timestamp started,
                                        std::size_t evaluator_failures) {
    double elapsed_us =
        std::chrono::duration<double, std::micro>(Clock::now() - started).count();

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_cycles++;
        switch (decision.outcome) {
            case DecisionOutcome::Execute:   stats_.executed++; break;
            case DecisionOutcome::Recommend: stats_.recommended++; break;
            case DecisionOutcome::Reject:    stats_.rejected++; break;
            case DecisionOutcome::Paused:    stats_.paused++; break;
        }
        stats_.vetoes += decision.veto_count;
        stats_.evaluator_failures += evaluator_failures;
        if (decision.superseded_outcome.has_value()) {
            stats_.superseded_executions++;
            stats_.execution_failures++;
        }
        cycle_time_sum_us_ += elapsed_us;
        stats_.average_cycle_us = cycle_time_sum_us_ / static_cast<double>(stats_.total_cycles);
    }

    MonitorEvent event;
    event.type = decision.outcome == DecisionOutcome::Paused ? EventType::DecisionPaused
                                                             : EventType::DecisionMade;
    event.message = join(decision.reasons, "; ");
    event.decision_id = decision.id;
    event.outcome = decision.outcome;
    event.duration_us = elapsed_us;
    if (decision.safe_mode) {
        event.system_health = health_.system_health();
    }
    emit(monitor(), std::move(event));
}

// ==================== Controls ====================

void DecisionOrchestrator::set_execution_action(ExecutionAction action) {
    std::unique_lock lock(registry_mutex_);
    action_ = std::move(action);
}

void DecisionOrchestrator::clear_execution_action() {
    std::unique_lock lock(registry_mutex_);
    action_.reset();
}

void DecisionOrchestrator::set_mode(ExecutionMode mode) {
    mode_.store(mode);
}

ExecutionMode DecisionOrchestrator::mode() const noexcept {
    return mode_.load();
}

void DecisionOrchestrator::set_paused(bool paused) {
    if (paused_.exchange(paused) == paused) return;
    emit_event(EventType::PauseChanged, paused ? "Decisions paused" : "Decisions resumed");
}

bool DecisionOrchestrator::is_paused() const noexcept {
    return paused_.load();
}

void DecisionOrchestrator::set_confidence_policy(std::unique_ptr<ConfidencePolicy> policy) {
    if (!policy) {
        throw ConfigurationException("decision.confidence_policy", "policy must not be null");
    }
    std::unique_lock lock(registry_mutex_);
    policy_ = std::move(policy);
}

// ==================== Components ====================

CircuitBreakerRegistry& DecisionOrchestrator::breakers() noexcept { return breakers_; }
RateLimiter& DecisionOrchestrator::rate_limiter() noexcept { return rate_limiter_; }
CacheManager& DecisionOrchestrator::caches() noexcept { return caches_; }
Cache& DecisionOrchestrator::cache() { return caches_.get_cache(kDefaultCache); }
HealthMonitor& DecisionOrchestrator::health() noexcept { return health_; }
ProtectedCaller& DecisionOrchestrator::caller() noexcept { return caller_; }

// ==================== Queries ====================

OrchestratorStats DecisionOrchestrator::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

SystemSnapshot DecisionOrchestrator::get_snapshot() const {
    SystemSnapshot snapshot;
    snapshot.timestamp = Clock::now();
    snapshot.mode = mode_.load();
    snapshot.paused = paused_.load();
    snapshot.executions_in_flight = in_flight_.load();
    snapshot.breakers = breakers_.get_all_status();
    snapshot.rate_limiter = rate_limiter_.get_status();
    snapshot.caches = caches_.get_all_stats();
    snapshot.health = health_.get_status();
    return snapshot;
}

std::size_t DecisionOrchestrator::executions_in_flight() const noexcept {
    return in_flight_.load();
}

const Config& DecisionOrchestrator::config() const noexcept {
    return config_;
}

// ==================== Monitoring ====================

void DecisionOrchestrator::set_monitor(std::shared_ptr<Monitor> monitor) {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_ = monitor;
    }
    breakers_.set_monitor(monitor);
    rate_limiter_.set_monitor(monitor);
    caches_.set_monitor(monitor);
    health_.set_monitor(monitor);
}

std::shared_ptr<Monitor> DecisionOrchestrator::monitor() const {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    return monitor_;
}

void DecisionOrchestrator::emit_event(EventType type, const std::string& message,
                                      std::optional<DecisionId> decision_id,
                                      std::optional<std::string> component,
                                      std::optional<DecisionOutcome> outcome) {
    MonitorEvent event;
    event.type = type;
    event.message = message;
    event.decision_id = decision_id;
    event.component = std::move(component);
    event.outcome = outcome;
    emit(monitor(), std::move(event));
}

void DecisionOrchestrator::start() {
    if (running_.exchange(true)) return;  // Already running
    maintenance_thread_ = std::thread([this] { maintenance_loop(); });
}

void DecisionOrchestrator::stop() {
    if (!running_.exchange(false)) return;  // Already stopped
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
}

bool DecisionOrchestrator::is_running() const noexcept {
    return running_.load();
}

void DecisionOrchestrator::maintenance_loop() {
    auto interval = std::min(config_.maintenance_interval, config_.snapshot_interval);
    auto last_snapshot = Clock::now();

    while (running_.load()) {
        caches_.cleanup_all_expired();

        auto now = Clock::now();
        if (now - last_snapshot >= config_.snapshot_interval) {
            if (auto m = monitor()) {
                emit(m, get_snapshot());
            }
            last_snapshot = now;
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, interval, [this] { return !running_.load(); });
    }
}

} // namespace decisiongate
