#pragma once

#include "decisiongate/types.hpp"
#include "decisiongate/config.hpp"
#include "decisiongate/cache.hpp"
#include "decisiongate/circuit_breaker.hpp"
#include "decisiongate/evaluator.hpp"
#include "decisiongate/health_monitor.hpp"
#include "decisiongate/monitor.hpp"
#include "decisiongate/policy.hpp"
#include "decisiongate/protected_caller.hpp"
#include "decisiongate/rate_limiter.hpp"
#include "decisiongate/result.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace decisiongate {

// Side effect of an Execute decision, run through the protected call path
struct ExecutionAction {
    std::string dependency;
    RequestWeight weight{1};
    std::function<std::string(const EvaluationContext&, const OperatingSettings&)> operation;

    // If set, a successful result is stored in the default cache under this key
    std::optional<std::string> cache_key;
    std::optional<Duration> cache_ttl;
};

// Outcome of one decision cycle. Never modified after decide() returns.
struct FinalDecision {
    DecisionId id{0};
    DecisionOutcome outcome{DecisionOutcome::Reject};
    ExecutionMode mode{ExecutionMode::Hybrid};
    bool safe_mode{false};
    OperatingSettings settings;   // settings in force for this cycle

    double confidence{0.0};
    std::size_t veto_count{0};
    std::vector<std::string> veto_reasons;   // "<evaluator>: <reason>"
    std::vector<Verdict> verdicts;           // evaluation order
    std::vector<std::string> reasons;        // full ordered explanation

    // Set when an Execute was converted to Reject by a failed execution
    std::optional<DecisionOutcome> superseded_outcome;
    std::optional<Error> execution_error;

    std::optional<std::string> execution_result;
    Timestamp timestamp{};
};

struct OrchestratorStats {
    std::uint64_t total_cycles{0};
    std::uint64_t executed{0};
    std::uint64_t recommended{0};
    std::uint64_t rejected{0};
    std::uint64_t paused{0};
    std::uint64_t vetoes{0};
    std::uint64_t evaluator_failures{0};
    std::uint64_t execution_failures{0};
    std::uint64_t superseded_executions{0};
    double average_cycle_us{0.0};
};

class DecisionOrchestrator {
public:
    static constexpr const char* kDefaultCache = "default";

    explicit DecisionOrchestrator(Config config = Config{});
    ~DecisionOrchestrator();

    DecisionOrchestrator(const DecisionOrchestrator&) = delete;
    DecisionOrchestrator& operator=(const DecisionOrchestrator&) = delete;

    // ==================== Evaluators ====================

    // Throws ConfigurationException for a null evaluator or a duplicate name
    void register_evaluator(std::shared_ptr<Evaluator> evaluator);
    bool unregister_evaluator(const std::string& name);

    // Names in evaluation order (phase, then registration)
    std::vector<std::string> evaluator_names() const;
    std::size_t evaluator_count() const;

    // ==================== Decision Cycle ====================

    FinalDecision decide(const EvaluationContext& context);

    // ==================== Controls ====================

    void set_execution_action(ExecutionAction action);
    void clear_execution_action();

    void set_mode(ExecutionMode mode);
    ExecutionMode mode() const noexcept;

    void set_paused(bool paused);
    bool is_paused() const noexcept;

    void set_confidence_policy(std::unique_ptr<ConfidencePolicy> policy);

    // ==================== Components ====================

    CircuitBreakerRegistry& breakers() noexcept;
    RateLimiter& rate_limiter() noexcept;
    CacheManager& caches() noexcept;
    Cache& cache();
    HealthMonitor& health() noexcept;
    ProtectedCaller& caller() noexcept;

    // ==================== Queries ====================

    OrchestratorStats get_stats() const;
    SystemSnapshot get_snapshot() const;
    std::size_t executions_in_flight() const noexcept;
    const Config& config() const noexcept;

    // ==================== Monitoring ====================

    void set_monitor(std::shared_ptr<Monitor> monitor);

    // Background maintenance: sweeps expired cache entries every
    // maintenance_interval and emits a snapshot every snapshot_interval
    void start();
    void stop();
    bool is_running() const noexcept;

private:
    struct Registered {
        std::shared_ptr<Evaluator> evaluator;
        std::string name;
        EvaluationPhase phase;
        // Timed-out evaluations still running on a worker thread
        std::shared_ptr<std::atomic<std::size_t>> stranded;
    };

    struct EvaluationResult {
        Verdict verdict;
        bool failed{false};
        bool timed_out{false};
        std::string error;
    };

    Config config_;

    // Sub-components
    CircuitBreakerRegistry breakers_;
    RateLimiter rate_limiter_;
    CacheManager caches_;
    HealthMonitor health_;
    ProtectedCaller caller_;

    // Evaluators, policy and execution action
    mutable std::shared_mutex registry_mutex_;
    std::vector<Registered> evaluators_;
    std::unique_ptr<ConfidencePolicy> policy_;
    std::optional<ExecutionAction> action_;

    std::atomic<ExecutionMode> mode_;
    std::atomic<bool> paused_{false};
    std::atomic<DecisionId> next_decision_id_{1};
    std::atomic<std::size_t> in_flight_{0};

    mutable std::mutex stats_mutex_;
    OrchestratorStats stats_;
    double cycle_time_sum_us_{0.0};

    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    // Background maintenance
    std::thread maintenance_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    // Internal helpers
    std::vector<EvaluationResult> run_evaluators(const std::vector<Registered>& evaluators,
                                                 const EvaluationContext& context);
    static EvaluationResult capture(const std::string& name,
                                    const std::function<Verdict()>& evaluate);
    static EvaluationResult failure(const std::string& name, const std::string& error);
    static Verdict normalize(Verdict verdict, const std::string& name);

    bool try_reserve_slot(std::size_t max_concurrent);
    void release_slot();

    FinalDecision execute(const FinalDecision& decision, const ExecutionAction& action,
                          const EvaluationContext& context);

    void record_cycle(const FinalDecision& decision, Timestamp started,
                      std::size_t evaluator_failures = 0);
    void maintenance_loop();
    std::shared_ptr<Monitor> monitor() const;
    void emit_event(EventType type, const std::string& message,
                    std::optional<DecisionId> decision_id = std::nullopt,
                    std::optional<std::string> component = std::nullopt,
                    std::optional<DecisionOutcome> outcome = std::nullopt);
};

} // namespace decisiongate
