// 03_safe_mode.cpp
//
// An auto-trading loop whose pattern-recognition evaluator loses its data
// feed.  After repeated failures the health monitor drops below the
// normal-mode minimum and the orchestrator switches to the conservative
// fallback settings: higher execute threshold, smaller position size and
// multiple confirmations.  When the feed comes back the system recovers.
//
// This example also runs the background maintenance thread, which sweeps
// expired cache entries and emits periodic snapshots.

#include <decisiongate/decisiongate.hpp>

#include <atomic>
#include <iostream>
#include <thread>

using namespace decisiongate;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== DecisionGate: Safe Mode Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Configuration
    // ----------------------------------------------------------------
    Config config;
    config.decision.mode = ExecutionMode::Auto;
    config.decision.normal.execute_confidence_threshold = 0.8;
    config.decision.normal.position_size = 0.05;
    config.health.failure_threshold = 2;
    config.cache.default_ttl = 200ms;
    config.maintenance_interval = 50ms;
    config.snapshot_interval = 400ms;

    DecisionOrchestrator orchestrator(config);
    orchestrator.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 2. Evaluators.  "patterns" depends on a feed we can break.
    // ----------------------------------------------------------------
    std::atomic<bool> feed_down{false};

    orchestrator.register_evaluator(std::make_shared<FunctionEvaluator>(
        "technical", EvaluationPhase::Analysis,
        [](const EvaluationContext&) { return Verdict::approve("technical", 0.96); }));

    orchestrator.register_evaluator(std::make_shared<FunctionEvaluator>(
        "patterns", EvaluationPhase::Analysis,
        [&feed_down](const EvaluationContext&) {
            if (feed_down.load()) {
                throw EvaluatorFailureException("patterns", "pattern feed unavailable");
            }
            return Verdict::approve("patterns", 0.97);
        }));

    // ----------------------------------------------------------------
    // 3. Execution goes through the protected path; results are cached.
    // ----------------------------------------------------------------
    ExecutionAction action;
    action.dependency = "exchange";
    action.weight = 1;
    action.cache_key = "last_fill";
    action.operation = [](const EvaluationContext& ctx, const OperatingSettings& settings) {
        return ctx.subject + " filled size=" + std::to_string(settings.position_size);
    };
    orchestrator.set_execution_action(action);

    orchestrator.start();

    EvaluationContext ctx;
    ctx.subject = "ETHUSDT";
    ctx.direction = "LONG";

    auto run_cycle = [&](const char* label) {
        auto decision = orchestrator.decide(ctx);
        std::cout << label << " -> " << to_string(decision.outcome)
                  << (decision.safe_mode ? " [SAFE MODE]" : "")
                  << " threshold=" << decision.settings.execute_confidence_threshold
                  << " size=" << decision.settings.position_size;
        if (decision.execution_result.has_value()) {
            std::cout << " result=\"" << *decision.execution_result << "\"";
        }
        std::cout << "\n";
    };

    // ----------------------------------------------------------------
    // 4. Healthy, then the feed breaks, then it recovers
    // ----------------------------------------------------------------
    run_cycle("healthy       ");

    feed_down = true;
    for (int i = 0; i < 3; ++i) {
        run_cycle("feed down     ");
    }

    std::cout << "System health: " << orchestrator.health().system_health() << "%\n";
    for (const auto& module : orchestrator.health().unhealthy_modules()) {
        std::cout << "  unhealthy: " << module << "\n";
    }

    feed_down = false;
    run_cycle("feed restored ");
    run_cycle("recovered     ");

    // ----------------------------------------------------------------
    // 5. Let maintenance expire the cached fill and emit a snapshot
    // ----------------------------------------------------------------
    std::cout << "Cached fill present: " << orchestrator.cache().size() << "\n";
    std::this_thread::sleep_for(500ms);
    std::cout << "Cached fill after TTL: " << orchestrator.cache().size() << "\n";

    orchestrator.stop();

    auto stats = orchestrator.get_stats();
    std::cout << "\n=== Stats ===\n";
    std::cout << "Cycles:             " << stats.total_cycles << "\n";
    std::cout << "Executed:           " << stats.executed << "\n";
    std::cout << "Rejected:           " << stats.rejected << "\n";
    std::cout << "Evaluator failures: " << stats.evaluator_failures << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
