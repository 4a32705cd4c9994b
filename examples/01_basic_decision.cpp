// 01_basic_decision.cpp
//
// Three evaluators look at the same market snapshot and the orchestrator
// turns their verdicts into one decision.  Any single veto rejects the
// cycle; otherwise the weighted confidence decides between Recommend and
// Execute.
//
// This example shows the basic DecisionGate setup: configuration,
// evaluator registration in phases, and reading the FinalDecision.

#include <decisiongate/decisiongate.hpp>

#include <iostream>

using namespace decisiongate;

namespace {

void print_decision(const FinalDecision& decision) {
    std::cout << "Decision #" << decision.id << ": " << to_string(decision.outcome)
              << " (confidence " << decision.confidence
              << ", vetoes " << decision.veto_count << ")\n";
    for (const auto& verdict : decision.verdicts) {
        std::cout << "  [" << verdict.name << "] "
                  << (verdict.approved ? "approve" : "veto")
                  << " conf=" << verdict.confidence;
        if (!verdict.reason.empty()) {
            std::cout << " reason=\"" << verdict.reason << "\"";
        }
        std::cout << "\n";
    }
    for (const auto& reason : decision.reasons) {
        std::cout << "  - " << reason << "\n";
    }
    std::cout << "\n";
}

EvaluationContext snapshot(double rsi, double spread_bps) {
    EvaluationContext ctx;
    ctx.subject = "BTCUSDT";
    ctx.direction = "LONG";
    ctx.signals = {{"price", 64250.0}, {"rsi", rsi}, {"spread_bps", spread_bps}};
    ctx.as_of = Clock::now();
    return ctx;
}

} // namespace

int main() {
    std::cout << "=== DecisionGate: Basic Decision Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Configuration
    // ----------------------------------------------------------------
    Config config;
    config.decision.mode = ExecutionMode::Hybrid;
    config.decision.confidence_weights = {{"technical", 0.5}, {"patterns", 0.3}, {"spread", 0.2}};

    DecisionOrchestrator orchestrator(config);
    orchestrator.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));

    // ----------------------------------------------------------------
    // 2. Register evaluators.  Phase decides the order they run in.
    // ----------------------------------------------------------------
    orchestrator.register_evaluator(std::make_shared<FunctionEvaluator>(
        "technical", EvaluationPhase::Analysis,
        [](const EvaluationContext& ctx) {
            double rsi = ctx.signal("rsi").value_or(50.0);
            if (rsi > 70.0) {
                return Verdict::veto("technical", "RSI overbought");
            }
            return Verdict::approve("technical", rsi < 30.0 ? 0.9 : 0.6);
        }));

    orchestrator.register_evaluator(std::make_shared<FunctionEvaluator>(
        "patterns", EvaluationPhase::Analysis,
        [](const EvaluationContext&) {
            return Verdict::approve("patterns", 0.75, "higher lows on 4h");
        }));

    orchestrator.register_evaluator(std::make_shared<FunctionEvaluator>(
        "spread", EvaluationPhase::Preliminary,
        [](const EvaluationContext& ctx) {
            if (ctx.signal("spread_bps").value_or(100.0) > 15.0) {
                return Verdict::veto("spread", "spread too wide");
            }
            return Verdict::approve("spread", 1.0);
        }));

    std::cout << "Evaluation order:";
    for (const auto& name : orchestrator.evaluator_names()) {
        std::cout << " " << name;
    }
    std::cout << "\n\n";

    // ----------------------------------------------------------------
    // 3. Run a few cycles
    // ----------------------------------------------------------------
    print_decision(orchestrator.decide(snapshot(27.0, 4.0)));    // oversold, tight spread
    print_decision(orchestrator.decide(snapshot(74.0, 4.0)));    // overbought: vetoed
    print_decision(orchestrator.decide(snapshot(27.0, 40.0)));   // wide spread: vetoed

    // ----------------------------------------------------------------
    // 4. Switch to Auto.  Without an execution action an Execute decision
    //    is only reported.
    // ----------------------------------------------------------------
    orchestrator.set_mode(ExecutionMode::Auto);
    print_decision(orchestrator.decide(snapshot(27.0, 4.0)));

    // ----------------------------------------------------------------
    // 5. Stats
    // ----------------------------------------------------------------
    auto stats = orchestrator.get_stats();
    std::cout << "=== Stats ===\n";
    std::cout << "Cycles:       " << stats.total_cycles << "\n";
    std::cout << "Executed:     " << stats.executed << "\n";
    std::cout << "Recommended:  " << stats.recommended << "\n";
    std::cout << "Rejected:     " << stats.rejected << "\n";
    std::cout << "Vetoes:       " << stats.vetoes << "\n";
    std::cout << "Avg cycle us: " << stats.average_cycle_us << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
