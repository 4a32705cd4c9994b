#include <gtest/gtest.h>
#include <decisiongate/decisiongate.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace decisiongate;
using namespace std::chrono_literals;

namespace {

// ===========================================================================
// Test Monitor that records all events for verification
// ===========================================================================

class TestMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(event);
    }

    void on_snapshot(const SystemSnapshot&) override {}

    std::vector<MonitorEvent> get_events_of_type(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<MonitorEvent> filtered;
        for (const auto& e : events) {
            if (e.type == type) {
                filtered.push_back(e);
            }
        }
        return filtered;
    }

private:
    std::mutex mutex_;
    std::vector<MonitorEvent> events;
};

// Throws while broken is set
std::shared_ptr<Evaluator> flaky(const std::string& name, std::atomic<bool>& broken) {
    return std::make_shared<FunctionEvaluator>(name, EvaluationPhase::Analysis,
        [name, &broken](const EvaluationContext&) {
            if (broken.load()) {
                throw EvaluatorFailureException(name, "upstream feed down");
            }
            return Verdict::approve(name, 0.97);
        });
}

std::shared_ptr<Evaluator> steady(const std::string& name, double confidence) {
    return std::make_shared<FunctionEvaluator>(name, EvaluationPhase::Analysis,
        [name, confidence](const EvaluationContext&) {
            return Verdict::approve(name, confidence);
        });
}

bool contains_reason(const FinalDecision& decision, const std::string& needle) {
    for (const auto& reason : decision.reasons) {
        if (reason.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

// ===========================================================================
// Fixture
// ===========================================================================

class SafeModeTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.decision.mode = ExecutionMode::Auto;
        monitor_ = std::make_shared<TestMonitor>();
    }

    std::unique_ptr<DecisionOrchestrator> make() {
        auto orch = std::make_unique<DecisionOrchestrator>(config_);
        orch->set_monitor(monitor_);
        return orch;
    }

    Config config_;
    std::shared_ptr<TestMonitor> monitor_;
    EvaluationContext ctx_;
};

TEST_F(SafeModeTest, RepeatedEvaluatorFailuresActivateSafeMode) {
    auto orch = make();
    std::atomic<bool> broken{true};
    orch->register_evaluator(steady("technical", 0.9));
    orch->register_evaluator(flaky("patterns", broken));
    orch->register_evaluator(flaky("history", broken));

    for (int i = 0; i < 3; ++i) {
        auto decision = orch->decide(ctx_);
        EXPECT_FALSE(decision.safe_mode);
        EXPECT_EQ(decision.outcome, DecisionOutcome::Reject);
    }

    // 1 of 3 modules healthy
    EXPECT_NEAR(orch->health().system_health(), 100.0 / 3.0, 1e-9);
    EXPECT_TRUE(orch->health().should_activate_safe_mode());

    auto decision = orch->decide(ctx_);
    EXPECT_TRUE(decision.safe_mode);
    EXPECT_DOUBLE_EQ(decision.settings.execute_confidence_threshold, 0.95);
    EXPECT_TRUE(decision.settings.conservative_only);
    EXPECT_TRUE(contains_reason(decision, "safe mode active"));

    auto activated = monitor_->get_events_of_type(EventType::SafeModeActivated);
    ASSERT_EQ(activated.size(), 1u);
    ASSERT_TRUE(activated[0].system_health.has_value());
    EXPECT_LT(*activated[0].system_health, 50.0);
}

TEST_F(SafeModeTest, RecoveredEvaluatorsRestoreNormalSettings) {
    auto orch = make();
    std::atomic<bool> broken{true};
    orch->register_evaluator(steady("technical", 0.9));
    orch->register_evaluator(flaky("patterns", broken));
    orch->register_evaluator(flaky("history", broken));

    for (int i = 0; i < 3; ++i) {
        orch->decide(ctx_);
    }
    ASSERT_TRUE(orch->health().should_activate_safe_mode());

    broken = false;
    // Safe mode is fixed at the start of the cycle; its reports clear it
    auto recovering = orch->decide(ctx_);
    EXPECT_TRUE(recovering.safe_mode);
    EXPECT_FALSE(orch->health().should_activate_safe_mode());

    auto normal = orch->decide(ctx_);
    EXPECT_FALSE(normal.safe_mode);
    EXPECT_DOUBLE_EQ(normal.settings.execute_confidence_threshold, 0.8);
    EXPECT_EQ(normal.outcome, DecisionOutcome::Execute);
    EXPECT_EQ(monitor_->get_events_of_type(EventType::ModuleRecovered).size(), 2u);
    EXPECT_EQ(monitor_->get_events_of_type(EventType::SafeModeDeactivated).size(), 1u);
}

TEST_F(SafeModeTest, FallbackSettingsReachTheExecutionAction) {
    auto orch = make();
    orch->register_evaluator(steady("technical", 0.97));
    orch->register_evaluator(steady("patterns", 0.97));

    double seen_size = -1.0;
    ExecutionAction action;
    action.dependency = "exchange";
    action.operation = [&](const EvaluationContext&, const OperatingSettings& settings) {
        seen_size = settings.position_size;
        return std::string("filled");
    };
    orch->set_execution_action(action);

    for (int i = 0; i < 3; ++i) {
        orch->health().report_module_result("market_data", false, "stale quotes");
    }
    ASSERT_TRUE(orch->health().should_activate_safe_mode());

    auto decision = orch->decide(ctx_);
    EXPECT_TRUE(decision.safe_mode);
    EXPECT_EQ(decision.outcome, DecisionOutcome::Execute);
    EXPECT_DOUBLE_EQ(seen_size, 0.001);
}

TEST_F(SafeModeTest, FallbackRequiresMultipleConfirmations) {
    auto orch = make();
    orch->register_evaluator(steady("technical", 0.99));

    for (int i = 0; i < 3; ++i) {
        orch->health().report_module_result("market_data", false);
    }

    auto decision = orch->decide(ctx_);
    EXPECT_TRUE(decision.safe_mode);
    EXPECT_EQ(decision.outcome, DecisionOutcome::Recommend);
    EXPECT_TRUE(contains_reason(decision, "multiple confirmations required"));
}

TEST_F(SafeModeTest, FallbackThresholdDowngradesToRecommend) {
    auto orch = make();
    orch->register_evaluator(steady("technical", 0.9));
    orch->register_evaluator(steady("patterns", 0.9));

    for (int i = 0; i < 3; ++i) {
        orch->health().report_module_result("market_data", false);
    }

    // 0.9 would execute under the normal 0.8 threshold
    auto decision = orch->decide(ctx_);
    EXPECT_TRUE(decision.safe_mode);
    EXPECT_EQ(decision.outcome, DecisionOutcome::Recommend);
}

TEST_F(SafeModeTest, PauseInSafeModeRunsEvaluatorsAsHealthChecksOnly) {
    config_.health.pause_in_safe_mode = true;
    auto orch = make();

    std::atomic<int> calls{0};
    orch->register_evaluator(std::make_shared<FunctionEvaluator>(
        "technical", EvaluationPhase::Analysis,
        [&calls](const EvaluationContext&) {
            calls.fetch_add(1);
            return Verdict::approve("technical", 0.9);
        }));

    for (int i = 0; i < 3; ++i) {
        orch->health().report_module_result("market_data", false);
    }

    auto decision = orch->decide(ctx_);
    EXPECT_EQ(decision.outcome, DecisionOutcome::Paused);
    EXPECT_TRUE(decision.safe_mode);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_TRUE(decision.verdicts.empty());
    EXPECT_EQ(decision.veto_count, 0u);
    EXPECT_TRUE(contains_reason(decision, "paused while in safe mode"));
    EXPECT_TRUE(contains_reason(decision, "health checks only (0 failed)"));
    EXPECT_EQ(orch->health().get_module("technical")->total_reports, 1u);

    auto paused = monitor_->get_events_of_type(EventType::DecisionPaused);
    ASSERT_EQ(paused.size(), 1u);
    EXPECT_TRUE(paused[0].system_health.has_value());
    EXPECT_EQ(orch->get_stats().paused, 1u);
}

TEST_F(SafeModeTest, PausedSafeModeRecoversWhenEvaluatorRecovers) {
    config_.health.pause_in_safe_mode = true;
    auto orch = make();

    // Fails its first three evaluations, then approves
    std::atomic<int> calls{0};
    orch->register_evaluator(std::make_shared<FunctionEvaluator>(
        "technical", EvaluationPhase::Analysis,
        [&calls](const EvaluationContext&) {
            if (calls.fetch_add(1) < 3) {
                throw std::runtime_error("indicator feed down");
            }
            return Verdict::approve("technical", 0.9);
        }));

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(orch->decide(ctx_).outcome, DecisionOutcome::Reject);
    }
    ASSERT_TRUE(orch->health().should_activate_safe_mode());

    // Paused cycle: the evaluator recovers while its verdict is discarded
    auto paused = orch->decide(ctx_);
    EXPECT_EQ(paused.outcome, DecisionOutcome::Paused);
    EXPECT_EQ(calls.load(), 4);
    EXPECT_FALSE(orch->health().should_activate_safe_mode());
    EXPECT_DOUBLE_EQ(orch->health().system_health(), 100.0);

    auto resumed = orch->decide(ctx_);
    EXPECT_NE(resumed.outcome, DecisionOutcome::Paused);
    EXPECT_FALSE(resumed.safe_mode);
    EXPECT_EQ(resumed.verdicts.size(), 1u);
    EXPECT_EQ(monitor_->get_events_of_type(EventType::SafeModeDeactivated).size(), 1u);
}

TEST_F(SafeModeTest, MetricsMonitorCountsActivations) {
    auto orch = make();
    auto metrics = std::make_shared<MetricsMonitor>();
    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(monitor_);
    composite->add_monitor(metrics);
    orch->set_monitor(composite);

    for (int i = 0; i < 3; ++i) {
        orch->health().report_module_result("market_data", false);
    }
    orch->health().report_module_result("market_data", true);
    for (int i = 0; i < 3; ++i) {
        orch->health().report_module_result("market_data", false);
    }

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.safe_mode_activations, 2u);
    EXPECT_DOUBLE_EQ(m.last_system_health, 0.0);
}
