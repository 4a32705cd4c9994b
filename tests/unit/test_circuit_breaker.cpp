#include <gtest/gtest.h>
#include <decisiongate/decisiongate.hpp>

#include <mutex>
#include <stdexcept>
#include <thread>
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

// Monitor whose sink is unavailable: every callback throws
class FailingMonitor : public Monitor {
public:
    void on_event(const MonitorEvent&) override {
        throw std::runtime_error("sink down");
    }
    void on_snapshot(const SystemSnapshot&) override {
        throw std::runtime_error("sink down");
    }
};

} // namespace

// ===========================================================================
// Fixture
// ===========================================================================

class CircuitBreakerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.failure_threshold = 3;
        config_.success_threshold = 2;
        config_.open_timeout = 50ms;
        config_.half_open_max_probes = 2;
        monitor_ = std::make_shared<TestMonitor>();
    }

    std::unique_ptr<CircuitBreaker> make_breaker() {
        auto breaker = std::make_unique<CircuitBreaker>("venue", config_);
        breaker->set_monitor(monitor_);
        return breaker;
    }

    static void fail(CircuitBreaker& breaker) {
        EXPECT_THROW(breaker.call([]() -> int { throw std::runtime_error("venue down"); }),
                     std::runtime_error);
    }

    CircuitBreakerConfig config_;
    std::shared_ptr<TestMonitor> monitor_;
};

// ===========================================================================
// Closed
// ===========================================================================

TEST_F(CircuitBreakerTest, StartsClosedAndPassesResults) {
    auto breaker = make_breaker();
    EXPECT_EQ(breaker->state(), CircuitState::Closed);
    EXPECT_TRUE(breaker->can_proceed());
    EXPECT_EQ(breaker->call([] { return 7; }), 7);

    bool ran = false;
    breaker->call([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST_F(CircuitBreakerTest, RethrowsOriginalException) {
    auto breaker = make_breaker();
    try {
        breaker->call([]() -> int { throw std::logic_error("bad payload"); });
        FAIL() << "Expected std::logic_error";
    } catch (const std::logic_error& e) {
        EXPECT_STREQ(e.what(), "bad payload");
    }
    auto status = breaker->get_status();
    EXPECT_EQ(status.total_failures, 1u);
    ASSERT_EQ(status.recent_errors.size(), 1u);
    EXPECT_EQ(status.recent_errors[0].message, "bad payload");
}

TEST_F(CircuitBreakerTest, SuccessResetsConsecutiveFailures) {
    auto breaker = make_breaker();
    fail(*breaker);
    fail(*breaker);
    breaker->call([] { return 1; });
    fail(*breaker);
    fail(*breaker);

    EXPECT_EQ(breaker->state(), CircuitState::Closed);
    EXPECT_EQ(breaker->get_status().consecutive_failures, 2u);
}

// ===========================================================================
// Open
// ===========================================================================

TEST_F(CircuitBreakerTest, OpensAfterThresholdAndRejectsWithoutInvoking) {
    auto breaker = make_breaker();
    for (int i = 0; i < 3; ++i) {
        fail(*breaker);
    }
    EXPECT_EQ(breaker->state(), CircuitState::Open);

    bool invoked = false;
    try {
        breaker->call([&] { invoked = true; return 0; });
        FAIL() << "Expected CircuitOpenException";
    } catch (const CircuitOpenException& e) {
        EXPECT_EQ(e.dependency(), "venue");
        EXPECT_GT(e.retry_after().count(), 0.0);
        EXPECT_LE(e.retry_after().count(), 0.05);
    }
    EXPECT_FALSE(invoked);

    auto status = breaker->get_status();
    EXPECT_EQ(status.rejected_calls, 1u);
    EXPECT_FALSE(status.can_proceed);
    EXPECT_TRUE(status.last_failure.has_value());
    EXPECT_EQ(monitor_->get_events_of_type(EventType::CircuitOpened).size(), 1u);
    EXPECT_EQ(monitor_->get_events_of_type(EventType::CallRejected).size(), 1u);
}

TEST_F(CircuitBreakerTest, MovesToHalfOpenLazilyAfterTimeout) {
    auto breaker = make_breaker();
    for (int i = 0; i < 3; ++i) {
        fail(*breaker);
    }
    std::this_thread::sleep_for(70ms);

    // No timer: still reported Open until someone tries
    EXPECT_EQ(breaker->state(), CircuitState::Open);
    EXPECT_TRUE(breaker->can_proceed());

    EXPECT_EQ(breaker->call([] { return 1; }), 1);
    EXPECT_EQ(breaker->state(), CircuitState::HalfOpen);
    EXPECT_EQ(monitor_->get_events_of_type(EventType::CircuitHalfOpened).size(), 1u);
}

// ===========================================================================
// HalfOpen
// ===========================================================================

TEST_F(CircuitBreakerTest, HalfOpenClosesAfterSuccessThreshold) {
    auto breaker = make_breaker();
    for (int i = 0; i < 3; ++i) {
        fail(*breaker);
    }
    std::this_thread::sleep_for(70ms);

    breaker->call([] { return 1; });
    breaker->call([] { return 2; });

    EXPECT_EQ(breaker->state(), CircuitState::Closed);
    auto status = breaker->get_status();
    EXPECT_EQ(status.consecutive_failures, 0u);
    EXPECT_EQ(status.consecutive_successes, 0u);
    // Closed -> Open -> HalfOpen -> Closed
    EXPECT_EQ(status.state_changes, 3u);
    EXPECT_EQ(monitor_->get_events_of_type(EventType::CircuitClosed).size(), 1u);
}

TEST_F(CircuitBreakerTest, HalfOpenFailureReopens) {
    auto breaker = make_breaker();
    for (int i = 0; i < 3; ++i) {
        fail(*breaker);
    }
    std::this_thread::sleep_for(70ms);

    fail(*breaker);
    EXPECT_EQ(breaker->state(), CircuitState::Open);

    // The timeout clock restarted
    EXPECT_THROW(breaker->call([] { return 1; }), CircuitOpenException);
    EXPECT_EQ(monitor_->get_events_of_type(EventType::CircuitOpened).size(), 2u);
}

TEST_F(CircuitBreakerTest, HalfOpenAdmitsLimitedProbes) {
    auto breaker = make_breaker();
    for (int i = 0; i < 3; ++i) {
        fail(*breaker);
    }
    std::this_thread::sleep_for(70ms);

    // Manual control: admit probes without completing them
    breaker->before_call();
    breaker->before_call();
    EXPECT_EQ(breaker->state(), CircuitState::HalfOpen);

    try {
        breaker->before_call();
        FAIL() << "Expected CircuitOpenException";
    } catch (const CircuitOpenException& e) {
        EXPECT_DOUBLE_EQ(e.retry_after().count(), 0.0);
    }

    breaker->record_success();
    breaker->record_success();
    EXPECT_EQ(breaker->state(), CircuitState::Closed);
}

TEST_F(CircuitBreakerTest, LateSuccessFromClosedIsNotAProbe) {
    auto breaker = make_breaker();
    auto slow_call = breaker->before_call();   // admitted while Closed

    for (int i = 0; i < 3; ++i) {
        fail(*breaker);
    }
    std::this_thread::sleep_for(70ms);

    auto probe = breaker->before_call();
    EXPECT_NE(probe, slow_call);
    ASSERT_EQ(breaker->state(), CircuitState::HalfOpen);

    breaker->record_success(slow_call);
    EXPECT_EQ(breaker->state(), CircuitState::HalfOpen);
    EXPECT_EQ(breaker->get_status().consecutive_successes, 0u);
    EXPECT_EQ(breaker->get_status().total_successes, 1u);

    breaker->record_success(probe);
    EXPECT_EQ(breaker->state(), CircuitState::HalfOpen);

    auto second_probe = breaker->before_call();
    breaker->record_success(second_probe);
    EXPECT_EQ(breaker->state(), CircuitState::Closed);
}

TEST_F(CircuitBreakerTest, LateFailureFromClosedDoesNotReopen) {
    auto breaker = make_breaker();
    auto slow_call = breaker->before_call();

    for (int i = 0; i < 3; ++i) {
        fail(*breaker);
    }
    std::this_thread::sleep_for(70ms);
    breaker->before_call();
    ASSERT_EQ(breaker->state(), CircuitState::HalfOpen);

    breaker->record_failure("late timeout", slow_call);
    EXPECT_EQ(breaker->state(), CircuitState::HalfOpen);
    EXPECT_EQ(breaker->get_status().total_failures, 4u);
    EXPECT_EQ(monitor_->get_events_of_type(EventType::CircuitOpened).size(), 1u);
}

// ===========================================================================
// Monitor failures
// ===========================================================================

TEST_F(CircuitBreakerTest, ThrowingMonitorDoesNotChangeOutcome) {
    config_.failure_threshold = 1;
    CircuitBreaker breaker("venue", config_);
    breaker.set_monitor(std::make_shared<FailingMonitor>());

    int invoked = 0;
    EXPECT_EQ(breaker.call([&] { invoked++; return 42; }), 42);
    EXPECT_EQ(invoked, 1);

    auto status = breaker.get_status();
    EXPECT_EQ(status.state, CircuitState::Closed);
    EXPECT_EQ(status.total_successes, 1u);
    EXPECT_EQ(status.total_failures, 0u);

    // The operation's own exception still reaches the caller
    try {
        breaker.call([]() -> int { throw std::logic_error("venue down"); });
        FAIL() << "Expected std::logic_error";
    } catch (const std::logic_error& e) {
        EXPECT_STREQ(e.what(), "venue down");
    }
    EXPECT_EQ(breaker.state(), CircuitState::Open);
    EXPECT_EQ(breaker.get_status().total_failures, 1u);
}

// ===========================================================================
// Status and reset
// ===========================================================================

TEST_F(CircuitBreakerTest, StatusReportsCountersAndSuccessRate) {
    auto breaker = make_breaker();
    breaker->call([] { return 1; });
    breaker->call([] { return 1; });
    breaker->call([] { return 1; });
    fail(*breaker);

    auto status = breaker->get_status();
    EXPECT_EQ(status.name, "venue");
    EXPECT_EQ(status.total_calls, 4u);
    EXPECT_EQ(status.total_successes, 3u);
    EXPECT_EQ(status.total_failures, 1u);
    EXPECT_DOUBLE_EQ(status.success_rate, 75.0);
    EXPECT_EQ(status.failure_threshold, 3u);
    EXPECT_EQ(status.success_threshold, 2u);
    EXPECT_TRUE(status.last_success.has_value());
    EXPECT_DOUBLE_EQ(status.time_until_retry.count(), 0.0);
}

TEST_F(CircuitBreakerTest, RecentErrorsAreBounded) {
    config_.failure_threshold = 100;
    config_.recent_error_capacity = 3;
    auto breaker = make_breaker();
    for (int i = 0; i < 5; ++i) {
        breaker->before_call();
        breaker->record_failure("error " + std::to_string(i));
    }

    auto status = breaker->get_status();
    ASSERT_EQ(status.recent_errors.size(), 3u);
    EXPECT_EQ(status.recent_errors.front().message, "error 2");
    EXPECT_EQ(status.recent_errors.back().message, "error 4");
}

TEST_F(CircuitBreakerTest, ResetClosesAndClearsMetrics) {
    auto breaker = make_breaker();
    for (int i = 0; i < 3; ++i) {
        fail(*breaker);
    }
    breaker->reset();

    EXPECT_EQ(breaker->state(), CircuitState::Closed);
    auto status = breaker->get_status();
    EXPECT_EQ(status.total_calls, 0u);
    EXPECT_EQ(status.total_failures, 0u);
    EXPECT_TRUE(status.recent_errors.empty());
    EXPECT_EQ(breaker->call([] { return 5; }), 5);
    EXPECT_EQ(monitor_->get_events_of_type(EventType::CircuitReset).size(), 1u);
}

TEST_F(CircuitBreakerTest, SuccessThresholdAboveProbesIsRejected) {
    config_.success_threshold = 3;
    config_.half_open_max_probes = 2;
    EXPECT_THROW(CircuitBreaker("venue", config_), ConfigurationException);
}

// ===========================================================================
// Registry
// ===========================================================================

TEST(CircuitBreakerRegistryTest, OneBreakerPerName) {
    CircuitBreakerRegistry registry;
    auto& a = registry.get("exchange");
    auto& b = registry.get("exchange");
    auto& c = registry.get("news");

    EXPECT_EQ(&a, &b);
    EXPECT_NE(&a, &c);
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"exchange", "news"}));
}

TEST(CircuitBreakerRegistryTest, ConfigAppliesOnlyOnCreation) {
    CircuitBreakerRegistry registry;
    CircuitBreakerConfig strict;
    strict.failure_threshold = 1;

    auto& breaker = registry.get("exchange", strict);
    EXPECT_EQ(breaker.config().failure_threshold, 1u);

    CircuitBreakerConfig lax;
    lax.failure_threshold = 50;
    EXPECT_EQ(registry.get("exchange", lax).config().failure_threshold, 1u);
    EXPECT_EQ(registry.get("other").config().failure_threshold, 5u);
}

TEST(CircuitBreakerRegistryTest, StatusAndResetAll) {
    CircuitBreakerConfig config;
    config.failure_threshold = 1;
    CircuitBreakerRegistry registry(config);

    auto& exchange = registry.get("exchange");
    registry.get("news");
    EXPECT_THROW(exchange.call([]() -> int { throw std::runtime_error("down"); }),
                 std::runtime_error);

    auto all = registry.get_all_status();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].name, "exchange");
    EXPECT_EQ(all[0].state, CircuitState::Open);
    EXPECT_EQ(all[1].state, CircuitState::Closed);

    registry.reset_all();
    EXPECT_EQ(exchange.state(), CircuitState::Closed);
}
