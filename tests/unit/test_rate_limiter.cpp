#include <gtest/gtest.h>
#include <decisiongate/decisiongate.hpp>

#include <mutex>
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

RateLimitConfig single_limit(double units, RateWindow window, bool weighted = false) {
    RateLimitConfig config;
    config.limits = {RateLimit::per("only", units, window, weighted)};
    config.poll_interval = 10ms;
    return config;
}

} // namespace

// ===========================================================================
// Defaults
// ===========================================================================

TEST(RateLimiterTest, DefaultLimitsMirrorVenueCeilings) {
    RateLimiter limiter;
    auto status = limiter.get_status();
    ASSERT_EQ(status.buckets.size(), 3u);

    EXPECT_EQ(status.buckets[0].name, "orders_per_second");
    EXPECT_DOUBLE_EQ(status.buckets[0].capacity, 50.0);
    EXPECT_DOUBLE_EQ(status.buckets[0].refill_rate_per_second, 50.0);
    EXPECT_FALSE(status.buckets[0].weighted);

    EXPECT_EQ(status.buckets[1].name, "weight_per_minute");
    EXPECT_DOUBLE_EQ(status.buckets[1].capacity, 1200.0);
    EXPECT_NEAR(status.buckets[1].refill_rate_per_second, 20.0, 1e-9);
    EXPECT_TRUE(status.buckets[1].weighted);

    EXPECT_EQ(status.buckets[2].name, "orders_per_day");
    EXPECT_DOUBLE_EQ(status.buckets[2].capacity, 200000.0);
}

// ===========================================================================
// try_acquire
// ===========================================================================

TEST(RateLimiterTest, TwoPerSecondAdmitsTwoThenReportsWait) {
    RateLimiter limiter(single_limit(2, RateWindow::PerSecond));

    EXPECT_TRUE(limiter.try_acquire().allowed);
    EXPECT_TRUE(limiter.try_acquire().allowed);

    auto third = limiter.try_acquire();
    EXPECT_FALSE(third.allowed);
    EXPECT_GT(third.wait.count(), 0.0);
    EXPECT_LE(third.wait.count(), 1.0);
    EXPECT_EQ(third.limit_name, "only");
}

TEST(RateLimiterTest, WaitIsMaximumAcrossBuckets) {
    RateLimitConfig config;
    config.limits = {
        RateLimit::per("fast", 1, RateWindow::PerSecond),
        RateLimit::per("slow", 1, RateWindow::PerMinute),
    };
    RateLimiter limiter(config);

    ASSERT_TRUE(limiter.try_acquire().allowed);

    auto blocked = limiter.try_acquire();
    EXPECT_FALSE(blocked.allowed);
    EXPECT_EQ(blocked.limit_name, "slow");
    EXPECT_GT(blocked.wait.count(), 1.0);
    EXPECT_LE(blocked.wait.count(), 60.0);
}

TEST(RateLimiterTest, BlockedAttemptConsumesFromNoBucket) {
    RateLimitConfig config;
    config.limits = {
        RateLimit::per("roomy", 100, RateWindow::PerMinute),
        RateLimit::per("tight", 1, RateWindow::PerMinute),
    };
    RateLimiter limiter(config);

    ASSERT_TRUE(limiter.try_acquire().allowed);
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(limiter.try_acquire().allowed);
    }

    auto status = limiter.get_status();
    // Only the admitted call was charged to the roomy bucket
    EXPECT_NEAR(status.buckets[0].available_tokens, 99.0, 0.5);
}

TEST(RateLimiterTest, WeightChargesOnlyWeightedBucket) {
    RateLimitConfig config;
    config.limits = {
        RateLimit::per("calls", 10, RateWindow::PerMinute),
        RateLimit::per("weight", 100, RateWindow::PerMinute, true),
    };
    RateLimiter limiter(config);

    ASSERT_TRUE(limiter.try_acquire(40).allowed);

    auto status = limiter.get_status();
    EXPECT_NEAR(status.buckets[0].available_tokens, 9.0, 0.5);
    EXPECT_NEAR(status.buckets[1].available_tokens, 60.0, 0.5);

    ASSERT_TRUE(limiter.try_acquire(60).allowed);
    auto blocked = limiter.try_acquire(1);
    EXPECT_FALSE(blocked.allowed);
    EXPECT_EQ(blocked.limit_name, "weight");
}

TEST(RateLimiterTest, WeightAboveCapacityIsRejectedUpFront) {
    RateLimiter limiter(single_limit(10, RateWindow::PerMinute, true));
    EXPECT_THROW(limiter.try_acquire(11), WeightExceedsCapacityException);
    EXPECT_THROW(limiter.acquire(11, 0ms), InvalidRequestException);
    EXPECT_THROW(limiter.try_acquire(0), InvalidRequestException);
}

// ===========================================================================
// acquire
// ===========================================================================

TEST(RateLimiterTest, AcquireWaitsForRefill) {
    RateLimiter limiter(single_limit(20, RateWindow::PerSecond));
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(limiter.try_acquire().allowed);
    }

    auto start = Clock::now();
    limiter.acquire(1, 2s);
    auto elapsed = Clock::now() - start;

    // One token at 20/s takes about 50ms
    EXPECT_GE(elapsed, 30ms);
    EXPECT_LT(elapsed, 1s);
    EXPECT_GT(limiter.get_status().total_wait.count(), 0.0);
}

TEST(RateLimiterTest, AcquireTimesOutWithRetryHint) {
    auto monitor = std::make_shared<TestMonitor>();
    RateLimiter limiter(single_limit(1, RateWindow::PerMinute));
    limiter.set_monitor(monitor);
    ASSERT_TRUE(limiter.try_acquire().allowed);

    try {
        limiter.acquire(1, 50ms);
        FAIL() << "Expected RateLimitExceededException";
    } catch (const RateLimitExceededException& e) {
        EXPECT_EQ(e.limit_name(), "only");
        EXPECT_GT(e.retry_after().count(), 0.0);
        EXPECT_LE(e.retry_after().count(), 60.0);
    }

    EXPECT_EQ(monitor->get_events_of_type(EventType::RateLimitTimedOut).size(), 1u);
}

TEST(RateLimiterTest, ZeroTimeoutMakesSingleAttempt) {
    RateLimiter limiter(single_limit(1, RateWindow::PerMinute));
    limiter.acquire(1, 0ms);

    auto start = Clock::now();
    EXPECT_THROW(limiter.acquire(1, 0ms), RateLimitExceededException);
    EXPECT_LT(Clock::now() - start, 50ms);
}

// ===========================================================================
// Metrics
// ===========================================================================

TEST(RateLimiterTest, MetricsAndReset) {
    auto monitor = std::make_shared<TestMonitor>();
    RateLimiter limiter(single_limit(2, RateWindow::PerMinute));
    limiter.set_monitor(monitor);

    limiter.try_acquire();
    limiter.try_acquire();
    limiter.try_acquire();
    limiter.try_acquire();

    auto status = limiter.get_status();
    EXPECT_EQ(status.total_requests, 4u);
    EXPECT_EQ(status.total_blocked, 2u);
    EXPECT_DOUBLE_EQ(status.block_rate, 50.0);
    EXPECT_NEAR(status.buckets[0].utilization, 100.0, 0.1);
    EXPECT_EQ(monitor->get_events_of_type(EventType::RequestRateLimited).size(), 2u);

    limiter.reset();
    status = limiter.get_status();
    EXPECT_EQ(status.total_requests, 0u);
    EXPECT_EQ(status.total_blocked, 0u);
    EXPECT_NEAR(status.buckets[0].available_tokens, 2.0, 1e-6);
    EXPECT_TRUE(limiter.try_acquire().allowed);
}

TEST(RateLimiterTest, InvalidConfigurationThrows) {
    RateLimitConfig duplicate;
    duplicate.limits = {
        RateLimit::per("x", 1, RateWindow::PerSecond),
        RateLimit::per("x", 2, RateWindow::PerSecond),
    };
    EXPECT_THROW(RateLimiter{duplicate}, ConfigurationException);

    RateLimitConfig two_weighted;
    two_weighted.limits = {
        RateLimit::per("a", 1, RateWindow::PerSecond, true),
        RateLimit::per("b", 1, RateWindow::PerSecond, true),
    };
    EXPECT_THROW(RateLimiter{two_weighted}, ConfigurationException);
}
