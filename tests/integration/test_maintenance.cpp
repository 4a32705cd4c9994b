#include <gtest/gtest.h>
#include <decisiongate/decisiongate.hpp>

#include <atomic>
#include <mutex>
#include <thread>

using namespace decisiongate;
using namespace std::chrono_literals;

namespace {

class SnapshotRecorder : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        if (event.type == EventType::CacheExpiredSwept) {
            swept.fetch_add(event.count.value_or(0));
        }
    }

    void on_snapshot(const SystemSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshots++;
        last = snapshot;
    }

    int snapshot_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots;
    }

    SystemSnapshot last_snapshot() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last;
    }

    std::atomic<std::size_t> swept{0};

private:
    std::mutex mutex_;
    int snapshots{0};
    SystemSnapshot last;
};

template <typename Pred>
bool wait_until(Pred pred, Duration timeout) {
    auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

// ===========================================================================
// Background maintenance thread
// ===========================================================================

TEST(MaintenanceTest, StartAndStopAreIdempotent) {
    DecisionOrchestrator orch;
    EXPECT_FALSE(orch.is_running());

    orch.start();
    orch.start();
    EXPECT_TRUE(orch.is_running());

    orch.stop();
    orch.stop();
    EXPECT_FALSE(orch.is_running());

    orch.start();
    EXPECT_TRUE(orch.is_running());
    // Destructor stops the thread
}

TEST(MaintenanceTest, SweepsExpiredCacheEntries) {
    Config config;
    config.maintenance_interval = 20ms;
    DecisionOrchestrator orch(config);
    auto recorder = std::make_shared<SnapshotRecorder>();
    orch.set_monitor(recorder);

    auto& quotes = orch.caches().get_cache("quotes");
    quotes.set("BTCUSDT", "64000", 10ms);
    quotes.set("ETHUSDT", "3100", 10ms);
    orch.cache().set("session", "abc");

    orch.start();
    EXPECT_TRUE(wait_until([&] { return quotes.size() == 0; }, 2s));
    orch.stop();

    EXPECT_EQ(orch.cache().size(), 1u);
    EXPECT_EQ(recorder->swept.load(), 2u);
}

TEST(MaintenanceTest, EmitsPeriodicSnapshots) {
    Config config;
    config.maintenance_interval = 10ms;
    config.snapshot_interval = 30ms;
    config.decision.mode = ExecutionMode::Auto;
    DecisionOrchestrator orch(config);
    auto recorder = std::make_shared<SnapshotRecorder>();
    orch.set_monitor(recorder);

    orch.breakers().get("exchange");
    orch.set_paused(true);

    orch.start();
    EXPECT_TRUE(wait_until([&] { return recorder->snapshot_count() >= 2; }, 2s));
    orch.stop();

    auto snapshot = recorder->last_snapshot();
    EXPECT_EQ(snapshot.mode, ExecutionMode::Auto);
    EXPECT_TRUE(snapshot.paused);
    ASSERT_EQ(snapshot.breakers.size(), 1u);
    EXPECT_EQ(snapshot.breakers[0].name, "exchange");
    EXPECT_EQ(snapshot.caches.count("default"), 1u);
}

TEST(MaintenanceTest, NoSnapshotsAfterStop) {
    Config config;
    config.maintenance_interval = 10ms;
    config.snapshot_interval = 20ms;
    DecisionOrchestrator orch(config);
    auto recorder = std::make_shared<SnapshotRecorder>();
    orch.set_monitor(recorder);

    orch.start();
    ASSERT_TRUE(wait_until([&] { return recorder->snapshot_count() >= 1; }, 2s));
    orch.stop();

    int after_stop = recorder->snapshot_count();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(recorder->snapshot_count(), after_stop);
}
