// 02_protected_venue_calls.cpp
//
// Four strategy threads place orders against one exchange through a shared
// ProtectedCaller.  The rate limiter enforces the venue's ceilings (orders
// per second and request weight per minute) and a circuit breaker stops
// calling the exchange once it starts failing.
//
// This example shows how DecisionGate keeps concurrent callers inside venue
// limits and fails fast while a dependency is down.

#include <decisiongate/decisiongate.hpp>

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace decisiongate;
using namespace std::chrono_literals;

namespace {

// Simulated exchange that starts failing after a number of orders.
class FakeExchange {
public:
    explicit FakeExchange(int healthy_orders) : healthy_orders_(healthy_orders) {}

    std::string place_order(const std::string& strategy, int n) {
        int seq = placed_.fetch_add(1) + 1;
        if (seq > healthy_orders_) {
            throw std::runtime_error("503 Service Unavailable");
        }
        std::this_thread::sleep_for(2ms);
        return strategy + "-order-" + std::to_string(n);
    }

private:
    int healthy_orders_;
    std::atomic<int> placed_{0};
};

} // namespace

int main() {
    std::cout << "=== DecisionGate: Protected Venue Calls Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Rate limits and breaker
    // ----------------------------------------------------------------
    RateLimitConfig limits;
    limits.limits = {
        RateLimit::per("orders_per_second", 20, RateWindow::PerSecond),
        RateLimit::per("weight_per_minute", 120, RateWindow::PerMinute, true),
    };
    limits.poll_interval = 10ms;
    RateLimiter limiter(limits);

    CircuitBreakerConfig breaker_cfg;
    breaker_cfg.failure_threshold = 3;
    breaker_cfg.open_timeout = 500ms;
    CircuitBreakerRegistry breakers(breaker_cfg);

    auto console = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal);
    auto metrics = std::make_shared<MetricsMonitor>();
    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(console);
    composite->add_monitor(metrics);
    limiter.set_monitor(composite);
    breakers.set_monitor(composite);

    // Wait at most 2s for admission
    ProtectedCaller caller(limiter, breakers, 2s);

    // ----------------------------------------------------------------
    // 2. Strategy threads
    // ----------------------------------------------------------------
    FakeExchange exchange(30);
    std::atomic<int> filled{0};
    std::atomic<int> rate_limited{0};
    std::atomic<int> circuit_open{0};
    std::atomic<int> failed{0};

    std::vector<std::thread> threads;
    for (int s = 0; s < 4; ++s) {
        threads.emplace_back([&, s]() {
            std::string strategy = "strategy" + std::to_string(s + 1);
            for (int i = 0; i < 12; ++i) {
                // Order placement weighs 2, a status query would weigh 1
                auto result = caller.try_invoke("exchange", 2, [&] {
                    return exchange.place_order(strategy, i);
                });
                if (result.ok()) {
                    filled.fetch_add(1);
                    continue;
                }
                switch (result.error().kind) {
                    case ErrorKind::RateLimitExceeded: rate_limited.fetch_add(1); break;
                    case ErrorKind::CircuitOpen:       circuit_open.fetch_add(1); break;
                    default:                           failed.fetch_add(1); break;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    // ----------------------------------------------------------------
    // 3. Results
    // ----------------------------------------------------------------
    std::cout << "\n=== Results ===\n";
    std::cout << "Filled:          " << filled.load() << "\n";
    std::cout << "Rate limited:    " << rate_limited.load() << "\n";
    std::cout << "Circuit open:    " << circuit_open.load() << "\n";
    std::cout << "Failed:          " << failed.load() << "\n";

    auto breaker = breakers.get("exchange").get_status();
    std::cout << "\nBreaker [exchange]: " << to_string(breaker.state)
              << " calls=" << breaker.total_calls
              << " failures=" << breaker.total_failures
              << " rejected=" << breaker.rejected_calls << "\n";
    for (const auto& err : breaker.recent_errors) {
        std::cout << "  recent error: " << err.message << "\n";
    }

    auto status = limiter.get_status();
    std::cout << "\nRate limiter: requests=" << status.total_requests
              << " blocked=" << status.total_blocked
              << " waited=" << status.total_wait.count() << "s\n";
    for (const auto& bucket : status.buckets) {
        std::cout << "  [" << bucket.name << "] " << bucket.available_tokens
                  << "/" << bucket.capacity << "\n";
    }

    auto m = metrics->get_metrics();
    std::cout << "\nCircuit trips: " << m.circuit_trips
              << ", rejected calls: " << m.rejected_calls << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
