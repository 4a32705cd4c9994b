#include <gtest/gtest.h>
#include <decisiongate/decisiongate.hpp>

#include <stdexcept>
#include <thread>

using namespace decisiongate;
using namespace std::chrono_literals;

namespace {

CacheConfig sized(std::size_t max_size) {
    CacheConfig config;
    config.max_size = max_size;
    return config;
}

} // namespace

// ===========================================================================
// Basic operations
// ===========================================================================

TEST(CacheTest, SetAndGet) {
    Cache cache(sized(10));
    cache.set("quote:BTC", "42000");

    auto value = cache.get("quote:BTC");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "42000");
    EXPECT_FALSE(cache.get("quote:ETH").has_value());
}

TEST(CacheTest, UpdateReplacesValue) {
    Cache cache(sized(10));
    cache.set("k", "v1");
    cache.set("k", "v2");

    EXPECT_EQ(cache.get("k").value(), "v2");
    EXPECT_EQ(cache.size(), 1u);
}

TEST(CacheTest, EraseAndContains) {
    Cache cache(sized(10));
    cache.set("k", "v");
    EXPECT_TRUE(cache.contains("k"));
    EXPECT_TRUE(cache.erase("k"));
    EXPECT_FALSE(cache.erase("k"));
    EXPECT_FALSE(cache.contains("k"));
}

// ===========================================================================
// LRU eviction
// ===========================================================================

TEST(CacheTest, InsertBeyondCapacityEvictsLeastRecentlyUsed) {
    Cache cache(sized(3));
    cache.set("a", "1");
    cache.set("b", "2");
    cache.set("c", "3");
    cache.set("d", "4");

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_FALSE(cache.contains("a"));
    EXPECT_TRUE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
    EXPECT_TRUE(cache.contains("d"));
}

TEST(CacheTest, ReadProtectsEntryFromEviction) {
    Cache cache(sized(3));
    cache.set("a", "1");
    cache.set("b", "2");
    cache.set("c", "3");

    ASSERT_TRUE(cache.get("a").has_value());
    cache.set("d", "4");

    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
}

TEST(CacheTest, UpdatePromotesEntry) {
    Cache cache(sized(2));
    cache.set("a", "1");
    cache.set("b", "2");
    cache.set("a", "1'");
    cache.set("c", "3");

    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
}

// ===========================================================================
// Expiry
// ===========================================================================

TEST(CacheTest, ExpiredEntryIsAMiss) {
    Cache cache(sized(10));
    cache.set("k", "v", 20ms);
    ASSERT_TRUE(cache.get("k").has_value());

    std::this_thread::sleep_for(40ms);

    EXPECT_FALSE(cache.get("k").has_value());
    EXPECT_EQ(cache.size(), 0u);
    auto stats = cache.get_stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
}

TEST(CacheTest, DefaultTtlApplies) {
    CacheConfig config;
    config.max_size = 10;
    config.default_ttl = 20ms;
    Cache cache(config);

    cache.set("short", "v");
    cache.set("long", "v", 10s);
    std::this_thread::sleep_for(40ms);

    EXPECT_FALSE(cache.contains("short"));
    EXPECT_TRUE(cache.contains("long"));
}

TEST(CacheTest, CleanupExpiredReturnsCount) {
    Cache cache(sized(10));
    cache.set("a", "1", 10ms);
    cache.set("b", "2", 10ms);
    cache.set("c", "3");
    std::this_thread::sleep_for(30ms);

    EXPECT_EQ(cache.cleanup_expired(), 2u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.cleanup_expired(), 0u);
}

// ===========================================================================
// Statistics
// ===========================================================================

TEST(CacheTest, StatsReportHitRateAndUtilization) {
    Cache cache(sized(4));
    cache.set("a", "1");
    cache.set("b", "2");

    cache.get("a");
    cache.get("a");
    cache.get("b");
    cache.get("missing");

    auto stats = cache.get_stats();
    EXPECT_EQ(stats.size, 2u);
    EXPECT_EQ(stats.max_size, 4u);
    EXPECT_EQ(stats.hits, 3u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_DOUBLE_EQ(stats.hit_rate, 75.0);
    EXPECT_DOUBLE_EQ(stats.utilization, 50.0);
}

TEST(CacheTest, ClearDropsEntriesAndCounters) {
    Cache cache(sized(4));
    cache.set("a", "1");
    cache.get("a");
    cache.get("b");

    cache.clear();
    auto stats = cache.get_stats();
    EXPECT_EQ(stats.size, 0u);
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
    EXPECT_DOUBLE_EQ(stats.hit_rate, 0.0);
}

// ===========================================================================
// get_or_compute
// ===========================================================================

TEST(CacheTest, GetOrComputeMemoizes) {
    Cache cache(sized(4));
    int calls = 0;
    auto compute = [&] {
        ++calls;
        return std::string("expensive");
    };

    EXPECT_EQ(cache.get_or_compute("k", compute), "expensive");
    EXPECT_EQ(cache.get_or_compute("k", compute), "expensive");
    EXPECT_EQ(calls, 1);
}

TEST(CacheTest, GetOrComputeStoresNothingOnFailure) {
    Cache cache(sized(4));
    EXPECT_THROW(cache.get_or_compute("k", []() -> std::string {
        throw std::runtime_error("lookup failed");
    }), std::runtime_error);
    EXPECT_FALSE(cache.contains("k"));
}

// ===========================================================================
// CacheManager
// ===========================================================================

TEST(CacheManagerTest, CreatesNamedCachesOnce) {
    CacheManager manager(sized(8));
    auto& quotes = manager.get_cache("quotes");
    auto& again = manager.get_cache("quotes", sized(2));

    EXPECT_EQ(&quotes, &again);
    EXPECT_EQ(quotes.get_stats().max_size, 8u);

    auto& small = manager.get_cache("small", sized(2));
    EXPECT_EQ(small.get_stats().max_size, 2u);
    EXPECT_TRUE(manager.has_cache("small"));
    EXPECT_FALSE(manager.has_cache("other"));
}

TEST(CacheManagerTest, BulkOperations) {
    CacheManager manager(sized(8));
    manager.get_cache("a").set("k", "v", 10ms);
    manager.get_cache("b").set("k", "v", 10ms);
    manager.get_cache("b").set("keep", "v");
    std::this_thread::sleep_for(30ms);

    EXPECT_EQ(manager.cleanup_all_expired(), 2u);

    auto stats = manager.get_all_stats();
    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats.at("a").size, 0u);
    EXPECT_EQ(stats.at("b").size, 1u);

    manager.clear_all();
    EXPECT_EQ(manager.get_all_stats().at("b").size, 0u);
}

TEST(CacheTest, InvalidConfigurationThrows) {
    EXPECT_THROW(Cache{sized(0)}, ConfigurationException);
}
