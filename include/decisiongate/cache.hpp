#pragma once

#include "decisiongate/config.hpp"
#include "decisiongate/monitor.hpp"

#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace decisiongate {

// Bounded key/value store with least-recently-used eviction and optional
// per-entry time-to-live. Thread-safe.
//
// An expired entry is never returned: a read that finds one removes it and
// counts a miss. Inserting a new key into a full cache evicts exactly the
// least recently used entry first.
class Cache {
public:
    explicit Cache(CacheConfig config = CacheConfig{}, std::string name = "default");

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    const std::string& name() const noexcept;

    // Hit promotes the entry to most recently used
    std::optional<std::string> get(const std::string& key);

    // ttl falls back to the configured default_ttl. Updating an existing key
    // replaces its value and expiry and promotes it.
    void set(const std::string& key, std::string value,
             std::optional<Duration> ttl = std::nullopt);

    bool erase(const std::string& key);
    bool contains(const std::string& key);

    // Removes every expired entry, returns how many were removed
    std::size_t cleanup_expired();

    // Drops all entries and resets hit/miss counters
    void clear();

    std::size_t size() const;
    CacheStats get_stats() const;

    // Returns the cached value for key, or computes, stores and returns it.
    // compute runs outside the cache lock; exceptions propagate and nothing
    // is stored.
    std::string get_or_compute(const std::string& key,
                               const std::function<std::string()>& compute,
                               std::optional<Duration> ttl = std::nullopt);

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    struct Entry {
        std::string key;
        std::string value;
        std::optional<Timestamp> expires_at;
    };
    using EntryList = std::list<Entry>;

    CacheConfig config_;
    std::string name_;

    mutable std::mutex mutex_;
    EntryList entries_;   // front = most recently used
    std::unordered_map<std::string, EntryList::iterator> index_;
    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
    std::shared_ptr<Monitor> monitor_;

    static bool is_expired(const Entry& entry, Timestamp now);
    std::shared_ptr<Monitor> monitor() const;
};

// Named caches created on first use
class CacheManager {
public:
    explicit CacheManager(CacheConfig default_config = CacheConfig{});

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    // config applies only when the cache is created
    Cache& get_cache(const std::string& name,
                     std::optional<CacheConfig> config = std::nullopt);

    bool has_cache(const std::string& name) const;
    std::vector<std::string> names() const;

    void clear_all();
    std::size_t cleanup_all_expired();
    std::unordered_map<std::string, CacheStats> get_all_stats() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    CacheConfig default_config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Cache>> caches_;
    std::shared_ptr<Monitor> monitor_;

    std::vector<Cache*> all_caches() const;
};

} // namespace decisiongate
