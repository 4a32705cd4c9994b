#include "decisiongate/cache.hpp"

namespace decisiongate {

// ========== Cache ==========

Cache::Cache(CacheConfig config, std::string name)
    : config_(std::move(config))
    , name_(std::move(name))
{
    validate(config_);
}

const std::string& Cache::name() const noexcept {
    return name_;
}

bool Cache::is_expired(const Entry& entry, Timestamp now) {
    return entry.expires_at.has_value() && now >= *entry.expires_at;
}

std::optional<std::string> Cache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        misses_++;
        return std::nullopt;
    }

    if (is_expired(*it->second, Clock::now())) {
        entries_.erase(it->second);
        index_.erase(it);
        misses_++;
        return std::nullopt;
    }

    entries_.splice(entries_.begin(), entries_, it->second);
    hits_++;
    return it->second->value;
}

void Cache::set(const std::string& key, std::string value, std::optional<Duration> ttl) {
    std::optional<std::string> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::optional<Timestamp> expires_at;
        auto effective_ttl = ttl.has_value() ? ttl : config_.default_ttl;
        if (effective_ttl.has_value()) {
            expires_at = Clock::now() + *effective_ttl;
        }

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->value = std::move(value);
            it->second->expires_at = expires_at;
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }

        if (entries_.size() >= config_.max_size) {
            evicted = entries_.back().key;
            index_.erase(entries_.back().key);
            entries_.pop_back();
        }

        entries_.push_front(Entry{key, std::move(value), expires_at});
        index_[key] = entries_.begin();
    }

    if (evicted.has_value()) {
        MonitorEvent event{EventType::CacheEntryEvicted, {}, "Evicted " + *evicted};
        event.component = name_;
        emit(monitor(), std::move(event));
    }
}

bool Cache::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    entries_.erase(it->second);
    index_.erase(it);
    return true;
}

bool Cache::contains(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    if (is_expired(*it->second, Clock::now())) {
        entries_.erase(it->second);
        index_.erase(it);
        return false;
    }
    return true;
}

std::size_t Cache::cleanup_expired() {
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (is_expired(*it, now)) {
                index_.erase(it->key);
                it = entries_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        MonitorEvent event{EventType::CacheExpiredSwept, {}, "Expired entries removed"};
        event.component = name_;
        event.count = removed;
        emit(monitor(), std::move(event));
    }
    return removed;
}

void Cache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
    hits_ = 0;
    misses_ = 0;
}

std::size_t Cache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

CacheStats Cache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.size = entries_.size();
    stats.max_size = config_.max_size;
    stats.hits = hits_;
    stats.misses = misses_;
    auto lookups = hits_ + misses_;
    stats.hit_rate = lookups > 0
        ? 100.0 * static_cast<double>(hits_) / static_cast<double>(lookups)
        : 0.0;
    stats.utilization = 100.0 * static_cast<double>(stats.size) /
                        static_cast<double>(config_.max_size);
    return stats;
}

std::string Cache::get_or_compute(const std::string& key,
                                  const std::function<std::string()>& compute,
                                  std::optional<Duration> ttl) {
    if (auto cached = get(key)) {
        return std::move(*cached);
    }
    std::string value = compute();
    set(key, value, ttl);
    return value;
}

void Cache::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

std::shared_ptr<Monitor> Cache::monitor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monitor_;
}

// ========== CacheManager ==========

CacheManager::CacheManager(CacheConfig default_config)
    : default_config_(std::move(default_config))
{
    validate(default_config_);
}

Cache& CacheManager::get_cache(const std::string& name, std::optional<CacheConfig> config) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = caches_.find(name);
    if (it != caches_.end()) {
        return *it->second;
    }
    auto cache = std::make_unique<Cache>(config.value_or(default_config_), name);
    cache->set_monitor(monitor_);
    auto& ref = *cache;
    caches_.emplace(name, std::move(cache));
    return ref;
}

bool CacheManager::has_cache(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return caches_.count(name) > 0;
}

std::vector<std::string> CacheManager::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(caches_.size());
    for (const auto& [name, _] : caches_) {
        result.push_back(name);
    }
    return result;
}

std::vector<Cache*> CacheManager::all_caches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Cache*> result;
    result.reserve(caches_.size());
    for (const auto& [_, cache] : caches_) {
        result.push_back(cache.get());
    }
    return result;
}

void CacheManager::clear_all() {
    for (auto* cache : all_caches()) {
        cache->clear();
    }
}

// Caches are never removed, so the pointers stay valid outside the lock.
std::size_t CacheManager::cleanup_all_expired() {
    std::size_t removed = 0;
    for (auto* cache : all_caches()) {
        removed += cache->cleanup_expired();
    }
    return removed;
}

std::unordered_map<std::string, CacheStats> CacheManager::get_all_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<std::string, CacheStats> stats;
    for (const auto& [name, cache] : caches_) {
        stats.emplace(name, cache->get_stats());
    }
    return stats;
}

void CacheManager::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = monitor;
    for (auto& [_, cache] : caches_) {
        cache->set_monitor(monitor);
    }
}

} // namespace decisiongate
