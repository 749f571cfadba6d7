#include "cache_metrics.hpp"

namespace credscan {

CacheCounters& InMemoryCacheMetrics::entry(std::string_view cache_name) {
    auto it = counters_.find(cache_name);
    if (it == counters_.end()) it = counters_.emplace(std::string(cache_name), CacheCounters{}).first;
    return it->second;
}

void InMemoryCacheMetrics::record_hit(std::string_view cache_name) {
    std::lock_guard lock(mutex_);
    ++entry(cache_name).hits;
}

void InMemoryCacheMetrics::record_miss(std::string_view cache_name) {
    std::lock_guard lock(mutex_);
    ++entry(cache_name).misses;
}

void InMemoryCacheMetrics::record_set(std::string_view cache_name) {
    std::lock_guard lock(mutex_);
    ++entry(cache_name).sets;
}

void InMemoryCacheMetrics::record_delete(std::string_view cache_name) {
    std::lock_guard lock(mutex_);
    ++entry(cache_name).deletes;
}

void InMemoryCacheMetrics::record_clear(std::string_view cache_name) {
    std::lock_guard lock(mutex_);
    ++entry(cache_name).clears;
}

void InMemoryCacheMetrics::record_eviction(std::string_view cache_name) {
    std::lock_guard lock(mutex_);
    ++entry(cache_name).evictions;
}

CacheCounters InMemoryCacheMetrics::counters(std::string_view cache_name) const {
    std::lock_guard lock(mutex_);
    auto it = counters_.find(cache_name);
    return it == counters_.end() ? CacheCounters{} : it->second;
}

std::map<std::string, CacheCounters> InMemoryCacheMetrics::snapshot() const {
    std::lock_guard lock(mutex_);
    return {counters_.begin(), counters_.end()};
}

} // namespace credscan
