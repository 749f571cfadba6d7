#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace credscan {

// Receives cache operation counts, labelled with the cache name.
class CacheMetricsCollector {
public:
    virtual ~CacheMetricsCollector() = default;
    virtual void record_hit(std::string_view cache_name) = 0;
    virtual void record_miss(std::string_view cache_name) = 0;
    virtual void record_set(std::string_view cache_name) = 0;
    virtual void record_delete(std::string_view cache_name) = 0;
    virtual void record_clear(std::string_view cache_name) = 0;
};

class EvictionCollector {
public:
    virtual ~EvictionCollector() = default;
    virtual void record_eviction(std::string_view cache_name) = 0;
};

struct CacheCounters {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t sets = 0;
    uint64_t deletes = 0;
    uint64_t clears = 0;
    uint64_t evictions = 0;

    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

// Process-local collector backing both interfaces.
class InMemoryCacheMetrics final : public CacheMetricsCollector, public EvictionCollector {
public:
    void record_hit(std::string_view cache_name) override;
    void record_miss(std::string_view cache_name) override;
    void record_set(std::string_view cache_name) override;
    void record_delete(std::string_view cache_name) override;
    void record_clear(std::string_view cache_name) override;
    void record_eviction(std::string_view cache_name) override;

    CacheCounters counters(std::string_view cache_name) const;
    std::map<std::string, CacheCounters> snapshot() const;

private:
    CacheCounters& entry(std::string_view cache_name);

    mutable std::mutex mutex_;
    std::map<std::string, CacheCounters, std::less<>> counters_;
};

} // namespace credscan
