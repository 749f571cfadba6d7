#pragma once

#include "cache.hpp"
#include "cache_metrics.hpp"
#include <list>
#include <memory>
#include <mutex>

namespace credscan {

// Size-bounded cache evicting the least recently used entry. Erase and
// clear also count as evictions on the collector.
template <typename V>
class LruCache final : public Cache<V> {
public:
    static constexpr size_t kDefaultCapacity = 512;

    explicit LruCache(size_t capacity = kDefaultCapacity,
                      std::string name = "lru",
                      std::shared_ptr<EvictionCollector> collector = nullptr)
        : capacity_(capacity == 0 ? kDefaultCapacity : capacity),
          name_(std::move(name)), collector_(std::move(collector)) {}

    void set(const std::string& key, V value) override {
        std::lock_guard lock(mutex_);
        if (auto it = index_.find(key); it != index_.end()) {
            it->second->second = std::move(value);
            order_.splice(order_.begin(), order_, it->second);
            return;
        }
        order_.emplace_front(key, std::move(value));
        index_.emplace(key, order_.begin());
        while (order_.size() > capacity_) {
            index_.erase(order_.back().first);
            order_.pop_back();
            evicted(1);
        }
    }

    std::optional<V> get(const std::string& key) override {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;
        order_.splice(order_.begin(), order_, it->second);
        return it->second->second;
    }

    bool exists(const std::string& key) const override {
        std::lock_guard lock(mutex_);
        return index_.contains(key);
    }

    void erase(const std::string& key) override {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return;
        order_.erase(it->second);
        index_.erase(it);
        evicted(1);
    }

    void clear() override {
        std::lock_guard lock(mutex_);
        auto n = order_.size();
        order_.clear();
        index_.clear();
        evicted(n);
    }

    size_t count() const override {
        std::lock_guard lock(mutex_);
        return order_.size();
    }

    std::vector<std::string> keys() const override {
        std::lock_guard lock(mutex_);
        std::vector<std::string> out;
        out.reserve(order_.size());
        for (const auto& [k, v] : order_) out.push_back(k);
        return out;
    }

    std::vector<V> values() const override {
        std::lock_guard lock(mutex_);
        std::vector<V> out;
        out.reserve(order_.size());
        for (const auto& [k, v] : order_) out.push_back(v);
        return out;
    }

    size_t capacity() const { return capacity_; }

private:
    using Entry = std::pair<std::string, V>;

    void evicted(size_t n) {
        if (!collector_) return;
        for (size_t i = 0; i < n; ++i) collector_->record_eviction(name_);
    }

    size_t capacity_;
    std::string name_;
    std::shared_ptr<EvictionCollector> collector_;
    mutable std::mutex mutex_;
    std::list<Entry> order_;
    std::unordered_map<std::string, typename std::list<Entry>::iterator> index_;
};

} // namespace credscan
