#pragma once

#include "cache.hpp"
#include "cache_metrics.hpp"
#include <memory>

namespace credscan {

// Decorator forwarding to another cache and recording each operation.
template <typename V>
class MetricsCache final : public Cache<V> {
public:
    MetricsCache(std::shared_ptr<Cache<V>> inner, std::string name,
                 std::shared_ptr<CacheMetricsCollector> collector)
        : inner_(std::move(inner)), name_(std::move(name)), collector_(std::move(collector)) {}

    void set(const std::string& key, V value) override {
        collector_->record_set(name_);
        inner_->set(key, std::move(value));
    }

    std::optional<V> get(const std::string& key) override {
        auto v = inner_->get(key);
        if (v) collector_->record_hit(name_);
        else collector_->record_miss(name_);
        return v;
    }

    bool exists(const std::string& key) const override {
        bool found = inner_->exists(key);
        if (found) collector_->record_hit(name_);
        else collector_->record_miss(name_);
        return found;
    }

    void erase(const std::string& key) override {
        collector_->record_delete(name_);
        inner_->erase(key);
    }

    void clear() override {
        collector_->record_clear(name_);
        inner_->clear();
    }

    size_t count() const override { return inner_->count(); }
    std::vector<std::string> keys() const override { return inner_->keys(); }
    std::vector<V> values() const override { return inner_->values(); }
    std::string contents() const override { return inner_->contents(); }

    const std::string& name() const { return name_; }

private:
    std::shared_ptr<Cache<V>> inner_;
    std::string name_;
    std::shared_ptr<CacheMetricsCollector> collector_;
};

} // namespace credscan
