#pragma once

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace credscan {

// Key/value cache capability shared by every backend. Implementations are
// safe for concurrent use.
template <typename V>
class Cache {
public:
    virtual ~Cache() = default;

    virtual void set(const std::string& key, V value) = 0;
    virtual std::optional<V> get(const std::string& key) = 0;
    virtual bool exists(const std::string& key) const = 0;
    virtual void erase(const std::string& key) = 0;
    virtual void clear() = 0;
    virtual size_t count() const = 0;
    virtual std::vector<std::string> keys() const = 0;
    virtual std::vector<V> values() const = 0;

    // Sorted keys joined by ", ".
    virtual std::string contents() const {
        auto k = keys();
        std::sort(k.begin(), k.end());
        std::string out;
        for (size_t i = 0; i < k.size(); ++i) {
            if (i) out += ", ";
            out += k[i];
        }
        return out;
    }
};

// Unbounded map guarded by a reader/writer lock.
template <typename V>
class SimpleCache final : public Cache<V> {
public:
    SimpleCache() = default;

    explicit SimpleCache(std::vector<std::pair<std::string, V>> initial) {
        for (auto& [k, v] : initial) data_.insert_or_assign(std::move(k), std::move(v));
    }

    void set(const std::string& key, V value) override {
        std::unique_lock lock(mutex_);
        data_.insert_or_assign(key, std::move(value));
    }

    std::optional<V> get(const std::string& key) override {
        std::shared_lock lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) return std::nullopt;
        return it->second;
    }

    bool exists(const std::string& key) const override {
        std::shared_lock lock(mutex_);
        return data_.contains(key);
    }

    void erase(const std::string& key) override {
        std::unique_lock lock(mutex_);
        data_.erase(key);
    }

    void clear() override {
        std::unique_lock lock(mutex_);
        data_.clear();
    }

    size_t count() const override {
        std::shared_lock lock(mutex_);
        return data_.size();
    }

    std::vector<std::string> keys() const override {
        std::shared_lock lock(mutex_);
        std::vector<std::string> out;
        out.reserve(data_.size());
        for (const auto& [k, v] : data_) out.push_back(k);
        return out;
    }

    std::vector<V> values() const override {
        std::shared_lock lock(mutex_);
        std::vector<V> out;
        out.reserve(data_.size());
        for (const auto& [k, v] : data_) out.push_back(v);
        return out;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, V> data_;
};

} // namespace credscan
