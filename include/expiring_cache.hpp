#pragma once

#include "cache.hpp"
#include <chrono>
#include <condition_variable>
#include <stop_token>
#include <thread>

namespace credscan {

// Entries expire ttl after their last set. Expired entries are invisible to
// readers immediately and physically removed by a background purge thread
// every purge_interval.
template <typename V>
class ExpiringCache final : public Cache<V> {
public:
    using Clock = std::chrono::steady_clock;

    ExpiringCache(Clock::duration ttl, Clock::duration purge_interval)
        : ttl_(ttl), purge_interval_(purge_interval) {
        purger_ = std::jthread([this](std::stop_token st) { purge_loop(st); });
    }

    ~ExpiringCache() override {
        purger_.request_stop();
        cv_.notify_all();
    }

    ExpiringCache(const ExpiringCache&) = delete;
    ExpiringCache& operator=(const ExpiringCache&) = delete;

    void set(const std::string& key, V value) override {
        std::lock_guard lock(mutex_);
        data_.insert_or_assign(key, Item{std::move(value), Clock::now() + ttl_});
    }

    std::optional<V> get(const std::string& key) override {
        std::lock_guard lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end() || expired(it->second)) return std::nullopt;
        return it->second.value;
    }

    bool exists(const std::string& key) const override {
        std::lock_guard lock(mutex_);
        auto it = data_.find(key);
        return it != data_.end() && !expired(it->second);
    }

    void erase(const std::string& key) override {
        std::lock_guard lock(mutex_);
        data_.erase(key);
    }

    void clear() override {
        std::lock_guard lock(mutex_);
        data_.clear();
    }

    size_t count() const override {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& [k, item] : data_) {
            if (!expired(item)) ++n;
        }
        return n;
    }

    std::vector<std::string> keys() const override {
        std::lock_guard lock(mutex_);
        std::vector<std::string> out;
        for (const auto& [k, item] : data_) {
            if (!expired(item)) out.push_back(k);
        }
        return out;
    }

    std::vector<V> values() const override {
        std::lock_guard lock(mutex_);
        std::vector<V> out;
        for (const auto& [k, item] : data_) {
            if (!expired(item)) out.push_back(item.value);
        }
        return out;
    }

    // Removes expired entries now; returns how many were dropped.
    size_t purge() {
        std::lock_guard lock(mutex_);
        return std::erase_if(data_, [](const auto& kv) { return expired(kv.second); });
    }

private:
    struct Item {
        V value;
        Clock::time_point expires_at;
    };

    static bool expired(const Item& item) { return Clock::now() >= item.expires_at; }

    void purge_loop(std::stop_token st) {
        std::unique_lock lock(mutex_);
        while (!st.stop_requested()) {
            cv_.wait_for(lock, st, purge_interval_, [] { return false; });
            if (st.stop_requested()) break;
            std::erase_if(data_, [](const auto& kv) { return expired(kv.second); });
        }
    }

    Clock::duration ttl_;
    Clock::duration purge_interval_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::unordered_map<std::string, Item> data_;
    std::jthread purger_;
};

} // namespace credscan
