#pragma once

#include "context.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace credscan {

// Collapses concurrent calls sharing a key into one execution. The first
// caller (the leader) runs the function; callers arriving while it runs wait
// for the same outcome. The entry is removed once the leader finishes, so a
// later call with the same key runs again.
template <typename T>
class SingleFlight {
public:
    struct Outcome {
        std::optional<T> value;  // empty when the caller's context ended first
        bool shared = false;     // true for followers
    };

    Outcome run(const Context& ctx, const std::string& key, const std::function<T()>& fn) {
        std::shared_future<T> future;
        std::optional<std::promise<T>> promise;
        {
            std::lock_guard lock(mutex_);
            if (auto it = flights_.find(key); it != flights_.end()) {
                future = it->second;
            } else {
                promise.emplace();
                future = promise->get_future().share();
                flights_.emplace(key, future);
            }
        }

        if (promise) {
            try {
                promise->set_value(fn());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            {
                std::lock_guard lock(mutex_);
                flights_.erase(key);
            }
            return Outcome{future.get(), false};
        }

        while (future.wait_for(kPollInterval) != std::future_status::ready) {
            if (ctx.done()) return Outcome{std::nullopt, true};
        }
        return Outcome{future.get(), true};
    }

    size_t in_flight() const {
        std::lock_guard lock(mutex_);
        return flights_.size();
    }

private:
    static constexpr std::chrono::milliseconds kPollInterval{10};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<T>> flights_;
};

} // namespace credscan
