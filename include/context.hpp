#pragma once

#include <chrono>
#include <optional>
#include <stop_token>

namespace credscan {

// Cancellation and deadline passed down to detectors and the HTTP client.
// Copies share the stop state of the std::stop_source that issued the token.
class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context() = default;
    explicit Context(std::stop_token token) : token_(std::move(token)) {}

    static Context background() { return Context{}; }

    // Returns a copy whose deadline is the earlier of the current one and now + timeout.
    Context with_timeout(Clock::duration timeout) const {
        Context ctx = *this;
        auto deadline = Clock::now() + timeout;
        if (!ctx.deadline_ || deadline < *ctx.deadline_) ctx.deadline_ = deadline;
        return ctx;
    }

    bool cancelled() const { return token_.stop_requested(); }
    bool expired() const { return deadline_ && Clock::now() >= *deadline_; }
    bool done() const { return cancelled() || expired(); }

    std::optional<Clock::time_point> deadline() const { return deadline_; }
    const std::stop_token& stop_token() const { return token_; }

    // Time left before the deadline, or nullopt without one. Never negative.
    std::optional<std::chrono::milliseconds> remaining() const {
        if (!deadline_) return std::nullopt;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds{0};
    }

private:
    std::stop_token token_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace credscan
