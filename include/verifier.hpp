#pragma once

#include "detector.hpp"
#include "http_client.hpp"
#include <format>
#include <optional>

namespace credscan {

// A transport failure caused by the caller's context ending aborts the whole
// from_data call; any other failure is recorded on the result.
inline std::optional<DetectorErrorInfo> context_abort(const Context& ctx, const DetectorKey& key, const HttpErrorInfo& err) {
    if (err.error == HttpError::Cancelled || (err.error == HttpError::Timeout && ctx.done())) {
        auto kind = ctx.cancelled() ? DetectorError::Cancelled : DetectorError::Timeout;
        return DetectorErrorInfo{kind, std::format("{}: verification aborted: {}", key.loggable(), err.message)};
    }
    return std::nullopt;
}

inline std::string unexpected_status(int status) {
    return std::format("unexpected HTTP response status {}", status);
}

} // namespace credscan
