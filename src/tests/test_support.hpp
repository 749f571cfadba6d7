#pragma once

#include "detector.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <regex>
#include <string>
#include <thread>
#include <vector>

namespace credscan::testing {

// Configurable detector double: extracts every capture of `pattern`,
// optionally "verifies" through `verifier`, and counts calls.
class FakeDetector : public Detector {
public:
    using Verifier = std::function<bool(const std::string& raw, Result& r)>;

    FakeDetector(DetectorType type, std::vector<std::string> keywords, std::string pattern, int version = 0)
        : type_(type), version_(version), keywords_(std::move(keywords)), pattern_(pattern) {}

    DetectorType type() const override { return type_; }
    int version() const override { return version_; }
    std::vector<std::string> keywords() const override { return keywords_; }

    std::expected<std::vector<Result>, DetectorErrorInfo> from_data(
        const Context& ctx, bool verify, std::string_view data) const override {
        ++calls;
        if (verify) ++verify_calls;
        if (fail_extraction) return std::unexpected(DetectorErrorInfo{DetectorError::ExtractionFailed, "boom"});

        std::vector<Result> out;
        for (const auto& raw : find_unique_submatches(pattern_, data)) {
            Result r;
            r.detector_type = type_;
            r.version = version_;
            r.raw = raw;
            r.redacted = redact_prefix(raw);
            if (verify) {
                if (verify_delay.count() > 0) {
                    auto until = std::chrono::steady_clock::now() + verify_delay;
                    while (std::chrono::steady_clock::now() < until) {
                        if (ctx.done()) return std::unexpected(DetectorErrorInfo{DetectorError::Cancelled, "cancelled"});
                        std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    }
                }
                r.verified = verifier ? verifier(raw, r) : true;
            }
            out.push_back(std::move(r));
        }
        if (verify && extra_verified_result) {
            Result extra;
            extra.detector_type = type_;
            extra.raw = "EXTRA" + std::to_string(verify_calls.load());
            extra.verified = true;
            out.push_back(std::move(extra));
        }
        return out;
    }

    mutable std::atomic<int> calls{0};
    mutable std::atomic<int> verify_calls{0};
    Verifier verifier;
    std::chrono::milliseconds verify_delay{0};
    bool fail_extraction = false;
    bool extra_verified_result = false;

private:
    DetectorType type_;
    int version_;
    std::vector<std::string> keywords_;
    std::regex pattern_;
};

} // namespace credscan::testing
