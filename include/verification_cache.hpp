#pragma once

#include "cache.hpp"
#include "context.hpp"
#include "detector.hpp"
#include "hasher.hpp"
#include "single_flight.hpp"
#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace credscan {

class VerificationCacheMetrics {
public:
    virtual ~VerificationCacheMetrics() = default;
    virtual void add_credential_verifications_saved(int count) = 0;
    virtual void add_from_data_verify_time_spent(std::chrono::microseconds elapsed) = 0;
    virtual void add_result_cache_hits(int count) = 0;
    virtual void add_result_cache_hits_wasted(int count) = 0;
    virtual void add_result_cache_misses(int count) = 0;
};

class InMemoryVerificationMetrics final : public VerificationCacheMetrics {
public:
    void add_credential_verifications_saved(int count) override { verifications_saved_ += count; }
    void add_from_data_verify_time_spent(std::chrono::microseconds elapsed) override { verify_time_us_ += elapsed.count(); }
    void add_result_cache_hits(int count) override { hits_ += count; }
    void add_result_cache_hits_wasted(int count) override { hits_wasted_ += count; }
    void add_result_cache_misses(int count) override { misses_ += count; }

    int64_t credential_verifications_saved() const { return verifications_saved_.load(); }
    int64_t from_data_verify_time_spent_ms() const { return verify_time_us_.load() / 1000; }
    int64_t from_data_verify_time_spent_us() const { return verify_time_us_.load(); }
    int64_t result_cache_hits() const { return hits_.load(); }
    int64_t result_cache_hits_wasted() const { return hits_wasted_.load(); }
    int64_t result_cache_misses() const { return misses_.load(); }

private:
    std::atomic<int64_t> verifications_saved_{0};
    std::atomic<int64_t> verify_time_us_{0};
    std::atomic<int64_t> hits_{0};
    std::atomic<int64_t> hits_wasted_{0};
    std::atomic<int64_t> misses_{0};
};

using DetectionOutcome = std::expected<std::vector<Result>, DetectorErrorInfo>;

// Wraps Detector::from_data so that repeated sightings of the same secret
// reuse an earlier verification outcome instead of calling the provider
// again. Cached results never hold raw secret material: only a fingerprint
// (SHA-256 of the type tag, raw and raw_v2) is used as the key.
//
// Concurrent verifications of the same batch of fingerprints are collapsed
// into one call, forced updates included. Without a backing cache every call
// goes straight to the detector.
class VerificationCache {
public:
    explicit VerificationCache(std::shared_ptr<Cache<Result>> result_cache = nullptr,
                               std::shared_ptr<VerificationCacheMetrics> metrics = nullptr);

    DetectionOutcome from_data(const Context& ctx, const Detector& detector, bool verify,
                               bool force_cache_update, std::string_view data);

    // Hex SHA-256 fingerprint of a result.
    std::expected<std::string, HashErrorInfo> result_cache_key(const Result& result) const;

    bool enabled() const { return result_cache_ != nullptr; }
    size_t in_flight() const { return flights_.in_flight(); }
    const std::shared_ptr<VerificationCacheMetrics>& metrics() const { return metrics_; }

private:
    DetectionOutcome verify_and_cache(const Context& ctx, const Detector& detector, std::string_view data);
    void store(const std::vector<Result>& results);

    static Result sanitized(const Result& result);

    std::shared_ptr<Cache<Result>> result_cache_;
    std::shared_ptr<VerificationCacheMetrics> metrics_;
    Sha256Hasher hasher_;
    SingleFlight<DetectionOutcome> flights_;
};

} // namespace credscan
