#include "verification_cache.hpp"
#include "encoding.hpp"
#include "log.hpp"
#include <algorithm>
#include <format>

namespace credscan {

VerificationCache::VerificationCache(std::shared_ptr<Cache<Result>> result_cache,
                                     std::shared_ptr<VerificationCacheMetrics> metrics)
    : result_cache_(std::move(result_cache)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<InMemoryVerificationMetrics>()) {}

std::expected<std::string, HashErrorInfo> VerificationCache::result_cache_key(const Result& result) const {
    auto material = std::format("{}:{}:", static_cast<int>(result.detector_type), result.version);
    material += result.raw;
    material += result.raw_v2;
    auto digest = hasher_.hash(material);
    if (!digest) return std::unexpected(digest.error());
    return to_hex(*digest);
}

Result VerificationCache::sanitized(const Result& result) {
    Result copy = result;
    copy.raw.clear();
    copy.raw_v2.clear();
    copy.decoder_type = DecoderType::Unknown;
    copy.verification_from_cache = false;
    return copy;
}

void VerificationCache::store(const std::vector<Result>& results) {
    for (const auto& r : results) {
        auto key = result_cache_key(r);
        if (!key) {
            log::debug(1, "not caching {} result: {}", to_string(r.detector_type), key.error().message);
            continue;
        }
        result_cache_->set(*key, sanitized(r));
    }
}

DetectionOutcome VerificationCache::from_data(const Context& ctx, const Detector& detector, bool verify,
                                              bool force_cache_update, std::string_view data) {
    if (!result_cache_) return detector.from_data(ctx, verify, data);

    // Without verification there is nothing worth coalescing.
    if (force_cache_update && !verify) {
        auto results = detector.from_data(ctx, false, data);
        if (!results) return results;
        store(*results);
        return results;
    }

    auto extracted = detector.from_data(ctx, false, data);
    if (!extracted) return extracted;
    if (!verify || extracted->empty()) return extracted;

    int hits = 0;
    int misses = 0;
    std::vector<std::string> fingerprints;
    fingerprints.reserve(extracted->size());
    std::vector<std::optional<Result>> cached(extracted->size());
    for (size_t i = 0; i < extracted->size(); ++i) {
        auto key = result_cache_key((*extracted)[i]);
        if (!key) {
            ++misses;
            continue;
        }
        if (!force_cache_update) {
            if (auto hit = result_cache_->get(*key)) {
                cached[i] = std::move(*hit);
                ++hits;
            } else {
                ++misses;
            }
        }
        fingerprints.push_back(std::move(*key));
    }

    if (!force_cache_update) {
        if (misses == 0) {
            auto& results = *extracted;
            for (size_t i = 0; i < results.size(); ++i) {
                results[i].copy_verification_info(*cached[i]);
                for (const auto& [k, v] : cached[i]->extra_data) results[i].extra_data.insert_or_assign(k, v);
                results[i].verification_from_cache = true;
            }
            metrics_->add_credential_verifications_saved(hits);
            metrics_->add_result_cache_hits(hits);
            return extracted;
        }

        metrics_->add_result_cache_hits(hits);
        metrics_->add_result_cache_hits_wasted(hits);
        metrics_->add_result_cache_misses(misses);
    }

    // A fingerprint that cannot be computed cannot be coalesced either.
    if (fingerprints.size() != extracted->size()) return verify_and_cache(ctx, detector, data);

    std::sort(fingerprints.begin(), fingerprints.end());
    auto flight_key = detector.key().loggable();
    for (const auto& fp : fingerprints) {
        flight_key += '|';
        flight_key += fp;
    }

    while (true) {
        auto outcome = flights_.run(ctx, flight_key, [&]() { return verify_and_cache(ctx, detector, data); });
        if (!outcome.value) {
            auto kind = ctx.cancelled() ? DetectorError::Cancelled : DetectorError::Timeout;
            return std::unexpected(DetectorErrorInfo{
                kind, std::format("{}: gave up waiting for in-flight verification", detector.key().loggable())});
        }

        // The leader's context ending says nothing about ours: verify again.
        auto& value = *outcome.value;
        bool leader_aborted = !value && (value.error().error == DetectorError::Cancelled ||
                                         value.error().error == DetectorError::Timeout);
        if (outcome.shared && leader_aborted && !ctx.done()) {
            log::debug(3, "{}: in-flight verification aborted by its caller, retrying", detector.key().loggable());
            continue;
        }
        return std::move(value);
    }
}

DetectionOutcome VerificationCache::verify_and_cache(const Context& ctx, const Detector& detector, std::string_view data) {
    auto start = std::chrono::steady_clock::now();
    auto results = detector.from_data(ctx, true, data);
    metrics_->add_from_data_verify_time_spent(
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start));
    if (!results) return results;
    store(*results);
    return results;
}

} // namespace credscan
