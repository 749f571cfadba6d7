#pragma once

#include "decoders.hpp"
#include "detector_matcher.hpp"
#include "hasher.hpp"
#include "lru_cache.hpp"
#include "source.hpp"
#include "verification_cache.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace credscan {

// Which verification outcomes reach the sink.
struct ResultsFilter {
    bool verified = true;
    bool unknown = true;     // verification attempted but errored
    bool unverified = true;
};

struct EngineConfig {
    size_t concurrency = 0;  // 0 uses hardware_concurrency
    bool verify = true;
    bool filter_unverified = false;
    double filter_entropy = 0.0;
    bool retain_false_positives = false;
    bool scan_entire_chunk = false;
    bool force_cache_update = false;  // verify every result again and overwrite cached outcomes
    ResultsFilter results;
    std::chrono::milliseconds detection_timeout{10000};
    size_t dedupe_cache_size = 1000;
    size_t queue_capacity = 0;  // 0 uses 8 * concurrency
};

struct ResultWithMetadata {
    Result result;
    std::string source_name;
    std::string file;
    int64_t line = 0;
    DecoderType decoder_type = DecoderType::Unknown;
    std::string detector_description;
    bool is_false_positive = false;
};

struct EngineMetrics {
    uint64_t chunks_scanned = 0;
    uint64_t bytes_scanned = 0;
    uint64_t verified_secrets_found = 0;
    uint64_t unverified_secrets_found = 0;
    uint64_t unknown_secrets_found = 0;
    uint64_t detector_errors = 0;
    std::chrono::milliseconds scan_duration{0};
};

using ResultSink = std::function<void(const ResultWithMetadata&)>;

// Scans chunks on a pool of worker threads. Each chunk is decoded, matched
// against detector keywords, and every matched span is handed to the
// detector through the verification cache. Surviving results go to the
// sink, one call at a time.
class Engine {
public:
    Engine(EngineConfig config, std::vector<std::shared_ptr<Detector>> detectors,
           std::shared_ptr<VerificationCache> verification_cache, ResultSink sink);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    void start();

    // Queues a chunk; blocks while the queue is full.
    void scan_chunk(Chunk chunk);

    // Waits for queued chunks to drain and joins the workers.
    void finish();

    // Aborts in-flight verifications and drops queued chunks.
    void cancel();

    EngineMetrics metrics() const;
    bool has_found_results() const { return found_results_.load(); }
    const DetectorMatcher& matcher() const { return matcher_; }

private:
    void worker_loop();
    void process_chunk(const Chunk& chunk);
    std::vector<Result> filter_results(const Detector& detector, std::vector<Result> results) const;
    void process_result(const Chunk& chunk, std::string_view decoded, DecoderType decoder,
                        const Detector& detector, Result result);

    EngineConfig config_;
    DetectorMatcher matcher_;
    std::vector<std::unique_ptr<Decoder>> decoders_;
    std::shared_ptr<VerificationCache> verification_cache_;
    ResultSink sink_;
    LruCache<DecoderType> dedupe_;
    Fnv64aHasher dedupe_hasher_;
    std::mutex dedupe_mutex_;

    std::deque<Chunk> queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable space_cv_;
    bool stopping_ = false;
    size_t queue_capacity_ = 0;
    std::vector<std::jthread> workers_;
    std::stop_source stop_source_;

    std::mutex sink_mutex_;
    std::atomic<bool> found_results_{false};
    std::atomic<uint64_t> chunks_scanned_{0};
    std::atomic<uint64_t> bytes_scanned_{0};
    std::atomic<uint64_t> verified_{0};
    std::atomic<uint64_t> unverified_{0};
    std::atomic<uint64_t> unknown_{0};
    std::atomic<uint64_t> detector_errors_{0};
    std::chrono::steady_clock::time_point started_at_{};
    std::chrono::milliseconds duration_{0};
};

} // namespace credscan
