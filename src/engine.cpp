#include "engine.hpp"
#include "encoding.hpp"
#include "log.hpp"
#include <algorithm>
#include <format>

namespace credscan {

Engine::Engine(EngineConfig config, std::vector<std::shared_ptr<Detector>> detectors,
               std::shared_ptr<VerificationCache> verification_cache, ResultSink sink)
    : config_(std::move(config)),
      matcher_(std::move(detectors), config_.scan_entire_chunk
                                         ? std::unique_ptr<SpanCalculator>(std::make_unique<EntireChunkSpanCalculator>())
                                         : std::unique_ptr<SpanCalculator>(std::make_unique<AdjustableSpanCalculator>())),
      decoders_(default_decoders()),
      verification_cache_(verification_cache ? std::move(verification_cache) : std::make_shared<VerificationCache>()),
      sink_(std::move(sink)),
      dedupe_(config_.dedupe_cache_size, "dedupe") {
    if (config_.concurrency == 0) config_.concurrency = std::max(1u, std::thread::hardware_concurrency());
    queue_capacity_ = config_.queue_capacity > 0 ? config_.queue_capacity : config_.concurrency * 8;
}

Engine::~Engine() {
    finish();
}

void Engine::start() {
    if (!workers_.empty()) return;
    started_at_ = std::chrono::steady_clock::now();
    log::debug(1, "starting engine with {} workers and {} detectors", config_.concurrency, matcher_.detectors().size());
    workers_.reserve(config_.concurrency);
    for (size_t i = 0; i < config_.concurrency; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

void Engine::scan_chunk(Chunk chunk) {
    std::unique_lock lock(queue_mutex_);
    space_cv_.wait(lock, [this] { return queue_.size() < queue_capacity_ || stopping_; });
    if (stopping_) return;
    queue_.push_back(std::move(chunk));
    queue_cv_.notify_one();
}

void Engine::finish() {
    {
        std::lock_guard lock(queue_mutex_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
    }
    queue_cv_.notify_all();
    space_cv_.notify_all();
    workers_.clear();
    if (started_at_ != std::chrono::steady_clock::time_point{}) {
        duration_ = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at_);
    }
}

void Engine::cancel() {
    stop_source_.request_stop();
    {
        std::lock_guard lock(queue_mutex_);
        queue_.clear();
        stopping_ = true;
    }
    queue_cv_.notify_all();
    space_cv_.notify_all();
}

EngineMetrics Engine::metrics() const {
    EngineMetrics m;
    m.chunks_scanned = chunks_scanned_.load();
    m.bytes_scanned = bytes_scanned_.load();
    m.verified_secrets_found = verified_.load();
    m.unverified_secrets_found = unverified_.load();
    m.unknown_secrets_found = unknown_.load();
    m.detector_errors = detector_errors_.load();
    m.scan_duration = duration_;
    return m;
}

void Engine::worker_loop() {
    while (true) {
        Chunk chunk;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || stopping_; });
            if (queue_.empty()) return;
            chunk = std::move(queue_.front());
            queue_.pop_front();
        }
        space_cv_.notify_one();
        process_chunk(chunk);
    }
}

void Engine::process_chunk(const Chunk& chunk) {
    chunks_scanned_.fetch_add(1, std::memory_order_relaxed);
    bytes_scanned_.fetch_add(chunk.data.size(), std::memory_order_relaxed);

    for (const auto& decoder : decoders_) {
        auto decoded = decoder->decode(chunk.data);
        if (!decoded) continue;

        for (const auto& match : matcher_.find_detector_matches(*decoded)) {
            const auto& detector = *match.detector();
            for (auto span : match.matches(*decoded)) {
                if (stop_source_.stop_requested()) return;

                auto ctx = Context(stop_source_.get_token()).with_timeout(config_.detection_timeout);
                auto results = verification_cache_->from_data(ctx, detector, chunk.verify && config_.verify,
                                                              config_.force_cache_update, span);
                if (!results) {
                    detector_errors_.fetch_add(1, std::memory_order_relaxed);
                    log::error("{} failed on {}: {}", match.key().loggable(),
                               chunk.file.empty() ? chunk.source_name : chunk.file, results.error().message);
                    continue;
                }

                auto kept = filter_results(detector, std::move(*results));
                for (auto& r : kept) process_result(chunk, *decoded, decoder->type(), detector, std::move(r));
            }
        }
    }
}

std::vector<Result> Engine::filter_results(const Detector& detector, std::vector<Result> results) const {
    if (config_.filter_unverified || detector.clean_results_irrespective_of_configuration()) {
        results = detector.clean_results(std::move(results));
    }

    if (!config_.retain_false_positives) {
        std::erase_if(results, [&](const Result& r) {
            if (r.verified) return false;
            if (r.raw.empty()) {
                log::error("{} returned an unverified result with no raw value", detector.key().loggable());
                return true;
            }
            if (auto reason = detector.is_false_positive(r)) {
                log::debug(3, "dropping {} result: known false positive ({})", detector.key().loggable(), *reason);
                return true;
            }
            return false;
        });
    }

    if (config_.filter_entropy > 0.0) {
        std::erase_if(results, [&](const Result& r) {
            return !r.verified && !r.raw.empty() && shannon_entropy(r.raw) < config_.filter_entropy;
        });
    }
    return results;
}

void Engine::process_result(const Chunk& chunk, std::string_view decoded, DecoderType decoder,
                            const Detector& detector, Result result) {
    // The dedupe LRU keeps FNV-1a digests rather than raw secrets.
    auto dedupe_key = std::format("{}\x1f{}\x1f{}\x1f", chunk.source_name, chunk.file,
                                  static_cast<int>(result.detector_type));
    dedupe_key += result.raw;
    dedupe_key += '\x1f';
    dedupe_key += result.raw_v2;
    if (auto digest = dedupe_hasher_.hash(dedupe_key)) {
        dedupe_key = to_hex(*digest);
    } else {
        log::debug(4, "dedupe key kept unhashed: {}", digest.error().message);
    }
    {
        // The first decoder to surface a secret in a file reports it; later
        // sightings, including the overlap between adjacent chunks, are dropped.
        std::lock_guard lock(dedupe_mutex_);
        if (auto seen = dedupe_.get(dedupe_key)) {
            log::debug(4, "{} result already reported via {} decoder", detector.key().loggable(), to_string(*seen));
            return;
        }
        dedupe_.set(dedupe_key, decoder);
    }

    result.decoder_type = decoder;

    ResultWithMetadata out;
    out.source_name = chunk.source_name;
    out.file = chunk.file;
    out.line = chunk.line;
    if (decoder == DecoderType::Plain && !result.raw.empty()) {
        if (auto pos = decoded.find(result.raw); pos != std::string_view::npos) {
            out.line += std::count(decoded.begin(), decoded.begin() + static_cast<std::ptrdiff_t>(pos), '\n');
        }
    }
    out.decoder_type = decoder;
    out.detector_description = detector.description();
    if (config_.retain_false_positives && !result.verified && !result.raw.empty()) {
        out.is_false_positive = detector.is_false_positive(result).has_value();
    }

    bool unknown = !result.verified && result.verification_error().has_value();
    if (result.verified) verified_.fetch_add(1, std::memory_order_relaxed);
    else if (unknown) unknown_.fetch_add(1, std::memory_order_relaxed);
    else unverified_.fetch_add(1, std::memory_order_relaxed);

    bool wanted = result.verified ? config_.results.verified
                                  : (unknown ? config_.results.unknown : config_.results.unverified);
    if (!wanted) return;

    out.result = std::move(result);
    found_results_.store(true);
    std::lock_guard lock(sink_mutex_);
    if (sink_) sink_(out);
}

} // namespace credscan
