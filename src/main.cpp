#include "cache_metrics.hpp"
#include "config.hpp"
#include "detector_registry.hpp"
#include "engine.hpp"
#include "expiring_cache.hpp"
#include "log.hpp"
#include "lru_cache.hpp"
#include "metrics_cache.hpp"
#include "output.hpp"
#include "source.hpp"
#include "verification_cache.hpp"
#include <chrono>
#include <format>
#include <iostream>
#include <string>
#include <vector>

using namespace credscan;

enum class FSMState {
    Init,
    ParseArgs,
    PreCommand,
    RunCommand,
    PostCommand,
    Error,
    Done
};

struct FSMContext {
    int argc;
    char** argv;
    ScanConfig config;
    int exit_code = 0;
    std::string error_message;
    bool show_usage = false;
    std::chrono::steady_clock::time_point start_time;
    std::shared_ptr<InMemoryCacheMetrics> cache_metrics = std::make_shared<InMemoryCacheMetrics>();
    std::shared_ptr<InMemoryVerificationMetrics> verification_metrics = std::make_shared<InMemoryVerificationMetrics>();
    std::optional<EngineMetrics> engine_metrics;
    bool found_results = false;
};

static std::shared_ptr<Cache<Result>> make_result_cache(const ScanConfig& cfg, const std::shared_ptr<InMemoryCacheMetrics>& metrics) {
    std::shared_ptr<Cache<Result>> backend;
    switch (cfg.cache_backend) {
        case CacheBackend::None:
            return nullptr;
        case CacheBackend::Simple:
            backend = std::make_shared<SimpleCache<Result>>();
            break;
        case CacheBackend::Lru:
            backend = std::make_shared<LruCache<Result>>(cfg.cache_size, "verification", metrics);
            break;
        case CacheBackend::Ttl:
            backend = std::make_shared<ExpiringCache<Result>>(cfg.cache_ttl, std::max<std::chrono::seconds>(cfg.cache_ttl / 2, std::chrono::seconds(1)));
            break;
    }
    return std::make_shared<MetricsCache<Result>>(backend, "verification", metrics);
}

static int cmd_detectors(const ScanConfig& cfg) {
    auto all = default_detectors(DetectorOptions{nullptr, cfg.artifactory_hosts});
    auto selected = select_detectors(std::move(all), cfg.include_detectors, cfg.exclude_detectors);
    if (!selected) {
        log::error("{}", selected.error().message);
        return 1;
    }
    for (const auto& d : *selected) {
        std::string keywords;
        for (const auto& kw : d->keywords()) {
            if (!keywords.empty()) keywords += ", ";
            keywords += kw;
        }
        log::Writer::print(std::format("{:<32} keywords: {}\n", d->key().loggable(), keywords));
    }
    return 0;
}

static int cmd_scan(FSMContext& ctx) {
    const auto& cfg = ctx.config;

    auto http = std::make_shared<HttpClient>(cfg.http);
    auto selected = select_detectors(default_detectors(DetectorOptions{http, cfg.artifactory_hosts}),
                                     cfg.include_detectors, cfg.exclude_detectors);
    if (!selected) {
        log::error("{}", selected.error().message);
        return 1;
    }

    auto verification_cache = std::make_shared<VerificationCache>(make_result_cache(cfg, ctx.cache_metrics),
                                                                  ctx.verification_metrics);

    std::unique_ptr<Printer> printer;
    if (cfg.json) printer = std::make_unique<JsonPrinter>();
    else printer = std::make_unique<PlainPrinter>();

    Engine engine(cfg.engine, std::move(*selected), verification_cache,
                  [&printer](const ResultWithMetadata& r) { printer->print(r); });
    engine.start();

    int rc = 0;
    auto emit = [&engine](Chunk chunk) { engine.scan_chunk(std::move(chunk)); };

    if (cfg.command == "filesystem") {
        std::vector<std::filesystem::path> paths(cfg.paths.begin(), cfg.paths.end());
        FilesystemSource source(std::move(paths), cfg.filesystem);
        auto stats = source.chunks(emit);
        if (!stats) {
            log::error("{}", stats.error().message);
            rc = 1;
        } else {
            log::debug(1, "read {} files ({} skipped, {} bytes)", stats->files_scanned, stats->files_skipped, stats->bytes_read);
        }
    } else {
        Chunk tmpl;
        tmpl.source_name = "stdin";
        tmpl.verify = cfg.engine.verify;
        auto read = read_chunks(std::cin, tmpl, emit);
        if (!read) {
            log::error("{}", read.error().message);
            rc = 1;
        }
    }

    engine.finish();
    ctx.engine_metrics = engine.metrics();
    ctx.found_results = engine.has_found_results();
    return rc;
}

int main(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                ctx.start_time = std::chrono::steady_clock::now();
                if (ctx.argc < 2) {
                    ctx.exit_code = 1;
                    ctx.show_usage = true;
                    state = FSMState::Error;
                } else {
                    state = FSMState::ParseArgs;
                }
                break;
            case FSMState::ParseArgs: {
                auto parsed = parse_args(std::vector<std::string>(ctx.argv + 1, ctx.argv + ctx.argc));
                if (!parsed) {
                    ctx.exit_code = 1;
                    ctx.error_message = parsed.error().message;
                    ctx.show_usage = true;
                    state = FSMState::Error;
                    break;
                }
                ctx.config = std::move(*parsed);
                state = FSMState::PreCommand;
                break;
            }
            case FSMState::PreCommand:
                log::set_verbosity(ctx.config.log_level);
                log::set_quiet(ctx.config.quiet);
                if (ctx.config.command == "help") {
                    log::Writer::print(usage(ctx.argv[0]));
                    state = FSMState::Done;
                    break;
                }
                log::debug(1, "command {} with {} paths", ctx.config.command, ctx.config.paths.size());
                state = FSMState::RunCommand;
                break;
            case FSMState::RunCommand:
                if (ctx.config.command == "detectors") {
                    ctx.exit_code = cmd_detectors(ctx.config);
                    state = FSMState::Done;
                } else {
                    ctx.exit_code = cmd_scan(ctx);
                    state = FSMState::PostCommand;
                }
                break;
            case FSMState::PostCommand: {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - ctx.start_time);
                if (ctx.engine_metrics) {
                    const auto& m = *ctx.engine_metrics;
                    log::info("finished scanning chunks={} bytes={} verified_secrets={} unverified_secrets={} "
                              "unknown_secrets={} detector_errors={} scan_duration={}",
                              m.chunks_scanned, m.bytes_scanned, m.verified_secrets_found, m.unverified_secrets_found,
                              m.unknown_secrets_found, m.detector_errors, elapsed);
                }
                if (ctx.config.print_metrics || log::enabled(1)) {
                    const auto& v = *ctx.verification_metrics;
                    log::info("verification cache: hits={} misses={} wasted_hits={} verifications_saved={} verify_time={}ms",
                              v.result_cache_hits(), v.result_cache_misses(), v.result_cache_hits_wasted(),
                              v.credential_verifications_saved(), v.from_data_verify_time_spent_ms());
                    for (const auto& [name, c] : ctx.cache_metrics->snapshot()) {
                        log::info("cache {}: hits={} misses={} sets={} evictions={} hit_rate={:.2f}",
                                  name, c.hits, c.misses, c.sets, c.evictions, c.hit_rate());
                    }
                }
                if (ctx.exit_code == 0 && ctx.config.fail_on_results && ctx.found_results) {
                    ctx.exit_code = kExitResultsFound;
                }
                state = FSMState::Done;
                break;
            }
            case FSMState::Error:
                if (!ctx.error_message.empty()) log::error("{}", ctx.error_message);
                if (ctx.show_usage) log::Writer::error(usage(ctx.argc > 0 ? ctx.argv[0] : "credscan"));
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}
