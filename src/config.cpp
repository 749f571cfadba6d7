#include "config.hpp"
#include "encoding.hpp"
#include <algorithm>
#include <charconv>
#include <format>
#include <optional>

namespace credscan {

namespace {

template <typename T>
std::expected<T, ConfigErrorInfo> parse_number(std::string_view flag, std::string_view value) {
    T out{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
                                               std::format("invalid value '{}' for {}", value, flag)});
    }
    return out;
}

// Accepts "30", "30s", "500ms", "5m", "1h".
std::expected<std::chrono::milliseconds, ConfigErrorInfo> parse_duration(std::string_view flag, std::string_view value) {
    std::string_view digits = value;
    long long scale = 1000;
    if (value.ends_with("ms")) { digits.remove_suffix(2); scale = 1; }
    else if (value.ends_with('s')) { digits.remove_suffix(1); }
    else if (value.ends_with('m')) { digits.remove_suffix(1); scale = 60 * 1000; }
    else if (value.ends_with('h')) { digits.remove_suffix(1); scale = 3600 * 1000; }
    auto n = parse_number<long long>(flag, digits);
    if (!n) return std::unexpected(n.error());
    if (*n <= 0) {
        return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
                                               std::format("{} must be positive", flag)});
    }
    return std::chrono::milliseconds(*n * scale);
}

std::expected<ResultsFilter, ConfigErrorInfo> parse_results(std::string_view value) {
    ResultsFilter f{false, false, false};
    for (const auto& item : split_list(value)) {
        if (item == "verified") f.verified = true;
        else if (item == "unknown") f.unknown = true;
        else if (item == "unverified") f.unverified = true;
        else if (item == "filtered_unverified") f.unverified = true;
        else {
            return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
                                                   std::format("invalid --results value '{}'", item)});
        }
    }
    return f;
}

std::expected<CacheBackend, ConfigErrorInfo> parse_backend(std::string_view value) {
    if (value == "none") return CacheBackend::None;
    if (value == "simple") return CacheBackend::Simple;
    if (value == "lru") return CacheBackend::Lru;
    if (value == "ttl") return CacheBackend::Ttl;
    return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
                                           std::format("invalid --verification-cache value '{}'", value)});
}

} // namespace

std::vector<std::string> split_list(std::string_view s, char sep) {
    std::vector<std::string> out;
    while (!s.empty()) {
        auto pos = s.find(sep);
        auto item = s.substr(0, pos);
        while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
        while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
        if (!item.empty()) out.emplace_back(item);
        if (pos == std::string_view::npos) break;
        s.remove_prefix(pos + 1);
    }
    return out;
}

std::expected<ScanConfig, ConfigErrorInfo> parse_args(const std::vector<std::string>& args) {
    ScanConfig cfg;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];

        if (!arg.starts_with("--")) {
            if (cfg.command.empty()) cfg.command = arg;
            else cfg.paths.emplace_back(arg);
            continue;
        }

        std::string_view name = arg;
        std::optional<std::string> inline_value;
        if (auto eq = arg.find('='); eq != std::string_view::npos) {
            name = arg.substr(0, eq);
            inline_value = std::string(arg.substr(eq + 1));
        }
        auto value = [&]() -> std::expected<std::string, ConfigErrorInfo> {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size()) {
                return std::unexpected(ConfigErrorInfo{ConfigError::MissingValue,
                                                       std::format("{} requires a value", name)});
            }
            return args[++i];
        };

        if (name == "--help" || name == "-h") { cfg.command = "help"; }
        else if (name == "--json") { cfg.json = true; }
        else if (name == "--fail") { cfg.fail_on_results = true; }
        else if (name == "--no-verification") { cfg.engine.verify = false; cfg.filesystem.verify = false; }
        else if (name == "--filter-unverified") { cfg.engine.filter_unverified = true; }
        else if (name == "--force-cache-update") { cfg.engine.force_cache_update = true; }
        else if (name == "--scan-entire-chunk") { cfg.engine.scan_entire_chunk = true; }
        else if (name == "--retain-false-positives") { cfg.engine.retain_false_positives = true; }
        else if (name == "--print-metrics") { cfg.print_metrics = true; }
        else if (name == "--no-http2") { cfg.http.enable_http2 = false; }
        else if (name == "--quiet") { cfg.quiet = true; }
        else if (name == "--debug") { cfg.log_level = std::max(cfg.log_level, 2); }
        else if (name == "--trace") { cfg.log_level = std::max(cfg.log_level, 5); }
        else {
            auto v = value();
            if (!v) return std::unexpected(v.error());

            if (name == "--log-level") {
                auto n = parse_number<int>(name, *v);
                if (!n) return std::unexpected(n.error());
                cfg.log_level = *n;
            } else if (name == "--concurrency") {
                auto n = parse_number<size_t>(name, *v);
                if (!n) return std::unexpected(n.error());
                cfg.engine.concurrency = *n;
            } else if (name == "--results") {
                auto f = parse_results(*v);
                if (!f) return std::unexpected(f.error());
                cfg.engine.results = *f;
            } else if (name == "--filter-entropy") {
                double d = 0.0;
                auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), d);
                if (ec != std::errc() || ptr != v->data() + v->size() || d < 0.0) {
                    return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
                                                           std::format("invalid value '{}' for {}", *v, name)});
                }
                cfg.engine.filter_entropy = d;
            } else if (name == "--verification-cache") {
                auto b = parse_backend(*v);
                if (!b) return std::unexpected(b.error());
                cfg.cache_backend = *b;
            } else if (name == "--cache-size") {
                auto n = parse_number<size_t>(name, *v);
                if (!n) return std::unexpected(n.error());
                cfg.cache_size = *n;
            } else if (name == "--cache-ttl") {
                auto d = parse_duration(name, *v);
                if (!d) return std::unexpected(d.error());
                cfg.cache_ttl = std::chrono::duration_cast<std::chrono::seconds>(*d);
                if (cfg.cache_ttl.count() == 0) cfg.cache_ttl = std::chrono::seconds(1);
            } else if (name == "--detection-timeout") {
                auto d = parse_duration(name, *v);
                if (!d) return std::unexpected(d.error());
                cfg.engine.detection_timeout = *d;
            } else if (name == "--http-timeout") {
                auto d = parse_duration(name, *v);
                if (!d) return std::unexpected(d.error());
                cfg.http.timeout_seconds = std::max<long>(1, static_cast<long>(d->count() / 1000));
            } else if (name == "--include-detectors") {
                cfg.include_detectors = split_list(*v);
            } else if (name == "--exclude-detectors") {
                cfg.exclude_detectors = split_list(*v);
            } else if (name == "--artifactory-host") {
                cfg.artifactory_hosts.push_back(*v);
            } else if (name == "--max-file-size") {
                auto n = parse_number<size_t>(name, *v);
                if (!n) return std::unexpected(n.error());
                cfg.filesystem.max_file_size = *n;
            } else if (name == "--exclude-paths") {
                for (auto& ext : split_list(*v)) {
                    if (!ext.starts_with('.')) ext.insert(0, ".");
                    cfg.filesystem.skip_extensions.push_back(to_lower_ascii(ext));
                }
            } else {
                return std::unexpected(ConfigErrorInfo{ConfigError::UnknownOption,
                                                       std::format("unknown option {}", name)});
            }
        }
    }

    if (cfg.command.empty()) {
        return std::unexpected(ConfigErrorInfo{ConfigError::MissingCommand, "no command given"});
    }
    if (cfg.command != "filesystem" && cfg.command != "stdin" && cfg.command != "detectors" && cfg.command != "help") {
        return std::unexpected(ConfigErrorInfo{ConfigError::UnknownCommand,
                                               std::format("unknown command '{}'", cfg.command)});
    }
    if (cfg.command == "filesystem" && cfg.paths.empty()) {
        return std::unexpected(ConfigErrorInfo{ConfigError::MissingValue, "filesystem requires at least one path"});
    }
    return cfg;
}

std::string usage(std::string_view program) {
    return std::format(
        "credscan: find and verify leaked credentials (C++23)\n\n"
        "Usage: {} <command> [options]\n\n"
        "Commands:\n"
        "  filesystem <path>...            Scan files and directories\n"
        "  stdin                           Scan standard input\n"
        "  detectors                       List available detectors\n\n"
        "Options:\n"
        "  --json                          Print results as JSON lines\n"
        "  --results <list>                verified,unknown,unverified (default: all)\n"
        "  --no-verification               Do not contact providers\n"
        "  --filter-unverified             Keep one unverified result per match\n"
        "  --filter-entropy <bits>         Drop unverified results below this entropy\n"
        "  --retain-false-positives        Report results that look like placeholders\n"
        "  --verification-cache <kind>     none|simple|lru|ttl (default: simple)\n"
        "  --cache-size <n>                Capacity of the lru cache\n"
        "  --cache-ttl <duration>          Lifetime of ttl cache entries\n"
        "  --force-cache-update            Verify again and overwrite cached outcomes\n"
        "  --include-detectors <list>      Only run these detectors (e.g. github.v2)\n"
        "  --exclude-detectors <list>      Never run these detectors\n"
        "  --artifactory-host <host>       Also verify Artifactory tokens against host\n"
        "  --detection-timeout <duration>  Per detector call limit (default: 10s)\n"
        "  --http-timeout <duration>       Per request limit (default: 10s)\n"
        "  --concurrency <n>               Worker threads\n"
        "  --scan-entire-chunk             Give detectors the whole chunk\n"
        "  --max-file-size <bytes>         Skip larger files\n"
        "  --exclude-paths <exts>          Extra file extensions to skip\n"
        "  --fail                          Exit with 183 when results are found\n"
        "  --print-metrics                 Print scan and cache metrics\n"
        "  --quiet | --debug | --trace | --log-level <n>\n",
        program);
}

} // namespace credscan
