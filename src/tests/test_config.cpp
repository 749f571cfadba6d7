#include "config.hpp"
#include <cassert>
#include <iostream>

using namespace credscan;

void test_parse_args() {
    std::cout << "Testing argument parsing...\n\n";

    {
        auto cfg = parse_args({"filesystem", "src", "docs", "--json", "--concurrency=3", "--results", "verified,unknown",
                               "--no-verification", "--fail"});
        assert(cfg.has_value());
        assert(cfg->command == "filesystem");
        assert((cfg->paths == std::vector<std::string>{"src", "docs"}));
        assert(cfg->json);
        assert(cfg->fail_on_results);
        assert(cfg->engine.concurrency == 3);
        assert(cfg->engine.results.verified && cfg->engine.results.unknown && !cfg->engine.results.unverified);
        assert(!cfg->engine.verify && !cfg->filesystem.verify);
        std::cout << "✓ Test 1 passed: command, paths and flags\n";
    }

    {
        auto cfg = parse_args({"stdin"});
        assert(cfg.has_value());
        assert(cfg->cache_backend == CacheBackend::Simple);
        assert(cfg->engine.verify);
        assert(cfg->engine.results.verified && cfg->engine.results.unknown && cfg->engine.results.unverified);
        assert(cfg->engine.detection_timeout == std::chrono::seconds(10));
        assert(cfg->log_level == 0);
        std::cout << "✓ Test 2 passed: defaults\n";
    }

    {
        auto cfg = parse_args({"stdin", "--verification-cache=ttl", "--cache-ttl", "5m", "--detection-timeout=500ms",
                               "--http-timeout", "30", "--cache-size=42", "--filter-entropy=3.5"});
        assert(cfg.has_value());
        assert(cfg->cache_backend == CacheBackend::Ttl);
        assert(cfg->cache_ttl == std::chrono::minutes(5));
        assert(cfg->engine.detection_timeout == std::chrono::milliseconds(500));
        assert(cfg->http.timeout_seconds == 30);
        assert(cfg->cache_size == 42);
        assert(cfg->engine.filter_entropy == 3.5);
        std::cout << "✓ Test 3 passed: durations and cache options\n";
    }

    {
        auto cfg = parse_args({"filesystem", ".", "--include-detectors", "github.v2, huggingface",
                               "--exclude-detectors=sugester", "--artifactory-host", "a.jfrog.io",
                               "--artifactory-host=b.jfrog.io", "--exclude-paths", "LOG,.tmp", "--max-file-size=1024",
                               "--debug"});
        assert(cfg.has_value());
        assert((cfg->include_detectors == std::vector<std::string>{"github.v2", "huggingface"}));
        assert((cfg->exclude_detectors == std::vector<std::string>{"sugester"}));
        assert(cfg->artifactory_hosts.size() == 2);
        assert((cfg->filesystem.skip_extensions == std::vector<std::string>{".log", ".tmp"}));
        assert(cfg->filesystem.max_file_size == 1024);
        assert(cfg->log_level == 2);
        std::cout << "✓ Test 4 passed: list options\n";
    }

    {
        assert(parse_args({}).error().error == ConfigError::MissingCommand);
        assert(parse_args({"git"}).error().error == ConfigError::UnknownCommand);
        assert(parse_args({"filesystem"}).error().error == ConfigError::MissingValue);
        assert(parse_args({"stdin", "--bogus"}).error().error == ConfigError::UnknownOption);
        assert(parse_args({"stdin", "--concurrency"}).error().error == ConfigError::MissingValue);
        assert(parse_args({"stdin", "--concurrency=many"}).error().error == ConfigError::InvalidValue);
        assert(parse_args({"stdin", "--results=all"}).error().error == ConfigError::InvalidValue);
        assert(parse_args({"stdin", "--cache-ttl=0"}).error().error == ConfigError::InvalidValue);
        assert(parse_args({"stdin", "--cache-ttl=5d"}).error().error == ConfigError::InvalidValue);
        assert(parse_args({"stdin", "--verification-cache=redis"}).error().error == ConfigError::InvalidValue);
        assert(parse_args({"stdin", "--filter-entropy=-1"}).error().error == ConfigError::InvalidValue);
        std::cout << "✓ Test 5 passed: invalid arguments rejected\n";
    }

    {
        assert(parse_args({"--help"})->command == "help");
        assert(parse_args({"detectors"})->command == "detectors");
        assert(usage("credscan").find("filesystem <path>") != std::string::npos);
        std::cout << "✓ Test 6 passed: help and detectors commands\n";
    }

    {
        assert((split_list(" a, b ,,c ") == std::vector<std::string>{"a", "b", "c"}));
        assert(split_list("").empty());
        assert((split_list("x:y", ':') == std::vector<std::string>{"x", "y"}));
        std::cout << "✓ Test 7 passed: split_list\n";
    }
}

int main() {
    try {
        test_parse_args();
        std::cout << "\n✅ All tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
