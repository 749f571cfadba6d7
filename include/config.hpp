#pragma once

#include "engine.hpp"
#include "http_client.hpp"
#include "source.hpp"
#include <chrono>
#include <expected>
#include <string>
#include <vector>

namespace credscan {

enum class ConfigError {
    MissingCommand,
    UnknownCommand,
    UnknownOption,
    MissingValue,
    InvalidValue
};

struct ConfigErrorInfo {
    ConfigError error;
    std::string message;
};

enum class CacheBackend {
    None,
    Simple,
    Lru,
    Ttl
};

struct ScanConfig {
    std::string command;               // filesystem, stdin, detectors, help
    std::vector<std::string> paths;
    EngineConfig engine;
    HttpConfig http;
    FilesystemOptions filesystem;
    CacheBackend cache_backend = CacheBackend::Simple;
    size_t cache_size = 10000;
    std::chrono::seconds cache_ttl{3600};
    std::vector<std::string> include_detectors;
    std::vector<std::string> exclude_detectors;
    std::vector<std::string> artifactory_hosts;
    bool json = false;
    bool fail_on_results = false;
    bool print_metrics = false;
    bool quiet = false;
    int log_level = 0;
};

// Exit status used with --fail when any result was reported.
inline constexpr int kExitResultsFound = 183;

// Parses argv[1..]. The first positional argument is the command.
std::expected<ScanConfig, ConfigErrorInfo> parse_args(const std::vector<std::string>& args);

std::string usage(std::string_view program);

std::vector<std::string> split_list(std::string_view s, char sep = ',');

} // namespace credscan
