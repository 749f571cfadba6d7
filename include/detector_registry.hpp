#pragma once

#include "detector.hpp"
#include "http_client.hpp"
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace credscan {

struct DetectorOptions {
    std::shared_ptr<HttpClient> http_client;
    std::vector<std::string> artifactory_hosts;
};

enum class RegistryError {
    UnknownDetector
};

struct RegistryErrorInfo {
    RegistryError error;
    std::string message;
};

// Every built-in detector ordered by name. Each detector that remembers
// unresolvable hosts gets its own cache.
std::vector<std::shared_ptr<Detector>> default_detectors(const DetectorOptions& options);

// Applies comma-separated include/exclude lists of detector names. Names are
// matched case-insensitively; "github.v1" style suffixes pick one version.
std::expected<std::vector<std::shared_ptr<Detector>>, RegistryErrorInfo> select_detectors(
    std::vector<std::shared_ptr<Detector>> detectors, const std::vector<std::string>& include,
    const std::vector<std::string>& exclude);

} // namespace credscan
