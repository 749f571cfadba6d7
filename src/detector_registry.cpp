#include "detector_registry.hpp"
#include "artifactory_detector.hpp"
#include "azure_cosmosdb_detector.hpp"
#include "github_detector.hpp"
#include "huggingface_detector.hpp"
#include "sugester_detector.hpp"
#include <algorithm>
#include <charconv>
#include <format>

namespace credscan {

namespace {

struct Selector {
    DetectorType type;
    int version = -1;  // -1 selects every version

    bool matches(const Detector& d) const {
        return d.type() == type && (version < 0 || d.version() == version);
    }
};

std::expected<Selector, RegistryErrorInfo> parse_selector(const std::string& name) {
    std::string_view base = name;
    int version = -1;
    if (auto dot = name.find(".v"); dot != std::string::npos) {
        base = std::string_view(name).substr(0, dot);
        auto digits = std::string_view(name).substr(dot + 2);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), version);
        if (ec != std::errc() || ptr != digits.data() + digits.size()) {
            return std::unexpected(RegistryErrorInfo{RegistryError::UnknownDetector,
                                                     std::format("invalid detector version in '{}'", name)});
        }
    }
    auto type = detector_type_from_string(base);
    if (!type) {
        return std::unexpected(RegistryErrorInfo{RegistryError::UnknownDetector,
                                                 std::format("unknown detector '{}'", name)});
    }
    return Selector{*type, version};
}

} // namespace

std::vector<std::shared_ptr<Detector>> default_detectors(const DetectorOptions& options) {
    auto client = options.http_client;
    std::vector<std::shared_ptr<Detector>> detectors{
        std::make_shared<ArtifactoryReferenceTokenDetector>(client, std::make_shared<SimpleCache<bool>>(),
                                                            options.artifactory_hosts),
        std::make_shared<AzureCosmosDBDetector>(client, std::make_shared<SimpleCache<bool>>()),
        std::make_shared<GitHubLegacyDetector>(client),
        std::make_shared<GitHubDetector>(client),
        std::make_shared<HuggingFaceDetector>(client),
        std::make_shared<SugesterDetector>(client),
    };
    std::stable_sort(detectors.begin(), detectors.end(), [](const auto& a, const auto& b) {
        return std::pair(to_string(a->type()), a->version()) < std::pair(to_string(b->type()), b->version());
    });
    return detectors;
}

std::expected<std::vector<std::shared_ptr<Detector>>, RegistryErrorInfo> select_detectors(
    std::vector<std::shared_ptr<Detector>> detectors, const std::vector<std::string>& include,
    const std::vector<std::string>& exclude) {
    std::vector<Selector> includes;
    std::vector<Selector> excludes;
    for (const auto& name : include) {
        auto s = parse_selector(name);
        if (!s) return std::unexpected(s.error());
        includes.push_back(*s);
    }
    for (const auto& name : exclude) {
        auto s = parse_selector(name);
        if (!s) return std::unexpected(s.error());
        excludes.push_back(*s);
    }

    std::erase_if(detectors, [&](const std::shared_ptr<Detector>& d) {
        bool included = includes.empty() ||
                        std::any_of(includes.begin(), includes.end(), [&](const Selector& s) { return s.matches(*d); });
        bool excluded = std::any_of(excludes.begin(), excludes.end(), [&](const Selector& s) { return s.matches(*d); });
        return !included || excluded;
    });
    return detectors;
}

} // namespace credscan
