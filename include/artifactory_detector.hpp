#pragma once

#include "cache.hpp"
#include "detector.hpp"
#include "http_client.hpp"
#include <memory>

namespace credscan {

// JFrog Artifactory reference tokens ("cmVmdGtu" prefix) paired with the
// *.jfrog.io instance they belong to. raw_v2 is token followed by host.
class ArtifactoryReferenceTokenDetector final : public Detector {
public:
    ArtifactoryReferenceTokenDetector(std::shared_ptr<HttpClient> client,
                                      std::shared_ptr<Cache<bool>> invalid_hosts,
                                      std::vector<std::string> configured_hosts = {},
                                      bool use_found_hosts = true);

    DetectorType type() const override { return DetectorType::ArtifactoryReferenceToken; }
    std::vector<std::string> keywords() const override { return {"cmvmdgtu"}; }
    std::string description() const override;
    size_t max_credential_span() const override { return 2048; }
    std::expected<std::vector<Result>, DetectorErrorInfo> from_data(
        const Context& ctx, bool verify, std::string_view data) const override;

private:
    std::vector<std::string> hosts_for(std::string_view data) const;

    std::shared_ptr<HttpClient> client_;
    std::shared_ptr<Cache<bool>> invalid_hosts_;
    std::vector<std::string> configured_hosts_;
    bool use_found_hosts_;
};

} // namespace credscan
