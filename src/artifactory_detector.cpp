#include "artifactory_detector.hpp"
#include "log.hpp"
#include "verifier.hpp"
#include <algorithm>
#include <format>
#include <regex>

namespace credscan {

ArtifactoryReferenceTokenDetector::ArtifactoryReferenceTokenDetector(std::shared_ptr<HttpClient> client,
                                                                     std::shared_ptr<Cache<bool>> invalid_hosts,
                                                                     std::vector<std::string> configured_hosts,
                                                                     bool use_found_hosts)
    : client_(std::move(client)),
      invalid_hosts_(invalid_hosts ? std::move(invalid_hosts) : std::make_shared<SimpleCache<bool>>()),
      configured_hosts_(std::move(configured_hosts)),
      use_found_hosts_(use_found_hosts) {}

std::string ArtifactoryReferenceTokenDetector::description() const {
    return "JFrog Artifactory is a binary repository manager. Reference tokens authenticate API "
           "calls against an Artifactory instance.";
}

std::vector<std::string> ArtifactoryReferenceTokenDetector::hosts_for(std::string_view data) const {
    static const std::regex host_pattern(R"(\b([a-zA-Z0-9][a-zA-Z0-9-]*\.jfrog\.io)\b)");

    std::vector<std::string> hosts = configured_hosts_;
    if (use_found_hosts_) {
        for (auto& host : find_unique_submatches(host_pattern, data)) {
            if (std::find(hosts.begin(), hosts.end(), host) == hosts.end()) hosts.push_back(std::move(host));
        }
    }
    return hosts;
}

std::expected<std::vector<Result>, DetectorErrorInfo> ArtifactoryReferenceTokenDetector::from_data(
    const Context& ctx, bool verify, std::string_view data) const {
    static const std::regex token_pattern(R"(\b(cmVmdGtu[A-Za-z0-9]{56})\b)");

    auto tokens = find_unique_submatches(token_pattern, data);
    if (tokens.empty()) return std::vector<Result>{};

    std::vector<Result> results;
    for (const auto& host : hosts_for(data)) {
        if (invalid_hosts_->exists(host)) {
            log::debug(2, "skipping known invalid artifactory host {}", host);
            continue;
        }
        for (const auto& token : tokens) {
            Result r;
            r.detector_type = DetectorType::ArtifactoryReferenceToken;
            r.raw = token;
            r.raw_v2 = token + host;
            r.extra_data["host"] = host;

            if (verify && client_) {
                auto res = client_->get(ctx, std::format("https://{}/artifactory/api/system/version", host), {
                    {"Authorization", "Bearer " + token},
                });
                if (!res) {
                    if (auto abort = context_abort(ctx, key(), res.error())) return std::unexpected(*abort);
                    if (res.error().error == HttpError::HostNotFound) {
                        invalid_hosts_->set(host, true);
                        break;
                    }
                    r.set_verification_error(res.error().message, {token});
                } else if (res->status_code == 200) {
                    r.verified = true;
                } else if (res->status_code != 401 && res->status_code != 403) {
                    r.set_verification_error(unexpected_status(res->status_code), {token});
                }
            }
            results.push_back(std::move(r));
        }
    }
    return results;
}

} // namespace credscan
