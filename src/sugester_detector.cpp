#include "sugester_detector.hpp"
#include "encoding.hpp"
#include "verifier.hpp"
#include <format>
#include <regex>

namespace credscan {

SugesterDetector::SugesterDetector(std::shared_ptr<HttpClient> client) : client_(std::move(client)) {}

std::string SugesterDetector::description() const {
    return "Sugester is a customer support and CRM platform. API keys give access to the account's data.";
}

std::expected<std::vector<Result>, DetectorErrorInfo> SugesterDetector::from_data(
    const Context& ctx, bool verify, std::string_view data) const {
    static const std::regex key_pattern(prefix_regex({"sugester"}) + R"(\b([a-zA-Z0-9]{32})\b)");
    static const std::regex domain_pattern(R"(\b([a-z0-9][a-z0-9-]{1,30})\.sugester\.(?:com|pl)\b)");

    auto domains = find_unique_submatches(domain_pattern, data);

    std::vector<Result> results;
    for (const auto& api_key : find_unique_submatches(key_pattern, data)) {
        Result r;
        r.detector_type = DetectorType::Sugester;
        r.raw = api_key;
        std::string domain = domains.empty() ? std::string{} : domains.front();
        if (!domain.empty()) {
            r.raw_v2 = api_key + domain;
            r.extra_data["domain"] = domain;
        }

        if (verify && client_) {
            if (domain.empty()) {
                r.set_verification_error("no sugester account domain found near the key");
            } else {
                auto url = std::format("https://{}.sugester.com/app/api/v1/account.json?api_token={}",
                                       domain, query_escape(api_key));
                auto res = client_->get(ctx, url);
                if (!res) {
                    if (auto abort = context_abort(ctx, key(), res.error())) return std::unexpected(*abort);
                    r.set_verification_error(res.error().message, {api_key});
                } else if (res->status_code == 200) {
                    r.verified = true;
                } else if (res->status_code != 401 && res->status_code != 403) {
                    r.set_verification_error(unexpected_status(res->status_code), {api_key});
                }
            }
        }
        results.push_back(std::move(r));
    }
    return results;
}

} // namespace credscan
