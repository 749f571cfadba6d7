#include "azure_cosmosdb_detector.hpp"
#include "encoding.hpp"
#include "log.hpp"
#include "verifier.hpp"
#include <chrono>
#include <format>
#include <regex>

namespace credscan {

AzureCosmosDBDetector::AzureCosmosDBDetector(std::shared_ptr<HttpClient> client, std::shared_ptr<Cache<bool>> invalid_hosts)
    : client_(std::move(client)),
      invalid_hosts_(invalid_hosts ? std::move(invalid_hosts) : std::make_shared<SimpleCache<bool>>()) {}

std::string AzureCosmosDBDetector::description() const {
    return "Azure Cosmos DB is a globally distributed database service. Account keys grant full "
           "access to the databases of the account.";
}

std::optional<std::string> AzureCosmosDBDetector::authorization(std::string_view key, std::string_view date) {
    auto decoded = base64_decode(key);
    if (!decoded) return std::nullopt;
    auto payload = std::format("get\ndbs\n\n{}\n\n", to_lower_ascii(date));
    auto mac = hmac_sha256(*decoded, payload);
    if (!mac) return std::nullopt;
    return std::format("type=master&ver=1.0&sig={}", query_escape(base64_encode(*mac)));
}

std::expected<std::vector<Result>, DetectorErrorInfo> AzureCosmosDBDetector::from_data(
    const Context& ctx, bool verify, std::string_view data) const {
    static const std::regex key_pattern(R"(([A-Za-z0-9+/]{86}==))");
    static const std::regex account_pattern(R"(([a-z0-9-]{3,44}\.documents\.azure\.com))");

    auto keys = find_unique_submatches(key_pattern, data);
    auto accounts = find_unique_submatches(account_pattern, data);

    std::vector<Result> results;
    for (const auto& account : accounts) {
        if (invalid_hosts_->exists(account)) {
            log::debug(2, "skipping known invalid cosmos db host {}", account);
            continue;
        }
        for (const auto& cosmos_key : keys) {
            Result r;
            r.detector_type = DetectorType::AzureCosmosDB;
            r.raw = cosmos_key;
            r.raw_v2 = std::format("key: {} account_url: {}", cosmos_key, account);
            r.extra_data["account_url"] = account;

            if (verify && client_) {
                auto date = std::format("{:%a, %d %b %Y %H:%M:%S} GMT",
                                        std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
                auto auth = authorization(cosmos_key, date);
                if (!auth) {
                    r.set_verification_error("failed to sign request with account key", {cosmos_key});
                    results.push_back(std::move(r));
                    continue;
                }
                auto res = client_->get(ctx, std::format("https://{}:443/dbs", account), {
                    {"Authorization", *auth},
                    {"x-ms-date", date},
                    {"x-ms-version", "2018-12-31"},
                });
                if (!res) {
                    if (auto abort = context_abort(ctx, key(), res.error())) return std::unexpected(*abort);
                    if (res.error().error == HttpError::HostNotFound) {
                        invalid_hosts_->set(account, true);
                        break;
                    }
                    r.set_verification_error(res.error().message, {cosmos_key});
                } else if (res->status_code == 200) {
                    r.verified = true;
                } else if (res->status_code != 401 && res->status_code != 403) {
                    r.set_verification_error(unexpected_status(res->status_code), {cosmos_key});
                }
            }
            results.push_back(std::move(r));
        }
    }
    return results;
}

} // namespace credscan
