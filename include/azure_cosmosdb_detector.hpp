#pragma once

#include "cache.hpp"
#include "detector.hpp"
#include "http_client.hpp"
#include <memory>

namespace credscan {

// Azure Cosmos DB account keys paired with the account endpoint found in the
// same span. Endpoints that do not resolve are remembered in invalid_hosts
// and skipped for the rest of the scan.
class AzureCosmosDBDetector final : public Detector {
public:
    AzureCosmosDBDetector(std::shared_ptr<HttpClient> client, std::shared_ptr<Cache<bool>> invalid_hosts);

    DetectorType type() const override { return DetectorType::AzureCosmosDB; }
    std::vector<std::string> keywords() const override { return {".documents.azure.com"}; }
    std::string description() const override;
    std::expected<std::vector<Result>, DetectorErrorInfo> from_data(
        const Context& ctx, bool verify, std::string_view data) const override;

    // Value of the Authorization header for GET /dbs at the given RFC 1123 date.
    static std::optional<std::string> authorization(std::string_view key, std::string_view date);

    const std::shared_ptr<Cache<bool>>& invalid_hosts() const { return invalid_hosts_; }

private:
    std::shared_ptr<HttpClient> client_;
    std::shared_ptr<Cache<bool>> invalid_hosts_;
};

} // namespace credscan
