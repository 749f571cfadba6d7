#pragma once

#include "detector.hpp"
#include "http_client.hpp"
#include <memory>

namespace credscan {

// Sugester API keys: 32 alphanumerics near the word "sugester". When an
// account subdomain is also found it is kept in raw_v2 and used to verify.
class SugesterDetector final : public Detector {
public:
    explicit SugesterDetector(std::shared_ptr<HttpClient> client);

    DetectorType type() const override { return DetectorType::Sugester; }
    std::vector<std::string> keywords() const override { return {"sugester"}; }
    std::string description() const override;
    std::expected<std::vector<Result>, DetectorErrorInfo> from_data(
        const Context& ctx, bool verify, std::string_view data) const override;

private:
    std::shared_ptr<HttpClient> client_;
};

} // namespace credscan
