#pragma once

#include "detector.hpp"
#include "http_client.hpp"
#include <memory>

namespace credscan {

// Fine-grained and prefixed GitHub tokens (ghp_, gho_, ghu_, ghs_, ghr_, github_pat_).
class GitHubDetector final : public Detector {
public:
    explicit GitHubDetector(std::shared_ptr<HttpClient> client, std::string endpoint = "https://api.github.com");

    DetectorType type() const override { return DetectorType::GitHub; }
    int version() const override { return 2; }
    std::vector<std::string> keywords() const override;
    std::string description() const override;
    std::expected<std::vector<Result>, DetectorErrorInfo> from_data(
        const Context& ctx, bool verify, std::string_view data) const override;

private:
    std::shared_ptr<HttpClient> client_;
    std::string endpoint_;
};

// Legacy 40-hex personal access tokens found next to a GitHub keyword.
class GitHubLegacyDetector final : public Detector {
public:
    explicit GitHubLegacyDetector(std::shared_ptr<HttpClient> client, std::string endpoint = "https://api.github.com");

    DetectorType type() const override { return DetectorType::GitHub; }
    int version() const override { return 1; }
    std::vector<std::string> keywords() const override;
    std::string description() const override;
    std::expected<std::vector<Result>, DetectorErrorInfo> from_data(
        const Context& ctx, bool verify, std::string_view data) const override;

private:
    std::shared_ptr<HttpClient> client_;
    std::string endpoint_;
};

} // namespace credscan
