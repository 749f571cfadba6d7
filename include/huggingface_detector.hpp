#pragma once

#include "detector.hpp"
#include "http_client.hpp"
#include <memory>

namespace credscan {

// Hugging Face user access tokens (hf_ followed by 34 letters).
class HuggingFaceDetector final : public Detector {
public:
    explicit HuggingFaceDetector(std::shared_ptr<HttpClient> client, std::string endpoint = "https://huggingface.co");

    DetectorType type() const override { return DetectorType::HuggingFace; }
    std::vector<std::string> keywords() const override { return {"hf_"}; }
    std::string description() const override;
    std::expected<std::vector<Result>, DetectorErrorInfo> from_data(
        const Context& ctx, bool verify, std::string_view data) const override;

private:
    std::shared_ptr<HttpClient> client_;
    std::string endpoint_;
};

} // namespace credscan
