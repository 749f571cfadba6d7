#include "huggingface_detector.hpp"
#include "json.hpp"
#include "verifier.hpp"
#include <regex>

namespace credscan {

HuggingFaceDetector::HuggingFaceDetector(std::shared_ptr<HttpClient> client, std::string endpoint)
    : client_(std::move(client)), endpoint_(std::move(endpoint)) {}

std::string HuggingFaceDetector::description() const {
    return "Hugging Face hosts models and datasets. Access tokens can read or write private "
           "repositories and call the inference API.";
}

std::expected<std::vector<Result>, DetectorErrorInfo> HuggingFaceDetector::from_data(
    const Context& ctx, bool verify, std::string_view data) const {
    static const std::regex pattern(R"(\b(hf_[a-zA-Z]{34})\b)");

    std::vector<Result> results;
    for (const auto& token : find_unique_submatches(pattern, data)) {
        Result r;
        r.detector_type = DetectorType::HuggingFace;
        r.raw = token;

        if (verify && client_) {
            auto res = client_->get(ctx, endpoint_ + "/api/whoami-v2", {{"Authorization", "Bearer " + token}});
            if (!res) {
                if (auto abort = context_abort(ctx, key(), res.error())) return std::unexpected(*abort);
                r.set_verification_error(res.error().message, {token});
            } else if (res->status_code == 200) {
                r.verified = true;
                if (auto name = json::string_field(res->body, "name")) r.extra_data["username"] = *name;
                if (auto type = json::string_field(res->body, "type")) r.extra_data["account_type"] = *type;
            } else if (res->status_code != 401) {
                r.set_verification_error(unexpected_status(res->status_code), {token});
            }
        }
        results.push_back(std::move(r));
    }
    return results;
}

} // namespace credscan
