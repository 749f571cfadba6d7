#include "github_detector.hpp"
#include "json.hpp"
#include "verifier.hpp"
#include <algorithm>
#include <regex>
#include <set>

namespace credscan {

namespace {

const std::regex& token_pattern() {
    static const std::regex re(
        R"(\b((?:ghp|gho|ghu|ghs|ghr)_[a-zA-Z0-9]{36,255}|github_pat_[0-9a-zA-Z_]{82})\b)");
    return re;
}

const std::regex& legacy_pattern() {
    static const std::regex re(prefix_regex({"github", "gh", "pat", "token"}) +
                               R"(\b[a-zA-Z0-9.\/?=&]{0,40}\b([a-f0-9]{40})\b)");
    return re;
}

constexpr std::string_view kAvatarHost = "avatars.githubusercontent.com";

constexpr std::string_view kDescription =
    "GitHub is a web-based platform used for version control and collaborative software development. "
    "GitHub tokens can be used to access and modify repositories and other resources.";

// GET /user with the token; 2xx verifies and fills the account details.
std::expected<void, DetectorErrorInfo> verify_token(const Context& ctx, const HttpClient& client,
                                                    const std::string& endpoint, const DetectorKey& key,
                                                    const std::string& token, Result& result) {
    auto res = client.get(ctx, endpoint + "/user", {
        {"Accept", "application/vnd.github+json"},
        {"Authorization", "token " + token},
    });
    if (!res) {
        if (auto abort = context_abort(ctx, key, res.error())) return std::unexpected(*abort);
        result.set_verification_error(res.error().message, {token});
        return {};
    }

    if (res->status_code >= 200 && res->status_code < 300) {
        result.verified = true;
        json::SAXParser::parse_tree_api(res->body, [&](std::string_view k, std::string_view v, bool is_string) {
            if (!is_string) {
                if (k == "site_admin" && v == "true") result.extra_data["site_admin"] = "true";
                return;
            }
            if (k == "login") result.extra_data["username"] = json::unescape(v);
            else if (k == "html_url") result.extra_data["url"] = json::unescape(v);
            else if (k == "type") result.extra_data["account_type"] = json::unescape(v);
            else if (k == "name" && !v.empty()) result.extra_data["name"] = json::unescape(v);
        });
        if (auto scopes = res->header("x-oauth-scopes"); !scopes.empty()) result.extra_data["scopes"] = scopes;
        if (auto expiry = res->header("github-authentication-token-expiration"); !expiry.empty()) {
            result.extra_data["expiry"] = expiry;
        }
    } else if (res->status_code != 401 && res->status_code != 403) {
        result.set_verification_error(unexpected_status(res->status_code), {token});
    }
    return {};
}

Result make_result(const std::string& token, int version) {
    Result r;
    r.detector_type = DetectorType::GitHub;
    r.version = version;
    r.raw = token;
    r.extra_data["rotation_guide"] = "https://howtorotate.com/docs/tutorials/github/";
    r.extra_data["version"] = std::to_string(version);
    return r;
}

} // namespace

GitHubDetector::GitHubDetector(std::shared_ptr<HttpClient> client, std::string endpoint)
    : client_(std::move(client)), endpoint_(std::move(endpoint)) {}

std::vector<std::string> GitHubDetector::keywords() const {
    return {"ghp_", "gho_", "ghu_", "ghs_", "ghr_", "github_pat_"};
}

std::string GitHubDetector::description() const { return std::string(kDescription); }

std::expected<std::vector<Result>, DetectorErrorInfo> GitHubDetector::from_data(
    const Context& ctx, bool verify, std::string_view data) const {
    std::vector<Result> results;
    for (const auto& token : find_unique_submatches(token_pattern(), data)) {
        auto r = make_result(token, version());
        if (verify && client_) {
            if (auto ok = verify_token(ctx, *client_, endpoint_, key(), token, r); !ok) return std::unexpected(ok.error());
        }
        results.push_back(std::move(r));
    }
    return results;
}

GitHubLegacyDetector::GitHubLegacyDetector(std::shared_ptr<HttpClient> client, std::string endpoint)
    : client_(std::move(client)), endpoint_(std::move(endpoint)) {}

std::vector<std::string> GitHubLegacyDetector::keywords() const { return {"github", "gh"}; }

std::string GitHubLegacyDetector::description() const { return std::string(kDescription); }

std::expected<std::vector<Result>, DetectorErrorInfo> GitHubLegacyDetector::from_data(
    const Context& ctx, bool verify, std::string_view data) const {
    std::vector<Result> results;
    std::set<std::string> seen;
    using Iter = std::regex_iterator<std::string_view::const_iterator>;
    for (Iter it(data.begin(), data.end(), legacy_pattern()), end; it != end; ++it) {
        auto token = it->str(1);
        // The keyword hit may land inside the avatar host, so look a little before the match.
        auto pos = static_cast<size_t>(it->position(0));
        auto lead = std::min<size_t>(pos, kAvatarHost.size());
        auto prefix = data.substr(pos - lead, lead + static_cast<size_t>(it->length(0)));
        if (prefix.find(kAvatarHost) != std::string_view::npos) continue;
        if (shannon_entropy(token) < 3.5) continue;
        if (!seen.insert(token).second) continue;

        auto r = make_result(token, version());
        if (verify && client_) {
            if (auto ok = verify_token(ctx, *client_, endpoint_, key(), token, r); !ok) return std::unexpected(ok.error());
        }
        results.push_back(std::move(r));
    }
    return results;
}

} // namespace credscan
