#include "detector.hpp"
#include "aho_corasick.hpp"
#include "encoding.hpp"
#include <array>
#include <cmath>
#include <format>
#include <set>
#include <unordered_set>

namespace credscan {

namespace {

struct TypeName {
    DetectorType type;
    std::string_view name;
};

constexpr std::array<TypeName, 7> kTypeNames{{
    {DetectorType::Unknown, "Unknown"},
    {DetectorType::GitHub, "GitHub"},
    {DetectorType::AzureCosmosDB, "AzureCosmosDB"},
    {DetectorType::Sugester, "Sugester"},
    {DetectorType::HuggingFace, "HuggingFace"},
    {DetectorType::ArtifactoryReferenceToken, "ArtifactoryReferenceToken"},
    {DetectorType::CustomRegex, "CustomRegex"},
}};

// Substrings that mark a candidate as a placeholder.
constexpr std::array<std::string_view, 7> kDefaultFalsePositives{
    "example", "xxxxxx", "aaaaaa", "abcde", "00000", "sample", "*****"};

// Words that real credentials essentially never contain.
const std::vector<std::string>& false_positive_words() {
    static const std::vector<std::string> words{
        "changeme", "placeholder", "dummy", "foobar", "lorem", "ipsum",
        "redacted", "insert", "your_", "token_here", "replace", "template",
        "testing", "fake", "notreal", "secret_key_here", "username", "password"};
    return words;
}

const AhoCorasick& false_positive_word_matcher() {
    static const AhoCorasick matcher(false_positive_words());
    return matcher;
}

} // namespace

std::string_view to_string(DetectorType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) return entry.name;
    }
    return "Unknown";
}

std::optional<DetectorType> detector_type_from_string(std::string_view name) {
    auto lowered = to_lower_ascii(name);
    for (const auto& entry : kTypeNames) {
        if (to_lower_ascii(entry.name) == lowered) return entry.type;
    }
    return std::nullopt;
}

std::string_view to_string(DecoderType type) {
    switch (type) {
        case DecoderType::Plain: return "PLAIN";
        case DecoderType::Base64: return "BASE64";
        case DecoderType::EscapedUnicode: return "ESCAPED_UNICODE";
        case DecoderType::HtmlEntity: return "HTML";
        case DecoderType::Unknown: break;
    }
    return "UNKNOWN";
}

void Result::set_verification_error(std::string_view message, std::initializer_list<std::string_view> secrets) {
    std::string redacted_message(message);
    for (auto secret : secrets) {
        if (secret.empty()) continue;
        size_t pos = 0;
        while ((pos = redacted_message.find(secret, pos)) != std::string::npos) {
            redacted_message.replace(pos, secret.size(), "[REDACTED]");
            pos += 10;
        }
    }
    verification_error_ = std::move(redacted_message);
}

void Result::copy_verification_info(const Result& other) {
    verified = other.verified;
    verification_error_ = other.verification_error_;
}

std::string DetectorKey::loggable() const {
    if (type == DetectorType::CustomRegex) return std::format("{}({})", to_string(type), custom_name);
    if (version > 0) return std::format("{}(v{})", to_string(type), version);
    return std::string(to_string(type));
}

std::vector<Result> Detector::clean_results(std::vector<Result> results) const {
    return credscan::clean_results(std::move(results));
}

std::optional<std::string> Detector::is_false_positive(const Result& result) const {
    return known_false_positive(result.raw, true);
}

std::vector<Result> clean_results(std::vector<Result> results) {
    if (results.size() <= 1) return results;

    std::vector<Result> verified;
    std::unordered_set<std::string> seen;
    for (auto& r : results) {
        if (r.verified && seen.insert(r.redacted).second) verified.push_back(std::move(r));
    }
    if (!verified.empty()) return verified;

    results.resize(1);
    return results;
}

std::optional<std::string> known_false_positive(std::string_view match, bool word_check) {
    if (!is_valid_utf8(match)) return std::string("invalid utf8");

    auto lowered = to_lower_ascii(match);
    for (auto fp : kDefaultFalsePositives) {
        if (lowered.find(fp) != std::string::npos) return std::string(fp);
    }

    if (word_check) {
        const auto& matcher = false_positive_word_matcher();
        std::optional<std::string> word;
        matcher.scan(lowered, [&](const AhoCorasick::Match& m) {
            if (!word) word = matcher.patterns()[m.pattern];
        });
        if (word) return word;
    }
    return std::nullopt;
}

double shannon_entropy(std::string_view data) {
    if (data.empty()) return 0.0;
    std::array<size_t, 256> counts{};
    for (unsigned char c : data) ++counts[c];
    double entropy = 0.0;
    auto n = static_cast<double>(data.size());
    for (size_t count : counts) {
        if (count == 0) continue;
        double p = static_cast<double>(count) / n;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

std::string prefix_regex(const std::vector<std::string>& keywords) {
    std::string alternation;
    for (size_t i = 0; i < keywords.size(); ++i) {
        if (i) alternation += '|';
        for (char c : keywords[i]) {
            if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
                char lower = static_cast<char>(c | 0x20);
                char upper = static_cast<char>(lower - 'a' + 'A');
                alternation += std::format("[{}{}]", lower, upper);
            } else if (std::string_view("\\^$.|?*+()[]{}").find(c) != std::string_view::npos) {
                alternation += '\\';
                alternation += c;
            } else {
                alternation += c;
            }
        }
    }
    return std::format("(?:{})(?:.|[\\n\\r]){{0,40}}?", alternation);
}

std::vector<std::string> find_unique_submatches(const std::regex& re, std::string_view data, size_t group) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    using Iter = std::regex_iterator<std::string_view::const_iterator>;
    for (Iter it(data.begin(), data.end(), re), end; it != end; ++it) {
        if (group >= it->size() || !(*it)[group].matched) continue;
        auto value = (*it)[group].str();
        if (seen.insert(value).second) out.push_back(std::move(value));
    }
    return out;
}

std::string redact_prefix(std::string_view secret, size_t keep) {
    if (secret.size() <= keep) return std::string(secret);
    return std::format("{}...", secret.substr(0, keep));
}

} // namespace credscan
