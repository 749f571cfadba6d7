#pragma once

#include "context.hpp"
#include <compare>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace credscan {

// Stable identifiers; the numeric value is part of the verification cache key.
enum class DetectorType : int {
    Unknown = 0,
    GitHub = 8,
    AzureCosmosDB = 981,
    Sugester = 427,
    HuggingFace = 964,
    ArtifactoryReferenceToken = 1004,
    CustomRegex = 1000,
};

std::string_view to_string(DetectorType type);

// Case-insensitive lookup by name.
std::optional<DetectorType> detector_type_from_string(std::string_view name);

enum class DecoderType {
    Unknown,
    Plain,
    Base64,
    EscapedUnicode,
    HtmlEntity
};

std::string_view to_string(DecoderType type);

enum class DetectorError {
    ExtractionFailed,
    VerificationFailed,
    Cancelled,
    Timeout
};

struct DetectorErrorInfo {
    DetectorError error;
    std::string message;
};

struct Result {
    DetectorType detector_type = DetectorType::Unknown;
    int version = 0;
    std::string detector_name;
    bool verified = false;
    bool verification_from_cache = false;
    std::string raw;
    std::string raw_v2;
    std::string redacted;
    std::map<std::string, std::string> extra_data;
    DecoderType decoder_type = DecoderType::Unknown;

    // Records a verification failure that was not a rejection. Every secret
    // passed in is replaced by "[REDACTED]" in the stored message.
    void set_verification_error(std::string_view message, std::initializer_list<std::string_view> secrets = {});
    const std::optional<std::string>& verification_error() const { return verification_error_; }
    void clear_verification_error() { verification_error_.reset(); }

    // Copies verified and the verification error from another result.
    void copy_verification_info(const Result& other);

    bool operator==(const Result&) const = default;

private:
    std::optional<std::string> verification_error_;
};

struct DetectorKey {
    DetectorType type = DetectorType::Unknown;
    int version = 0;
    std::string custom_name;

    auto operator<=>(const DetectorKey&) const = default;

    // "GitHub", "GitHub(v2)" or "CustomRegex(name)".
    std::string loggable() const;
};

struct DetectorKeyHash {
    size_t operator()(const DetectorKey& key) const noexcept {
        size_t h = std::hash<int>{}(static_cast<int>(key.type));
        h ^= std::hash<int>{}(key.version) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>{}(key.custom_name) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

// A recognizer and verifier for one credential kind.
//
// Implementations must be safe to call concurrently. from_data with
// verify == false must not perform network I/O.
class Detector {
public:
    virtual ~Detector() = default;

    virtual DetectorType type() const = 0;

    // Lower-case literals; the detector only runs on chunks containing one.
    virtual std::vector<std::string> keywords() const = 0;

    virtual std::expected<std::vector<Result>, DetectorErrorInfo> from_data(
        const Context& ctx, bool verify, std::string_view data) const = 0;

    virtual int version() const { return 0; }
    virtual std::string custom_name() const { return {}; }
    virtual std::string description() const { return {}; }

    // Span hints for the matcher; 0 means no preference.
    virtual size_t max_secret_size() const { return 0; }
    virtual size_t start_offset() const { return 0; }
    virtual size_t max_credential_span() const { return 0; }

    virtual bool clean_results_irrespective_of_configuration() const { return false; }
    virtual std::vector<Result> clean_results(std::vector<Result> results) const;

    // Reason the result looks like a placeholder, or nullopt.
    virtual std::optional<std::string> is_false_positive(const Result& result) const;

    DetectorKey key() const { return DetectorKey{type(), version(), custom_name()}; }
};

// Keeps every verified result (deduplicated by redacted form) or, when none
// verified, only the first result.
std::vector<Result> clean_results(std::vector<Result> results);

// Returns the matched placeholder or word when match is a known false positive.
std::optional<std::string> known_false_positive(std::string_view match, bool word_check = true);

double shannon_entropy(std::string_view data);

// Case-insensitive alternation of the keywords followed by up to 40 bytes of
// any content, for use in front of a detector's secret pattern.
std::string prefix_regex(const std::vector<std::string>& keywords);

// Distinct values of capture group `group` in match order.
std::vector<std::string> find_unique_submatches(const std::regex& re, std::string_view data, size_t group = 1);

// First 4 characters followed by "..." for display.
std::string redact_prefix(std::string_view secret, size_t keep = 4);

} // namespace credscan
