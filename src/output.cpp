#include "output.hpp"
#include "json.hpp"
#include "log.hpp"
#include <format>

namespace credscan {

namespace {

std::string_view status_line(const Result& r) {
    if (r.verified) return "Found verified result";
    if (r.verification_error()) return "Found unknown result";
    return "Found unverified result";
}

} // namespace

std::string PlainPrinter::format(const ResultWithMetadata& r) {
    const auto& res = r.result;
    std::string out = std::format("{}\n", status_line(res));
    out += std::format("Detector Type: {}\n", to_string(res.detector_type));
    out += std::format("Decoder Type: {}\n", to_string(r.decoder_type));
    out += std::format("Raw result: {}\n", res.raw);
    if (!res.redacted.empty()) out += std::format("Redacted: {}\n", res.redacted);
    if (res.verification_error()) out += std::format("Verification issue: {}\n", *res.verification_error());
    for (const auto& [k, v] : res.extra_data) out += std::format("{}: {}\n", k, v);
    if (!r.file.empty()) out += std::format("File: {}\n", r.file);
    out += std::format("Line: {}\n", r.line);
    if (r.is_false_positive) out += "Possible false positive\n";
    out += '\n';
    return out;
}

void PlainPrinter::print(const ResultWithMetadata& r) {
    log::Writer::print(format(r));
}

std::string JsonPrinter::format(const ResultWithMetadata& r) {
    const auto& res = r.result;
    json::ObjectWriter w;
    w.field("SourceName", r.source_name)
        .field("File", r.file)
        .field("Line", static_cast<long long>(r.line))
        .field("DetectorType", static_cast<long long>(static_cast<int>(res.detector_type)))
        .field("DetectorName", to_string(res.detector_type))
        .field("DecoderName", to_string(r.decoder_type))
        .field("Verified", res.verified)
        .field("VerificationFromCache", res.verification_from_cache)
        .field("Raw", res.raw)
        .field("RawV2", res.raw_v2)
        .field("Redacted", res.redacted)
        .field("ExtraData", res.extra_data);
    if (res.verification_error()) w.field("VerificationError", *res.verification_error());
    if (r.is_false_positive) w.field("PossibleFalsePositive", true);
    return w.str() + "\n";
}

void JsonPrinter::print(const ResultWithMetadata& r) {
    log::Writer::print(format(r));
}

} // namespace credscan
