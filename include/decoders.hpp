#pragma once

#include "detector.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace credscan {

// Produces an alternative rendering of a chunk in which encoded secrets
// appear in plain form. decode() returns nullopt when the decoder has
// nothing to contribute for this chunk.
class Decoder {
public:
    virtual ~Decoder() = default;
    virtual DecoderType type() const = 0;
    virtual std::optional<std::string> decode(std::string_view data) const = 0;
};

class PlainDecoder final : public Decoder {
public:
    DecoderType type() const override { return DecoderType::Plain; }
    std::optional<std::string> decode(std::string_view data) const override;
};

// Replaces runs of base64 text that decode to printable ASCII.
class Base64Decoder final : public Decoder {
public:
    static constexpr size_t kMinEncodedLength = 20;

    DecoderType type() const override { return DecoderType::Base64; }
    std::optional<std::string> decode(std::string_view data) const override;
};

// Resolves \uXXXX, \\uXXXX and U+XXXX escapes to UTF-8.
class EscapedUnicodeDecoder final : public Decoder {
public:
    DecoderType type() const override { return DecoderType::EscapedUnicode; }
    std::optional<std::string> decode(std::string_view data) const override;
};

// Resolves named entities (&amp;, &lt;, &lsqb; ...) and numeric ones
// (&#103;, &#x67;). Named entities are resolved first, so &amp;#103; ends
// up as "g". Decimal entities above 255 are left as they are.
class HtmlEntityDecoder final : public Decoder {
public:
    DecoderType type() const override { return DecoderType::HtmlEntity; }
    std::optional<std::string> decode(std::string_view data) const override;
};

std::vector<std::unique_ptr<Decoder>> default_decoders();

} // namespace credscan
