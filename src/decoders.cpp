#include "decoders.hpp"
#include "encoding.hpp"
#include <cctype>
#include <charconv>
#include <cstdint>

namespace credscan {

namespace {

bool is_base64_byte(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '+' || c == '/' || c == '-' || c == '_' || c == '=';
}

// URL-safe alphabet mapped to the standard one, padded to a multiple of 4.
std::string normalize_base64(std::string_view run) {
    std::string s(run);
    while (!s.empty() && s.back() == '=') s.pop_back();
    for (auto& c : s) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
    }
    if (s.size() % 4 == 1) s.pop_back();
    while (s.size() % 4 != 0) s += '=';
    return s;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xc0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xe0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    } else {
        out += static_cast<char>(0xf0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
}

std::optional<uint32_t> parse_hex4(std::string_view s) {
    if (s.size() < 4) return std::nullopt;
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + 4, value, 16);
    if (ec != std::errc() || ptr != s.data() + 4) return std::nullopt;
    return value;
}

struct NamedEntity {
    std::string_view name;
    char value;
};

constexpr NamedEntity kNamedEntities[] = {
    {"&tab;", '\t'},          {"&newline;", '\n'},        {"&excl;", '!'},
    {"&quot;", '"'},          {"&num;", '#'},             {"&dollar;", '$'},
    {"&percnt;", '%'},        {"&amp;", '&'},             {"&apos;", '\''},
    {"&lpar;", '('},          {"&rpar;", ')'},            {"&ast;", '*'},
    {"&plus;", '+'},          {"&comma;", ','},           {"&period;", '.'},
    {"&sol;", '/'},           {"&colon;", ':'},           {"&semi;", ';'},
    {"&lt;", '<'},            {"&equals;", '='},          {"&gt;", '>'},
    {"&quest;", '?'},         {"&commat;", '@'},          {"&lsqb;", '['},
    {"&bsol;", '\\'},         {"&rsqb;", ']'},            {"&hat;", '^'},
    {"&underbar;", '_'},      {"&diacriticalgrave;", '`'}, {"&lcub;", '{'},
    {"&verticalline;", '|'},  {"&rcub;", '}'},            {"&nonbreakingspace;", ' '},
};

bool iequals_prefix(std::string_view data, std::string_view prefix) {
    if (data.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(data[i])) != prefix[i]) return false;
    }
    return true;
}

bool resolve_named_entities(std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool changed = false;

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            std::string_view rest(text.data() + i, text.size() - i);
            const NamedEntity* found = nullptr;
            for (const auto& entity : kNamedEntities) {
                if (iequals_prefix(rest, entity.name)) {
                    found = &entity;
                    break;
                }
            }
            if (found) {
                out += found->value;
                i += found->name.size();
                changed = true;
                continue;
            }
        }
        out += text[i++];
    }

    if (changed) text = std::move(out);
    return changed;
}

// Replaces &#<digits>; (hex: &#x<digits>;) whose digit count is within
// max_digits and whose value fits in a byte.
bool resolve_numeric_entities(std::string& text, bool hex, size_t max_digits) {
    std::string out;
    out.reserve(text.size());
    bool changed = false;

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&' && i + 1 < text.size() && text[i + 1] == '#') {
            size_t start = i + 2;
            if (hex) {
                if (start < text.size() && (text[start] == 'x' || text[start] == 'X')) ++start;
                else start = text.size();
            }
            size_t end = start;
            while (end < text.size() && end - start < max_digits &&
                   (hex ? std::isxdigit(static_cast<unsigned char>(text[end])) != 0
                        : std::isdigit(static_cast<unsigned char>(text[end])) != 0)) {
                ++end;
            }
            if (end > start && end < text.size() && text[end] == ';') {
                unsigned value = 0;
                auto [ptr, ec] = std::from_chars(text.data() + start, text.data() + end, value, hex ? 16 : 10);
                if (ec == std::errc() && ptr == text.data() + end && value <= 0xff) {
                    out += static_cast<char>(value);
                    i = end + 1;
                    changed = true;
                    continue;
                }
            }
        }
        out += text[i++];
    }

    if (changed) text = std::move(out);
    return changed;
}

} // namespace

std::optional<std::string> PlainDecoder::decode(std::string_view data) const {
    return std::string(data);
}

std::optional<std::string> Base64Decoder::decode(std::string_view data) const {
    std::string out;
    out.reserve(data.size());
    bool changed = false;

    size_t i = 0;
    while (i < data.size()) {
        if (!is_base64_byte(data[i])) {
            out += data[i++];
            continue;
        }
        size_t start = i;
        while (i < data.size() && is_base64_byte(data[i])) ++i;
        auto run = data.substr(start, i - start);
        if (run.size() >= kMinEncodedLength) {
            auto decoded = base64_decode(normalize_base64(run));
            if (decoded && !decoded->empty() && is_printable_ascii(*decoded)) {
                out += *decoded;
                changed = true;
                continue;
            }
        }
        out += run;
    }

    if (!changed) return std::nullopt;
    return out;
}

std::optional<std::string> EscapedUnicodeDecoder::decode(std::string_view data) const {
    std::string out;
    out.reserve(data.size());
    bool changed = false;

    size_t i = 0;
    while (i < data.size()) {
        size_t digits = std::string_view::npos;
        size_t consumed = 0;
        if (data[i] == '\\') {
            size_t j = i;
            while (j < data.size() && data[j] == '\\') ++j;
            if (j < data.size() && (data[j] == 'u' || data[j] == 'U') && j - i <= 2) {
                digits = j + 1;
                consumed = j + 1 - i;
            }
        } else if ((data[i] == 'U' || data[i] == 'u') && i + 1 < data.size() && data[i + 1] == '+') {
            digits = i + 2;
            consumed = 2;
        }

        if (digits != std::string_view::npos) {
            if (auto cp = parse_hex4(data.substr(digits))) {
                append_utf8(out, *cp);
                i += consumed + 4;
                changed = true;
                continue;
            }
        }
        out += data[i++];
    }

    if (!changed) return std::nullopt;
    return out;
}

std::optional<std::string> HtmlEntityDecoder::decode(std::string_view data) const {
    if (data.find('&') == std::string_view::npos) return std::nullopt;

    std::string text(data);
    bool changed = resolve_named_entities(text);
    changed |= resolve_numeric_entities(text, false, 3);
    changed |= resolve_numeric_entities(text, true, 2);

    if (!changed) return std::nullopt;
    return text;
}

std::vector<std::unique_ptr<Decoder>> default_decoders() {
    std::vector<std::unique_ptr<Decoder>> decoders;
    decoders.push_back(std::make_unique<PlainDecoder>());
    decoders.push_back(std::make_unique<Base64Decoder>());
    decoders.push_back(std::make_unique<EscapedUnicodeDecoder>());
    decoders.push_back(std::make_unique<HtmlEntityDecoder>());
    return decoders;
}

} // namespace credscan
