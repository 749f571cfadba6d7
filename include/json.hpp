#pragma once

#include <cctype>
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace credscan::json {

// Minimal SAX-style reader for the small JSON documents returned by
// verification endpoints. Top-level members of each object are reported
// once; nested objects and arrays are passed through as raw text.
class SAXParser {
public:
    using Callback = std::function<void(std::string_view key, std::string_view value, bool is_string)>;

    static void parse_tree_api(std::string_view input, const Callback& cb, const std::function<void()>& on_obj_end = nullptr) {
        size_t pos = 0;
        while (pos < input.size()) {
            pos = input.find('{', pos);
            if (pos == std::string_view::npos) break;

            int depth = 1;
            size_t end = pos + 1;
            while (end < input.size() && depth > 0) {
                if (input[end] == '"') {
                    end = skip_string(input, end);
                } else if (input[end] == '{') {
                    depth++;
                } else if (input[end] == '}') {
                    depth--;
                }
                end++;
            }
            if (depth > 0) break;

            parse_object(input.substr(pos + 1, end - pos - 2), cb);
            if (on_obj_end) on_obj_end();
            pos = end;
        }
    }

private:
    // Index of the closing quote of the string opening at `open`.
    static size_t skip_string(std::string_view s, size_t open) {
        size_t i = open + 1;
        while (i < s.size()) {
            if (s[i] == '\\') i += 2;
            else if (s[i] == '"') break;
            else i++;
        }
        return i;
    }

    static void parse_object(std::string_view obj, const Callback& cb) {
        size_t p = 0;
        while (p < obj.size()) {
            p = obj.find('"', p);
            if (p == std::string_view::npos) break;
            size_t key_end = skip_string(obj, p);
            if (key_end >= obj.size()) break;
            std::string_view key = obj.substr(p + 1, key_end - p - 1);
            p = obj.find(':', key_end);
            if (p == std::string_view::npos) break;
            p++;
            while (p < obj.size() && std::isspace(static_cast<unsigned char>(obj[p]))) p++;
            if (p >= obj.size()) break;

            size_t val_end;
            if (obj[p] == '"') {
                val_end = skip_string(obj, p);
                if (val_end >= obj.size()) break;
                cb(key, obj.substr(p + 1, val_end - p - 1), true);
                p = val_end + 1;
            } else if (obj[p] == '{' || obj[p] == '[') {
                char open = obj[p];
                char close = (open == '{' ? '}' : ']');
                int depth = 1;
                val_end = p + 1;
                while (val_end < obj.size() && depth > 0) {
                    if (obj[val_end] == '"') val_end = skip_string(obj, val_end);
                    else if (obj[val_end] == open) depth++;
                    else if (obj[val_end] == close) depth--;
                    val_end++;
                }
                cb(key, obj.substr(p, val_end - p), false);
                p = val_end;
            } else {
                val_end = p;
                while (val_end < obj.size() && obj[val_end] != ',' &&
                       !std::isspace(static_cast<unsigned char>(obj[val_end])) && obj[val_end] != '}') {
                    val_end++;
                }
                cb(key, obj.substr(p, val_end - p), false);
                p = val_end;
            }
            p = obj.find(',', p);
            if (p == std::string_view::npos) break;
        }
    }
};

// Resolves the simple escapes (\" \\ \/ \n \t \r \b \f); \uXXXX is kept verbatim.
inline std::string unescape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 >= s.size()) {
            out += s[i];
            continue;
        }
        char c = s[++i];
        switch (c) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'u': out += "\\u"; break;
            default: out += c; break;
        }
    }
    return out;
}

// First top-level string member named `key` in the first object of input.
inline std::optional<std::string> string_field(std::string_view input, std::string_view key) {
    std::optional<std::string> found;
    bool first_object = true;
    SAXParser::parse_tree_api(input, [&](std::string_view k, std::string_view v, bool is_string) {
        if (first_object && !found && is_string && k == key) found = unescape(v);
    }, [&] { first_object = false; });
    return found;
}

inline std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) out += std::format("\\u{:04x}", c);
                else out += static_cast<char>(c);
        }
    }
    return out;
}

// Builds one flat JSON object, members in insertion order.
class ObjectWriter {
public:
    ObjectWriter& field(std::string_view key, std::string_view value) {
        sep();
        out_ += std::format("\"{}\":\"{}\"", escape(key), escape(value));
        return *this;
    }

    ObjectWriter& field(std::string_view key, const char* value) {
        return field(key, std::string_view(value));
    }

    ObjectWriter& field(std::string_view key, bool value) {
        sep();
        out_ += std::format("\"{}\":{}", escape(key), value ? "true" : "false");
        return *this;
    }

    ObjectWriter& field(std::string_view key, long long value) {
        sep();
        out_ += std::format("\"{}\":{}", escape(key), value);
        return *this;
    }

    ObjectWriter& field(std::string_view key, const std::map<std::string, std::string>& values) {
        sep();
        out_ += std::format("\"{}\":{{", escape(key));
        bool first = true;
        for (const auto& [k, v] : values) {
            if (!first) out_ += ',';
            first = false;
            out_ += std::format("\"{}\":\"{}\"", escape(k), escape(v));
        }
        out_ += '}';
        return *this;
    }

    std::string str() const { return out_ + "}"; }

private:
    void sep() {
        if (out_.size() > 1) out_ += ',';
    }

    std::string out_ = "{";
};

} // namespace credscan::json
