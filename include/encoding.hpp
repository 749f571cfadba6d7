#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace credscan {

// Lower-case hex of raw bytes.
std::string to_hex(std::string_view bytes);

std::string base64_encode(std::string_view bytes);

// Standard alphabet with padding; nullopt on malformed input.
std::optional<std::string> base64_decode(std::string_view text);

// Raw HMAC-SHA256 digest bytes, nullopt if OpenSSL fails.
std::optional<std::string> hmac_sha256(std::string_view key, std::string_view message);

// application/x-www-form-urlencoded escaping (space becomes '+').
std::string query_escape(std::string_view s);

// Printable 7-bit ASCII plus tab, CR and LF.
bool is_printable_ascii(std::string_view s);

bool is_valid_utf8(std::string_view s);

std::string to_lower_ascii(std::string_view s);

} // namespace credscan
