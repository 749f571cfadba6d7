#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace credscan {

enum class HashError {
    EmptyData,
    InputTooLarge,
    DigestFailed
};

struct HashErrorInfo {
    HashError error;
    std::string message;
    size_t input_size = 0;
    size_t max_size = 0;
};

// Largest input any hasher accepts.
inline constexpr size_t kMaxHashInputSize = 4 * 1024 * 1024;

// Hashers return raw digest bytes; use to_hex() for a printable key.
class Hasher {
public:
    virtual ~Hasher() = default;
    virtual std::expected<std::string, HashErrorInfo> hash(std::string_view data) const = 0;
    virtual size_t digest_size() const = 0;

protected:
    static std::expected<void, HashErrorInfo> validate_input(std::string_view data);
};

class Sha256Hasher final : public Hasher {
public:
    std::expected<std::string, HashErrorInfo> hash(std::string_view data) const override;
    size_t digest_size() const override { return 32; }
};

// 64-bit FNV-1a, digest in big-endian byte order.
class Fnv64aHasher final : public Hasher {
public:
    std::expected<std::string, HashErrorInfo> hash(std::string_view data) const override;
    size_t digest_size() const override { return 8; }
};

} // namespace credscan
