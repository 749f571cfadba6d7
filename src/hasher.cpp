#include "hasher.hpp"
#include <openssl/evp.h>
#include <cstdint>
#include <format>
#include <memory>

namespace credscan {

std::expected<void, HashErrorInfo> Hasher::validate_input(std::string_view data) {
    if (data.empty()) {
        return std::unexpected(HashErrorInfo{HashError::EmptyData, "data is empty"});
    }
    if (data.size() > kMaxHashInputSize) {
        return std::unexpected(HashErrorInfo{
            HashError::InputTooLarge,
            std::format("input size {} bytes exceeds maximum of {} bytes", data.size(), kMaxHashInputSize),
            data.size(), kMaxHashInputSize});
    }
    return {};
}

std::expected<std::string, HashErrorInfo> Sha256Hasher::hash(std::string_view data) const {
    if (auto ok = validate_input(data); !ok) return std::unexpected(ok.error());

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) return std::unexpected(HashErrorInfo{HashError::DigestFailed, "EVP_MD_CTX_new failed"});

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        return std::unexpected(HashErrorInfo{HashError::DigestFailed, "SHA-256 digest failed"});
    }
    return std::string(reinterpret_cast<const char*>(digest), len);
}

std::expected<std::string, HashErrorInfo> Fnv64aHasher::hash(std::string_view data) const {
    if (auto ok = validate_input(data); !ok) return std::unexpected(ok.error());

    uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    std::string out(8, '\0');
    for (int i = 7; i >= 0; --i) {
        out[static_cast<size_t>(i)] = static_cast<char>(h & 0xff);
        h >>= 8;
    }
    return out;
}

} // namespace credscan
