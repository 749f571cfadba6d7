#include "encoding.hpp"
#include "hasher.hpp"
#include <cassert>
#include <iostream>

using namespace credscan;

void test_hashers() {
    std::cout << "Testing hashers...\n\n";

    {
        Sha256Hasher h;
        auto digest = h.hash("Hello, World!");
        assert(digest.has_value());
        assert(digest->size() == 32);
        assert(to_hex(*digest) == "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
        std::cout << "✓ Test 1 passed: SHA-256 known vector\n";
    }

    {
        Fnv64aHasher h;
        auto digest = h.hash("Hello, World!");
        assert(digest.has_value());
        assert(digest->size() == 8);
        assert(to_hex(*digest) == "6ef05bd7cc857c54");
        std::cout << "✓ Test 2 passed: FNV-64a known vector\n";
    }

    {
        Sha256Hasher h;
        auto a = h.hash("same input");
        auto b = h.hash("same input");
        auto c = h.hash("other input");
        assert(a && b && c);
        assert(*a == *b);
        assert(*a != *c);
        std::cout << "✓ Test 3 passed: deterministic digests\n";
    }

    {
        Sha256Hasher sha;
        Fnv64aHasher fnv;
        auto e1 = sha.hash("");
        auto e2 = fnv.hash("");
        assert(!e1 && e1.error().error == HashError::EmptyData);
        assert(!e2 && e2.error().error == HashError::EmptyData);
        std::cout << "✓ Test 4 passed: empty input rejected\n";
    }

    {
        Sha256Hasher h;
        std::string big(kMaxHashInputSize + 1, 'a');
        auto r = h.hash(big);
        assert(!r);
        assert(r.error().error == HashError::InputTooLarge);
        assert(r.error().input_size == kMaxHashInputSize + 1);
        assert(r.error().max_size == kMaxHashInputSize);

        std::string max(kMaxHashInputSize, 'a');
        assert(h.hash(max).has_value());
        std::cout << "✓ Test 5 passed: input size limit\n";
    }

    {
        assert(base64_encode("hello") == "aGVsbG8=");
        auto d = base64_decode("aGVsbG8=");
        assert(d && *d == "hello");
        assert(!base64_decode("aGVsbG8"));
        assert(!base64_decode("aGV$bG8="));
        auto mac = hmac_sha256("key", "The quick brown fox jumps over the lazy dog");
        assert(mac && to_hex(*mac) == "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
        assert(query_escape("a b&c=d/+") == "a+b%26c%3Dd%2F%2B");
        std::cout << "✓ Test 6 passed: base64, HMAC and query escaping\n";
    }

    std::cout << "\n✅ All tests passed!\n";
}

int main() {
    try {
        test_hashers();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
