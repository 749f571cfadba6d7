#include "aho_corasick.hpp"
#include <cassert>
#include <iostream>
#include <random>
#include <set>

using namespace credscan;

void test_aho_corasick() {
    std::cout << "Testing AhoCorasick...\n\n";

    {
        AhoCorasick ac({"he", "she", "his", "hers"});
        auto matches = ac.find_all("ushers");
        std::set<std::pair<std::string, size_t>> found;
        for (const auto& m : matches) found.emplace(ac.patterns()[m.pattern], m.position);
        assert(found.size() == 3);
        assert(found.contains({"she", 1}));
        assert(found.contains({"he", 2}));
        assert(found.contains({"hers", 2}));
        std::cout << "✓ Test 1 passed: overlapping matches with positions\n";
    }

    {
        AhoCorasick ac({"github", "ghp_"});
        assert(ac.contains_any("TOKEN=GHP_abc"));
        assert(ac.contains_any("see GitHub docs"));
        assert(!ac.contains_any("gitlab"));
        std::cout << "✓ Test 2 passed: ASCII case folding\n";
    }

    {
        AhoCorasick empty;
        assert(empty.find_all("anything").empty());
        assert(!empty.contains_any("anything"));
        AhoCorasick only_empty({""});
        assert(only_empty.find_all("abc").empty());
        AhoCorasick ac({"abc"});
        assert(ac.find_all("").empty());
        std::cout << "✓ Test 3 passed: empty automaton, empty pattern, empty text\n";
    }

    {
        AhoCorasick ac({"\xc3\xa9t\xc3\xa9"});
        assert(ac.contains_any("un \xc3\xa9t\xc3\xa9 chaud"));
        assert(!ac.contains_any("un ete chaud"));
        std::cout << "✓ Test 4 passed: non-ASCII bytes match exactly\n";
    }

    {
        // Brute-force comparison over random text.
        std::vector<std::string> patterns{"ab", "abab", "bab", "b", "aaa", "ba"};
        AhoCorasick ac(patterns);
        std::mt19937 rng(42);
        for (int round = 0; round < 50; ++round) {
            std::string text;
            for (int i = 0; i < 64; ++i) text += "abAB"[rng() % 4];
            std::multiset<std::pair<size_t, size_t>> expected;
            std::string lower = text;
            for (auto& c : lower) c = static_cast<char>(AhoCorasick::fold(static_cast<unsigned char>(c)));
            for (size_t p = 0; p < patterns.size(); ++p) {
                for (size_t pos = lower.find(patterns[p]); pos != std::string::npos; pos = lower.find(patterns[p], pos + 1)) {
                    expected.emplace(p, pos);
                }
            }
            std::multiset<std::pair<size_t, size_t>> actual;
            for (const auto& m : ac.find_all(text)) actual.emplace(m.pattern, m.position);
            assert(actual == expected);
        }
        std::cout << "✓ Test 5 passed: agrees with naive search\n";
    }

    std::cout << "\n✅ All tests passed!\n";
}

int main() {
    try {
        test_aho_corasick();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
