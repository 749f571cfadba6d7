#include "detector_matcher.hpp"
#include "test_support.hpp"
#include <cassert>
#include <iostream>
#include <random>
#include <set>

using namespace credscan;
using credscan::testing::FakeDetector;

namespace {

// Hint overrides on top of the fake detector.
class SpanHintDetector : public FakeDetector {
public:
    SpanHintDetector(size_t max_secret, size_t start_offset, size_t max_span)
        : FakeDetector(DetectorType::CustomRegex, {"key"}, "(x)"),
          max_secret_(max_secret), start_offset_(start_offset), max_span_(max_span) {}

    size_t max_secret_size() const override { return max_secret_; }
    size_t start_offset() const override { return start_offset_; }
    size_t max_credential_span() const override { return max_span_; }

private:
    size_t max_secret_, start_offset_, max_span_;
};

std::shared_ptr<FakeDetector> fake(DetectorType type, std::vector<std::string> keywords, int version = 0) {
    return std::make_shared<FakeDetector>(type, std::move(keywords), "([a-z]+)", version);
}

} // namespace

void test_find_matches() {
    std::cout << "Testing DetectorMatcher::find_matches...\n\n";

    auto github = fake(DetectorType::GitHub, {"ghp_", "github"});
    auto hf = fake(DetectorType::HuggingFace, {"hf_"});
    auto sugester = fake(DetectorType::Sugester, {"sugester"});
    DetectorMatcher matcher({sugester, github, hf});

    {
        auto found = matcher.find_matches("token sugester=ABCDEF1234567890ABCDEF1234567890");
        assert(found.size() == 1);
        assert(found[0] == sugester);
        std::cout << "✓ Test 1 passed: single keyword selects its detector\n";
    }

    {
        auto found = matcher.find_matches("GITHUB token ghp_x and Hf_y and github again");
        assert(found.size() == 2);
        // Ordered by key: GitHub (8) before HuggingFace (964).
        assert(found[0] == github);
        assert(found[1] == hf);
        std::cout << "✓ Test 2 passed: case-insensitive, deduplicated, ordered by key\n";
    }

    {
        assert(matcher.find_matches("").empty());
        assert(matcher.find_matches("nothing to see here").empty());
        std::cout << "✓ Test 3 passed: empty and keyword-free input\n";
    }

    {
        DetectorMatcher none({});
        assert(none.find_matches("ghp_ github sugester").empty());
        assert(none.find_detector_matches("ghp_").empty());
        assert(none.keywords_to_detectors().empty());
        std::cout << "✓ Test 4 passed: empty detector list is a no-op matcher\n";
    }

    {
        auto a = fake(DetectorType::GitHub, {"shared"}, 1);
        auto b = fake(DetectorType::GitHub, {"shared", "other"}, 2);
        auto c = fake(DetectorType::Sugester, {"", "Shared"});
        DetectorMatcher m({c, b, a});
        auto table = m.keywords_to_detectors();
        assert(table.size() == 2);
        assert(table["shared"].size() == 3);
        assert(table["other"].size() == 1);
        auto found = m.find_matches("xxSHAREDxx");
        assert(found.size() == 3);
        assert(found[0] == a && found[1] == b && found[2] == c);
        std::cout << "✓ Test 5 passed: shared keywords map to every owner, empty keyword skipped\n";
    }

    {
        // Soundness: any detector with a keyword in the text is returned.
        std::vector<std::shared_ptr<Detector>> detectors;
        std::vector<std::string> words{"alpha", "beta", "gamma", "delta", "eps", "zeta", "eta", "theta"};
        for (size_t i = 0; i < words.size(); ++i) {
            detectors.push_back(std::make_shared<FakeDetector>(DetectorType::CustomRegex, std::vector<std::string>{words[i]},
                                                               "(x)", static_cast<int>(i)));
        }
        DetectorMatcher m(detectors);
        std::mt19937 rng(7);
        for (int round = 0; round < 100; ++round) {
            std::string text;
            std::set<size_t> planted;
            for (int k = 0; k < 4; ++k) {
                size_t w = rng() % words.size();
                planted.insert(w);
                std::string word = words[w];
                if (rng() % 2) for (auto& ch : word) ch = static_cast<char>(ch - 'a' + 'A');
                text += std::string(rng() % 5, '-') + word;
            }
            auto found = m.find_matches(text);
            for (size_t w : planted) {
                bool present = false;
                for (const auto& d : found) present = present || d->version() == static_cast<int>(w);
                assert(present);
            }
        }
        std::cout << "✓ Test 6 passed: no false negatives on random input\n";
    }
}

void test_spans() {
    std::cout << "\nTesting match spans...\n\n";

    {
        AdjustableSpanCalculator calc;
        SpanHintDetector plain(0, 0, 0);
        std::string chunk(2000, 'a');
        auto span = calc.calculate(1000, chunk, plain);
        assert(span == (MatchSpan{1000 - 512, 1000 + 512}));
        span = calc.calculate(10, chunk, plain);
        assert(span == (MatchSpan{0, 522}));
        span = calc.calculate(1900, chunk, plain);
        assert(span == (MatchSpan{1900 - 512, 2000}));
        std::cout << "✓ Test 1 passed: default radius clamped to the chunk\n";
    }

    {
        AdjustableSpanCalculator calc;
        std::string chunk(5000, 'a');
        SpanHintDetector wide(0, 0, 2048);
        assert(calc.calculate(2500, chunk, wide) == (MatchSpan{452, 4548}));
        SpanHintDetector sized(100, 0, 0);
        assert(calc.calculate(2500, chunk, sized) == (MatchSpan{2500 - 512, 2600}));
        SpanHintDetector offset(0, 50, 0);
        assert(calc.calculate(2500, chunk, offset) == (MatchSpan{2450, 2500 + 512}));
        std::cout << "✓ Test 2 passed: detector span hints\n";
    }

    {
        EntireChunkSpanCalculator calc;
        SpanHintDetector d(0, 0, 0);
        assert(calc.calculate(42, "0123456789", d) == (MatchSpan{0, 10}));
        std::cout << "✓ Test 3 passed: entire chunk span\n";
    }

    {
        DetectorMatch m(DetectorKey{DetectorType::GitHub}, nullptr);
        m.add_span({600, 900});
        m.add_span({0, 100});
        m.add_span({50, 300});
        m.add_span({300, 400});
        m.merge_spans();
        assert(m.spans().size() == 2);
        assert(m.spans()[0] == (MatchSpan{0, 400}));
        assert(m.spans()[1] == (MatchSpan{600, 900}));
        std::cout << "✓ Test 4 passed: overlapping and touching spans merged\n";
    }

    {
        auto d = fake(DetectorType::Sugester, {"key"});
        DetectorMatcher m({d});
        std::string chunk = std::string(2000, '.') + "key" + std::string(2000, '.') + "KEY" + std::string(100, '.');
        auto matches = m.find_detector_matches(chunk);
        assert(matches.size() == 1);
        assert(matches[0].spans().size() == 2);
        auto slices = matches[0].matches(chunk);
        assert(slices.size() == 2);
        assert(slices[0].find("key") != std::string_view::npos);
        assert(slices[1].find("KEY") != std::string_view::npos);
        assert(slices[1].size() == 512 + 3 + 100);

        DetectorMatcher whole({d}, std::make_unique<EntireChunkSpanCalculator>());
        auto all = whole.find_detector_matches(chunk);
        assert(all.size() == 1);
        assert(all[0].spans().size() == 1);
        assert(all[0].matches(chunk)[0].size() == chunk.size());
        std::cout << "✓ Test 5 passed: per-detector spans over a chunk\n";
    }
}

int main() {
    try {
        test_find_matches();
        test_spans();
        std::cout << "\n✅ All tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
