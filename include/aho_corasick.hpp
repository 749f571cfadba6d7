#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace credscan {

// ASCII case-insensitive multi-pattern matcher. Patterns and text are folded
// byte-wise to lower case; bytes >= 0x80 match exactly. The transition table
// is dense (256 entries per state), so scanning is one lookup per byte.
class AhoCorasick {
public:
    struct Match {
        size_t pattern;   // index into patterns()
        size_t position;  // byte offset of the first matched byte
    };

    AhoCorasick() = default;
    explicit AhoCorasick(std::vector<std::string> patterns);

    // Calls on_match(Match) for every occurrence, in order of match end.
    template <typename Fn>
    void scan(std::string_view text, Fn&& on_match) const {
        if (outputs_.empty()) return;
        int32_t state = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            state = goto_[static_cast<size_t>(state)][fold(static_cast<unsigned char>(text[i]))];
            for (uint32_t p : outputs_[static_cast<size_t>(state)]) {
                on_match(Match{p, i + 1 - patterns_[p].size()});
            }
        }
    }

    std::vector<Match> find_all(std::string_view text) const;
    bool contains_any(std::string_view text) const;

    const std::vector<std::string>& patterns() const { return patterns_; }
    size_t state_count() const { return goto_.size(); }

    static unsigned char fold(unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<unsigned char>(c - 'A' + 'a') : c;
    }

private:
    std::vector<std::string> patterns_;
    std::vector<std::array<int32_t, 256>> goto_;
    std::vector<std::vector<uint32_t>> outputs_;
};

} // namespace credscan
