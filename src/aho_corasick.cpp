#include "aho_corasick.hpp"
#include <queue>

namespace credscan {

AhoCorasick::AhoCorasick(std::vector<std::string> patterns) : patterns_(std::move(patterns)) {
    std::array<int32_t, 256> empty;
    empty.fill(-1);
    goto_.push_back(empty);
    outputs_.emplace_back();

    // Trie over the folded patterns. Empty patterns never match.
    for (size_t p = 0; p < patterns_.size(); ++p) {
        if (patterns_[p].empty()) continue;
        int32_t state = 0;
        for (unsigned char raw : patterns_[p]) {
            auto c = fold(raw);
            auto& next = goto_[static_cast<size_t>(state)][c];
            if (next == -1) {
                next = static_cast<int32_t>(goto_.size());
                goto_.push_back(empty);
                outputs_.emplace_back();
            }
            state = goto_[static_cast<size_t>(state)][c];
        }
        outputs_[static_cast<size_t>(state)].push_back(static_cast<uint32_t>(p));
    }

    // Breadth-first failure links, folded into the transition table so that
    // every state has a defined move on every byte.
    std::vector<int32_t> fail(goto_.size(), 0);
    std::queue<int32_t> queue;
    for (size_t c = 0; c < 256; ++c) {
        auto& next = goto_[0][c];
        if (next == -1) {
            next = 0;
        } else {
            fail[static_cast<size_t>(next)] = 0;
            queue.push(next);
        }
    }
    while (!queue.empty()) {
        auto state = static_cast<size_t>(queue.front());
        queue.pop();
        auto f = static_cast<size_t>(fail[state]);
        const auto& inherited = outputs_[f];
        outputs_[state].insert(outputs_[state].end(), inherited.begin(), inherited.end());
        for (size_t c = 0; c < 256; ++c) {
            auto& next = goto_[state][c];
            if (next == -1) {
                next = goto_[f][c];
            } else {
                fail[static_cast<size_t>(next)] = goto_[f][c];
                queue.push(next);
            }
        }
    }
}

std::vector<AhoCorasick::Match> AhoCorasick::find_all(std::string_view text) const {
    std::vector<Match> out;
    scan(text, [&](const Match& m) { out.push_back(m); });
    return out;
}

bool AhoCorasick::contains_any(std::string_view text) const {
    if (outputs_.empty()) return false;
    int32_t state = 0;
    for (unsigned char c : text) {
        state = goto_[static_cast<size_t>(state)][fold(c)];
        if (!outputs_[static_cast<size_t>(state)].empty()) return true;
    }
    return false;
}

} // namespace credscan
