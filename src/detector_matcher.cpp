#include "detector_matcher.hpp"
#include "encoding.hpp"
#include "log.hpp"
#include <algorithm>
#include <optional>
#include <unordered_map>

namespace credscan {

MatchSpan EntireChunkSpanCalculator::calculate(size_t, std::string_view chunk, const Detector&) const {
    return MatchSpan{0, chunk.size()};
}

MatchSpan AdjustableSpanCalculator::calculate(size_t keyword_start, std::string_view chunk, const Detector& detector) const {
    size_t before = radius_;
    size_t after = radius_;

    if (auto span = detector.max_credential_span(); span > 0) {
        before = span;
        after = span;
    }
    if (auto size = detector.max_secret_size(); size > 0) after = size;
    if (auto offset = detector.start_offset(); offset > 0) before = offset;

    size_t start = keyword_start > before ? keyword_start - before : 0;
    size_t end = std::min(chunk.size(), keyword_start + after);
    if (start >= end) start = 0;
    return MatchSpan{start, end};
}

void DetectorMatch::merge_spans() {
    if (spans_.size() < 2) return;
    std::sort(spans_.begin(), spans_.end(), [](const MatchSpan& a, const MatchSpan& b) {
        return a.start < b.start || (a.start == b.start && a.end < b.end);
    });
    std::vector<MatchSpan> merged;
    merged.push_back(spans_.front());
    for (size_t i = 1; i < spans_.size(); ++i) {
        auto& current = merged.back();
        if (spans_[i].start <= current.end) {
            current.end = std::max(current.end, spans_[i].end);
        } else {
            merged.push_back(spans_[i]);
        }
    }
    spans_ = std::move(merged);
}

std::vector<std::string_view> DetectorMatch::matches(std::string_view chunk) const {
    std::vector<std::string_view> out;
    out.reserve(spans_.size());
    for (const auto& span : spans_) {
        if (span.start >= chunk.size()) continue;
        out.push_back(chunk.substr(span.start, std::min(span.end, chunk.size()) - span.start));
    }
    return out;
}

DetectorMatcher::DetectorMatcher(std::vector<std::shared_ptr<Detector>> detectors,
                                 std::unique_ptr<SpanCalculator> span_calculator)
    : span_calculator_(span_calculator ? std::move(span_calculator)
                                       : std::make_unique<AdjustableSpanCalculator>()) {
    std::erase(detectors, nullptr);
    std::stable_sort(detectors.begin(), detectors.end(), [](const auto& a, const auto& b) {
        return a->key() < b->key();
    });
    detectors_ = std::move(detectors);

    std::vector<std::string> keywords;
    std::unordered_map<std::string, size_t> keyword_index;
    for (size_t d = 0; d < detectors_.size(); ++d) {
        auto key = detectors_[d]->key();
        if (d > 0 && keys_.back() == key) {
            log::warn("detector {} registered more than once", key.loggable());
        }
        keys_.push_back(key);
        for (const auto& kw : detectors_[d]->keywords()) {
            if (kw.empty()) {
                log::warn("detector {} has an empty keyword, skipping it", key.loggable());
                continue;
            }
            auto lowered = to_lower_ascii(kw);
            auto [it, inserted] = keyword_index.try_emplace(lowered, keywords.size());
            if (inserted) {
                keywords.push_back(lowered);
                keyword_owners_.emplace_back();
            }
            auto& owners = keyword_owners_[it->second];
            if (owners.empty() || owners.back() != d) owners.push_back(d);
        }
    }
    automaton_ = AhoCorasick(std::move(keywords));
    log::debug(2, "detector matcher built with {} detectors and {} keywords", detectors_.size(), automaton_.patterns().size());
}

std::vector<std::shared_ptr<Detector>> DetectorMatcher::find_matches(std::string_view data) const {
    std::vector<bool> hit(detectors_.size(), false);
    automaton_.scan(data, [&](const AhoCorasick::Match& m) {
        for (size_t d : keyword_owners_[m.pattern]) hit[d] = true;
    });

    std::vector<std::shared_ptr<Detector>> out;
    for (size_t d = 0; d < detectors_.size(); ++d) {
        if (hit[d]) out.push_back(detectors_[d]);
    }
    return out;
}

std::vector<DetectorMatch> DetectorMatcher::find_detector_matches(std::string_view data) const {
    std::vector<std::optional<DetectorMatch>> by_detector(detectors_.size());
    automaton_.scan(data, [&](const AhoCorasick::Match& m) {
        for (size_t d : keyword_owners_[m.pattern]) {
            auto& match = by_detector[d];
            if (!match) match.emplace(keys_[d], detectors_[d]);
            match->add_span(span_calculator_->calculate(m.position, data, *detectors_[d]));
        }
    });

    std::vector<DetectorMatch> out;
    for (auto& match : by_detector) {
        if (!match) continue;
        match->merge_spans();
        out.push_back(std::move(*match));
    }
    return out;
}

std::map<std::string, std::vector<DetectorKey>> DetectorMatcher::keywords_to_detectors() const {
    std::map<std::string, std::vector<DetectorKey>> out;
    const auto& patterns = automaton_.patterns();
    for (size_t k = 0; k < patterns.size(); ++k) {
        auto& keys = out[patterns[k]];
        for (size_t d : keyword_owners_[k]) keys.push_back(keys_[d]);
    }
    return out;
}

} // namespace credscan
