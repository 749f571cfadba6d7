#pragma once

#include "aho_corasick.hpp"
#include "detector.hpp"
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace credscan {

// Half-open byte range [start, end) of a chunk.
struct MatchSpan {
    size_t start = 0;
    size_t end = 0;

    bool operator==(const MatchSpan&) const = default;
};

// Decides which part of a chunk around a keyword hit is handed to a detector.
class SpanCalculator {
public:
    virtual ~SpanCalculator() = default;
    virtual MatchSpan calculate(size_t keyword_start, std::string_view chunk, const Detector& detector) const = 0;
};

class EntireChunkSpanCalculator final : public SpanCalculator {
public:
    MatchSpan calculate(size_t keyword_start, std::string_view chunk, const Detector& detector) const override;
};

// Window of `radius` bytes on both sides of the keyword, narrowed or widened
// by the detector's max_credential_span, max_secret_size and start_offset.
class AdjustableSpanCalculator final : public SpanCalculator {
public:
    static constexpr size_t kDefaultRadius = 512;

    explicit AdjustableSpanCalculator(size_t radius = kDefaultRadius) : radius_(radius) {}
    MatchSpan calculate(size_t keyword_start, std::string_view chunk, const Detector& detector) const override;

private:
    size_t radius_;
};

// One matched detector with the merged spans of the chunk it should inspect.
// The string_views from matches() point into the chunk passed to
// find_detector_matches and are only valid while it lives.
class DetectorMatch {
public:
    DetectorMatch(DetectorKey key, std::shared_ptr<Detector> detector)
        : key_(std::move(key)), detector_(std::move(detector)) {}

    const DetectorKey& key() const { return key_; }
    const std::shared_ptr<Detector>& detector() const { return detector_; }
    const std::vector<MatchSpan>& spans() const { return spans_; }

    void add_span(MatchSpan span) { spans_.push_back(span); }

    // Sorts spans and merges overlapping or touching ones.
    void merge_spans();

    std::vector<std::string_view> matches(std::string_view chunk) const;

private:
    DetectorKey key_;
    std::shared_ptr<Detector> detector_;
    std::vector<MatchSpan> spans_;
};

// Keyword prefilter over every registered detector. Immutable after
// construction and safe for concurrent lookups.
class DetectorMatcher {
public:
    explicit DetectorMatcher(std::vector<std::shared_ptr<Detector>> detectors,
                             std::unique_ptr<SpanCalculator> span_calculator = nullptr);

    // Detectors whose keywords occur in data (ASCII case-insensitive), each
    // once, ordered by key.
    std::vector<std::shared_ptr<Detector>> find_matches(std::string_view data) const;

    // Same selection with the spans each detector should see, ordered by key.
    std::vector<DetectorMatch> find_detector_matches(std::string_view data) const;

    std::map<std::string, std::vector<DetectorKey>> keywords_to_detectors() const;

    const std::vector<std::shared_ptr<Detector>>& detectors() const { return detectors_; }
    size_t keyword_count() const { return automaton_.patterns().size(); }

private:
    std::vector<std::shared_ptr<Detector>> detectors_;  // sorted by key
    std::vector<DetectorKey> keys_;
    std::vector<std::vector<size_t>> keyword_owners_;   // keyword index -> detector indices
    AhoCorasick automaton_;
    std::unique_ptr<SpanCalculator> span_calculator_;
};

} // namespace credscan
