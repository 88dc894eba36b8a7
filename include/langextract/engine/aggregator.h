#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <langextract/document/extraction.h>

namespace langextract::engine {

enum class OverlapStrategy {
    KeepHighestConfidence, ///< Greedy by confidence, then earlier start
    KeepLongest,           ///< Greedy by interval length, then confidence
    KeepFirst,             ///< Greedy in document order
    MergeOverlapping       ///< Collapse each overlapping cluster into one extraction
};

const char* toString(OverlapStrategy strategy);
std::optional<OverlapStrategy> parseOverlapStrategy(std::string_view name);

struct AggregationOptions {
    bool enableDeduplication = true;
    OverlapStrategy overlapStrategy = OverlapStrategy::KeepHighestConfidence;
    double confidenceThreshold = 0.5;
};

struct AggregationStats {
    std::size_t originalCount = 0;
    std::size_t duplicatesRemoved = 0;
    std::size_t overlapsResolved = 0;
    std::size_t lowConfidenceFiltered = 0;
    std::size_t finalCount = 0;
};

/**
 * @brief Dedup, overlap resolution and confidence filtering over pass results.
 *
 * Every step preserves the relative order of the extractions it keeps. Ungrounded
 * extractions never take part in overlap resolution.
 */
class Aggregator {
public:
    explicit Aggregator(AggregationOptions options = {});

    const AggregationOptions& options() const noexcept { return options_; }

    /**
     * @brief Keep one extraction per (class, text).
     *
     * The survivor is the highest confidence member (missing counts as 0, ties keep the
     * first seen) and takes the slot of the group's first occurrence.
     */
    std::vector<document::Extraction> deduplicate(std::vector<document::Extraction> input) const;

    /// @param sourceText used by MergeOverlapping to read the merged span; may be empty
    std::vector<document::Extraction> resolveOverlaps(std::vector<document::Extraction> input,
                                                      std::string_view sourceText = {}) const;

    /// Drops extractions whose confidence is present and below @p threshold
    std::vector<document::Extraction>
    filterByConfidence(std::vector<document::Extraction> input, double threshold) const;

    std::vector<document::Extraction> aggregate(std::vector<document::Extraction> input,
                                                std::string_view sourceText,
                                                AggregationStats* stats = nullptr) const;

private:
    std::vector<document::Extraction> keepGreedy(std::vector<document::Extraction> input) const;
    std::vector<document::Extraction> mergeClusters(std::vector<document::Extraction> input,
                                                    std::string_view sourceText) const;

    AggregationOptions options_;
};

} // namespace langextract::engine
