#include <algorithm>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <langextract/engine/aggregator.h>

using namespace langextract;
using namespace langextract::engine;
using document::AlignmentStatus;
using document::CharInterval;
using document::Extraction;

namespace {

Extraction make(std::string cls, std::string text, std::optional<double> confidence,
                std::optional<CharInterval> span = std::nullopt) {
    Extraction e(std::move(cls), std::move(text));
    e.confidence = confidence;
    if (span) {
        e.charInterval = *span;
        e.alignmentStatus = AlignmentStatus::Exact;
    }
    return e;
}

bool pairwiseDisjoint(const std::vector<Extraction>& items) {
    for (std::size_t i = 0; i < items.size(); ++i) {
        for (std::size_t j = i + 1; j < items.size(); ++j) {
            if (items[i].isGrounded() && items[j].isGrounded() &&
                items[i].charInterval->overlaps(*items[j].charInterval)) {
                return false;
            }
        }
    }
    return true;
}

} // namespace

class AggregatorTest : public ::testing::Test {
protected:
    Aggregator withStrategy(OverlapStrategy strategy) {
        AggregationOptions options;
        options.overlapStrategy = strategy;
        return Aggregator(options);
    }

    std::vector<Extraction> overlapping() {
        // "New York City" vs "York" vs "City Hall"
        return {make("loc", "New York City", 0.6, CharInterval{0, 13}),
                make("loc", "York", 0.9, CharInterval{4, 8}),
                make("loc", "City Hall", 0.7, CharInterval{9, 18}),
                make("org", "Acme", 0.8, CharInterval{30, 34})};
    }
};

TEST_F(AggregatorTest, DeduplicateKeepsHighestConfidenceInFirstSlot) {
    Aggregator agg;
    std::vector<Extraction> input{make("person", "John", 0.8), make("org", "Acme", 0.5),
                                  make("person", "John", 0.9), make("person", "John", 0.9)};
    auto out = agg.deduplicate(input);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].text, "John");
    EXPECT_EQ(out[0].confidence, 0.9);
    EXPECT_EQ(out[1].text, "Acme");
}

TEST_F(AggregatorTest, DeduplicateIsIdempotent) {
    Aggregator agg;
    std::vector<Extraction> input{make("a", "x", 0.1), make("a", "x", 0.4), make("b", "x", 0.2),
                                  make("a", "y", std::nullopt), make("a", "y", 0.3)};
    auto once = agg.deduplicate(input);
    auto twice = agg.deduplicate(once);
    ASSERT_EQ(once.size(), twice.size());
    for (std::size_t i = 0; i < once.size(); ++i) {
        EXPECT_EQ(once[i].dedupKey(), twice[i].dedupKey());
        EXPECT_EQ(once[i].confidence, twice[i].confidence);
    }
    EXPECT_EQ(once.size(), 3u);
}

TEST_F(AggregatorTest, ConfidenceFilterDropsOnlyLowScores) {
    Aggregator agg;
    std::vector<Extraction> input{make("a", "low", 0.3), make("a", "high", 0.8),
                                  make("a", "unknown", std::nullopt)};
    auto out = agg.filterByConfidence(input, 0.5);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].text, "high");
    EXPECT_EQ(out[1].text, "unknown");
}

TEST_F(AggregatorTest, KeepHighestConfidence) {
    auto out = withStrategy(OverlapStrategy::KeepHighestConfidence).resolveOverlaps(overlapping());
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].text, "York");
    EXPECT_EQ(out[1].text, "City Hall");
    EXPECT_EQ(out[2].text, "Acme");
    EXPECT_TRUE(pairwiseDisjoint(out));
}

TEST_F(AggregatorTest, KeepLongest) {
    auto out = withStrategy(OverlapStrategy::KeepLongest).resolveOverlaps(overlapping());
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].text, "New York City");
    EXPECT_EQ(out[1].text, "Acme");
}

TEST_F(AggregatorTest, KeepFirstUsesDocumentOrder) {
    auto input = overlapping();
    std::reverse(input.begin(), input.end());
    auto out = withStrategy(OverlapStrategy::KeepFirst).resolveOverlaps(input);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].text, "Acme");
    EXPECT_EQ(out[1].text, "New York City");
}

TEST_F(AggregatorTest, MergeOverlappingClusters) {
    const std::string source = "New York City Hall hosts the Acme expo";
    auto input = overlapping();
    input[0].attributes["kind"] = "city";
    input[1].attributes["kind"] = "borough";
    input[2].attributes["floor"] = 2;

    auto out = withStrategy(OverlapStrategy::MergeOverlapping).resolveOverlaps(input, source);
    ASSERT_EQ(out.size(), 2u);

    const auto& merged = out[0];
    EXPECT_EQ(merged.charInterval, (CharInterval{0, 18}));
    EXPECT_EQ(merged.text, "New York City Hall");
    EXPECT_EQ(merged.confidence, 0.9);
    EXPECT_EQ(merged.alignmentStatus, AlignmentStatus::Exact);
    EXPECT_EQ(merged.attributes["kind"], "borough");
    EXPECT_EQ(merged.attributes["floor"], 2);
    EXPECT_EQ(out[1].text, "Acme");
}

TEST_F(AggregatorTest, MergeWithoutSourceJoinsTexts) {
    auto out = withStrategy(OverlapStrategy::MergeOverlapping).resolveOverlaps(overlapping());
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].text, "New York City York City Hall");
}

TEST_F(AggregatorTest, UngroundedExtractionsPassThrough) {
    auto input = overlapping();
    input.insert(input.begin() + 1, make("loc", "Gotham", 0.99));
    for (auto strategy : {OverlapStrategy::KeepHighestConfidence, OverlapStrategy::KeepLongest,
                          OverlapStrategy::KeepFirst, OverlapStrategy::MergeOverlapping}) {
        auto out = withStrategy(strategy).resolveOverlaps(input);
        EXPECT_TRUE(std::any_of(out.begin(), out.end(),
                                [](const Extraction& e) { return e.text == "Gotham"; }))
            << toString(strategy);
    }
}

// Every strategy leaves grounded extractions pairwise non-overlapping
TEST_F(AggregatorTest, OverlapInvariantHoldsForAllStrategies) {
    std::vector<Extraction> input;
    for (std::size_t i = 0; i < 40; ++i) {
        const std::size_t start = (i * 7) % 60;
        const std::size_t len = 3 + (i * 5) % 11;
        input.push_back(make("c" + std::to_string(i % 3), "t" + std::to_string(i),
                             0.1 + static_cast<double>(i % 9) / 10.0,
                             CharInterval{start, start + len}));
    }
    for (auto strategy : {OverlapStrategy::KeepHighestConfidence, OverlapStrategy::KeepLongest,
                          OverlapStrategy::KeepFirst, OverlapStrategy::MergeOverlapping}) {
        auto out = withStrategy(strategy).resolveOverlaps(input);
        EXPECT_TRUE(pairwiseDisjoint(out)) << toString(strategy);
        EXPECT_FALSE(out.empty());
    }
}

TEST_F(AggregatorTest, AggregateReportsStats) {
    AggregationOptions options;
    options.confidenceThreshold = 0.75;
    Aggregator agg(options);

    auto input = overlapping();
    input.push_back(make("loc", "York", 0.4, CharInterval{4, 8}));
    AggregationStats stats;
    auto out = agg.aggregate(input, {}, &stats);

    EXPECT_EQ(stats.originalCount, 5u);
    EXPECT_EQ(stats.duplicatesRemoved, 1u);
    EXPECT_EQ(stats.overlapsResolved, 1u);
    EXPECT_EQ(stats.lowConfidenceFiltered, 1u);
    EXPECT_EQ(stats.finalCount, 2u);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].text, "York");
    EXPECT_EQ(out[1].text, "Acme");
}

TEST_F(AggregatorTest, StrategyNames) {
    EXPECT_EQ(parseOverlapStrategy("merge"), OverlapStrategy::MergeOverlapping);
    EXPECT_EQ(parseOverlapStrategy("longest"), OverlapStrategy::KeepLongest);
    EXPECT_FALSE(parseOverlapStrategy("random").has_value());
}
