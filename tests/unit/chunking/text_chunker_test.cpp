#include <cctype>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <langextract/chunking/text_chunker.h>

using namespace langextract;
using namespace langextract::chunking;
using document::CharInterval;

namespace {

// 70 characters, four sentences whose periods sit at 16, 36, 52 and 69
constexpr const char* kFourSentences =
    "Alpha beta gamma. Delta epsilon zeta. Eta theta iota. Kappa lambda mu.";

} // namespace

class TextChunkerTest : public ::testing::Test {
protected:
    static ChunkingOptions options(ChunkingStrategy strategy, std::size_t maxSize,
                                   std::size_t minSize = 1, double overlap = 0.0) {
        ChunkingOptions o;
        o.enabled = true;
        o.strategy = strategy;
        o.maxChunkSize = maxSize;
        o.minChunkSize = minSize;
        o.overlapRatio = overlap;
        return o;
    }

    static std::vector<TextChunk> chunk(const std::string& text, const ChunkingOptions& o) {
        auto r = TextChunker(o).chunk(text);
        EXPECT_TRUE(r) << (r ? "" : r.error().message);
        return r ? r.value() : std::vector<TextChunk>{};
    }
};

TEST_F(TextChunkerTest, StrategyNames) {
    EXPECT_STREQ(toString(ChunkingStrategy::FixedSize), "fixed");
    EXPECT_EQ(parseChunkingStrategy("sentence"), ChunkingStrategy::SentenceBased);
    EXPECT_EQ(parseChunkingStrategy("paragraph"), ChunkingStrategy::ParagraphBased);
    EXPECT_FALSE(parseChunkingStrategy("semantic").has_value());
}

TEST_F(TextChunkerTest, InvalidOptionsRejected) {
    const std::string text = kFourSentences;
    for (auto bad : {options(ChunkingStrategy::FixedSize, 0, 0),
                     options(ChunkingStrategy::FixedSize, 100, 1, 0.5),
                     options(ChunkingStrategy::FixedSize, 100, 1, -0.1),
                     options(ChunkingStrategy::FixedSize, 100, 100)}) {
        auto r = TextChunker(bad).chunk(text);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    }
}

TEST_F(TextChunkerTest, ShortTextIsOneTrimmedChunk) {
    auto chunks = chunk("  Hello world.  ", options(ChunkingStrategy::SentenceBased, 1000, 50));
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].interval, (CharInterval{2, 14}));
    EXPECT_EQ(chunks[0].totalChunks, 1u);
    EXPECT_EQ(chunks[0].overlapWithPrevious, 0u);
}

TEST_F(TextChunkerTest, BlankTextYieldsNoChunks) {
    EXPECT_TRUE(chunk("   \n\t ", options(ChunkingStrategy::FixedSize, 10)).empty());
    EXPECT_TRUE(chunk("", options(ChunkingStrategy::FixedSize, 10)).empty());
}

TEST_F(TextChunkerTest, SentencesArePackedWithoutSplitting) {
    const std::string text = kFourSentences;
    auto chunks = chunk(text, options(ChunkingStrategy::SentenceBased, 40));
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].interval, (CharInterval{0, 37}));
    EXPECT_EQ(chunks[0].text(text), "Alpha beta gamma. Delta epsilon zeta.");
    EXPECT_EQ(chunks[1].interval, (CharInterval{38, 70}));
    EXPECT_EQ(chunks[1].text(text), "Eta theta iota. Kappa lambda mu.");
    EXPECT_EQ(chunks[1].index, 1u);
    EXPECT_EQ(chunks[1].totalChunks, 2u);
}

TEST_F(TextChunkerTest, OverlapCarriesWholeWordsFromPreviousChunk) {
    const std::string text = kFourSentences;
    auto chunks = chunk(text, options(ChunkingStrategy::SentenceBased, 40, 1, 0.25));
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].interval, (CharInterval{0, 37}));
    EXPECT_EQ(chunks[1].interval, (CharInterval{32, 70}));
    EXPECT_EQ(chunks[1].overlapWithPrevious, 6u);
    EXPECT_EQ(chunks[1].text(text), "zeta. Eta theta iota. Kappa lambda mu.");
}

TEST_F(TextChunkerTest, ShortTrailingChunkIsFolded) {
    const std::string text = "Alpha beta gamma. Delta epsilon zeta. Ok.";
    auto chunks = chunk(text, options(ChunkingStrategy::SentenceBased, 40, 20));
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].interval, (CharInterval{0, 41}));
}

TEST_F(TextChunkerTest, FixedWindowsBreakBetweenWords) {
    const std::string text = "aaaa bbbb cccc dddd eeee ffff gggg";
    auto chunks = chunk(text, options(ChunkingStrategy::FixedSize, 20));
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].text(text), "aaaa bbbb cccc dddd");
    EXPECT_EQ(chunks[1].text(text), "eeee ffff gggg");
    EXPECT_EQ(chunks[1].interval, (CharInterval{20, 34}));
}

TEST_F(TextChunkerTest, ParagraphsKeepTheirBoundaries) {
    const std::string text = "First para line one.\n\nSecond para here.\n\nThird.";
    auto chunks = chunk(text, options(ChunkingStrategy::ParagraphBased, 25));
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].text(text), "First para line one.");
    EXPECT_EQ(chunks[1].text(text), "Second para here.\n\nThird.");
}

TEST_F(TextChunkerTest, SentenceBoundariesSkipTitles) {
    EXPECT_EQ(TextChunker::findSentenceBoundaries("Dr. Smith arrived. He left!"),
              (std::vector<std::size_t>{19, 27}));
    EXPECT_EQ(TextChunker::findParagraphBoundaries("one\n  \ntwo\n\n\nthree"),
              (std::vector<std::size_t>{7, 13, 18}));
}

TEST_F(TextChunkerTest, ToDocumentShiftsByChunkStart) {
    TextChunk c;
    c.interval = CharInterval{100, 180};
    EXPECT_EQ(c.toDocument(CharInterval{5, 12}), (CharInterval{105, 112}));
}

TEST_F(TextChunkerTest, EstimateChunks) {
    TextChunker chunker(options(ChunkingStrategy::FixedSize, 1000));
    EXPECT_EQ(chunker.estimateChunks(0), 0u);
    EXPECT_EQ(chunker.estimateChunks(1), 1u);
    EXPECT_EQ(chunker.estimateChunks(1000), 1u);
    EXPECT_EQ(chunker.estimateChunks(1001), 2u);
}

TEST_F(TextChunkerTest, CancelledContextStopsChunking) {
    ExecutionContext ctx;
    ctx.cancel();
    auto r = TextChunker(options(ChunkingStrategy::FixedSize, 10)).chunk(kFourSentences, &ctx);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
}

// Every strategy covers each visible character and keeps chunks ordered and bounded
TEST_F(TextChunkerTest, ChunksCoverTextInOrder) {
    std::string text;
    for (int p = 0; p < 6; ++p) {
        for (int s = 0; s < 5; ++s) {
            text += "Sentence " + std::to_string(p * 5 + s) + " talks about item number " +
                    std::to_string(s) + ". ";
        }
        text += "\n\n";
    }
    text += "An unterminated closing remark without any punctuation at all just keeps going on";

    for (auto strategy : {ChunkingStrategy::FixedSize, ChunkingStrategy::SentenceBased,
                          ChunkingStrategy::ParagraphBased}) {
        const auto o = options(strategy, 120, 30, 0.2);
        auto chunks = chunk(text, o);
        ASSERT_GT(chunks.size(), 1u) << toString(strategy);

        std::vector<bool> covered(text.size(), false);
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            const auto& c = chunks[i];
            EXPECT_EQ(c.index, i);
            EXPECT_EQ(c.totalChunks, chunks.size());
            EXPECT_LE(c.interval.end, text.size());
            // Only the last chunk may hold a folded tail
            const std::size_t budget = i + 1 < chunks.size() ? o.maxChunkSize : 2 * o.maxChunkSize;
            EXPECT_LE(c.interval.length() - c.overlapWithPrevious, budget)
                << toString(strategy) << " chunk " << i;
            if (i > 0) {
                EXPECT_LE(chunks[i - 1].interval.start, c.interval.start);
                EXPECT_LE(chunks[i - 1].interval.end, c.interval.end);
            }
            for (std::size_t pos = c.interval.start; pos < c.interval.end; ++pos) {
                covered[pos] = true;
            }
        }
        for (std::size_t pos = 0; pos < text.size(); ++pos) {
            if (!std::isspace(static_cast<unsigned char>(text[pos]))) {
                ASSERT_TRUE(covered[pos]) << toString(strategy) << " misses offset " << pos;
            }
        }
    }
}
