#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <langextract/core/execution_context.h>
#include <langextract/core/types.h>
#include <langextract/document/char_interval.h>

namespace langextract::chunking {

/**
 * Where chunk boundaries may fall
 */
enum class ChunkingStrategy {
    FixedSize,      // Character windows, backed off to the nearest word break
    SentenceBased,  // Whole sentences packed up to the size limit
    ParagraphBased  // Whole paragraphs, oversized ones split by sentence
};

const char* toString(ChunkingStrategy strategy);
std::optional<ChunkingStrategy> parseChunkingStrategy(std::string_view name);

/**
 * Configuration for splitting a document before extraction
 */
struct ChunkingOptions {
    bool enabled = false;
    ChunkingStrategy strategy = ChunkingStrategy::SentenceBased;
    std::size_t maxChunkSize = 1000; // Characters, excluding the overlap carried from the previous chunk
    std::size_t minChunkSize = 50;   // A shorter trailing chunk is folded into its predecessor
    double overlapRatio = 0.1;       // Fraction of maxChunkSize repeated from the previous chunk, [0, 0.5)

    Result<void> validate() const;

    std::size_t overlapSize() const noexcept {
        return static_cast<std::size_t>(static_cast<double>(maxChunkSize) * overlapRatio);
    }
};

/**
 * A contiguous slice of the source document
 */
struct TextChunk {
    std::size_t index = 0;
    std::size_t totalChunks = 0;
    document::CharInterval interval; // Position in the document
    std::size_t overlapWithPrevious = 0;

    std::string_view text(std::string_view documentText) const {
        return documentText.substr(interval.start, interval.length());
    }

    /// Map an interval relative to this chunk back to document offsets
    document::CharInterval toDocument(const document::CharInterval& local) const {
        return {interval.start + local.start, interval.start + local.end};
    }
};

/**
 * @brief Splits text into ordered, possibly overlapping chunks.
 *
 * Chunks are views of the original text, never rewritten copies, so offsets found inside
 * a chunk translate to document offsets by adding the chunk start. Together the chunks
 * cover every non-whitespace character of the input.
 */
class TextChunker {
public:
    explicit TextChunker(ChunkingOptions options = {});

    const ChunkingOptions& options() const noexcept { return options_; }

    /**
     * @brief Chunk @p text with the configured strategy.
     *
     * Text no longer than maxChunkSize yields a single chunk. Blank text yields none.
     * Fails with InvalidArgument for bad options, or with the context's error when
     * cancelled.
     */
    Result<std::vector<TextChunk>> chunk(std::string_view text,
                                         const ExecutionContext* ctx = nullptr) const;

    /// Rough chunk count for progress reporting
    std::size_t estimateChunks(std::size_t textLength) const;

    // Boundary helpers, positions are offsets just past each boundary
    static std::vector<std::size_t> findSentenceBoundaries(std::string_view text);
    static std::vector<std::size_t> findParagraphBoundaries(std::string_view text);

private:
    std::vector<document::CharInterval> fixedSpans(std::string_view text,
                                                   document::CharInterval range) const;
    std::vector<document::CharInterval> packSpans(std::string_view text,
                                                  const std::vector<std::size_t>& boundaries,
                                                  document::CharInterval range,
                                                  bool splitBySentence) const;

    ChunkingOptions options_;
};

} // namespace langextract::chunking
