#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <langextract/alignment/alignment_options.h>
#include <langextract/alignment/edit_distance.h>
#include <langextract/core/execution_context.h>
#include <langextract/document/document.h>
#include <langextract/document/extraction.h>

namespace langextract::alignment {

/**
 * @brief Locates model-produced text inside the source document.
 *
 * Strategies run in order and the first accepted match wins:
 *  1. exact substring search
 *  2. substring search after progressively aggressive normalization
 *  3. windowed edit-distance search around the position hint
 *  4. no match
 *
 * Alignment never fails because of the input text. The only error is an invalid set of
 * options; timeouts and cancellation yield the best candidate found so far, or no match.
 */
class TextAligner {
public:
    explicit TextAligner(AlignmentOptions defaults = {});

    const AlignmentOptions& defaults() const noexcept { return defaults_; }

    Result<AlignmentResult> alignExtraction(std::string_view extractedText,
                                            std::string_view sourceText) const;

    Result<AlignmentResult> alignExtraction(std::string_view extractedText,
                                            std::string_view sourceText,
                                            const AlignmentOptions& options,
                                            const ExecutionContext* ctx = nullptr) const;

    /**
     * @brief Align several texts in order.
     *
     * The end of each accepted match becomes the hint for the next text. When nothing is
     * found near the hint the search falls back to the whole document.
     */
    Result<std::vector<AlignmentResult>>
    alignExtractions(const std::vector<std::string>& extractedTexts, std::string_view sourceText,
                     const AlignmentOptions& options,
                     const ExecutionContext* ctx = nullptr) const;

    /**
     * @brief Ground extractions in place: sets char/token intervals, status and quality.
     *
     * Extractions that cannot be aligned keep no interval and get status None.
     * @return number of extractions that were grounded
     */
    Result<std::size_t> groundExtractions(std::vector<document::Extraction>& extractions,
                                          const document::Document& doc,
                                          const AlignmentOptions& options,
                                          const ExecutionContext* ctx = nullptr) const;

    /// As above, searching only @p window of the document; intervals stay in document offsets
    Result<std::size_t> groundExtractions(std::vector<document::Extraction>& extractions,
                                          const document::Document& doc,
                                          const document::CharInterval& window,
                                          const AlignmentOptions& options,
                                          const ExecutionContext* ctx = nullptr) const;

    /// Run every strategy and keep the highest quality; ties favour the earlier strategy
    Result<AlignmentResult> findBestAlignment(std::string_view extractedText,
                                              std::string_view sourceText,
                                              const AlignmentOptions& options) const;

    /**
     * @brief Confidence that @p interval of @p sourceText holds @p extractedText.
     *
     * 1.0 for an exact match, otherwise edit-distance similarity after normalization.
     */
    Result<double> validateAlignment(std::string_view extractedText, std::string_view sourceText,
                                     const document::CharInterval& interval) const;

private:
    AlignmentOptions defaults_;
    LevenshteinDistance metric_;
};

} // namespace langextract::alignment
