#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <langextract/core/types.h>
#include <langextract/document/alignment_status.h>
#include <langextract/document/char_interval.h>

namespace langextract::document {

/**
 * @brief One candidate entity produced by a model.
 *
 * Created by the response parser, grounded by the alignment step and possibly dropped or
 * merged during aggregation.
 */
struct Extraction {
    std::string extractionClass;
    std::string text;
    std::optional<CharInterval> charInterval;
    std::optional<TokenInterval> tokenInterval;
    std::optional<AlignmentStatus> alignmentStatus;
    std::optional<double> alignmentQuality; ///< Quality actually achieved, [0, 100]
    std::optional<double> confidence;       ///< Model-reported confidence, [0, 1]
    std::optional<int> index;
    std::optional<int> groupIndex;
    std::optional<std::string> description;
    nlohmann::json attributes = nlohmann::json::object();

    Extraction() = default;
    Extraction(std::string cls, std::string txt)
        : extractionClass(std::move(cls)), text(std::move(txt)) {}

    /// Has an interval and a status other than None
    bool isGrounded() const noexcept;

    /// Grounded with quality at or above kWellGroundedQuality
    bool isWellGrounded() const noexcept;

    /// Confidence for ordering purposes; absent counts as 0
    double confidenceOrZero() const noexcept { return confidence.value_or(0.0); }

    /// Identity used for deduplication
    std::string dedupKey() const;
};

/**
 * @brief Few-shot example: a sample text with the extractions expected from it.
 */
struct ExampleData {
    std::string text;
    std::vector<Extraction> extractions;

    Result<void> validate() const;
};

nlohmann::json toJson(const Extraction& extraction);
Result<Extraction> extractionFromJson(const nlohmann::json& j);

nlohmann::json toJson(const ExampleData& example);
Result<ExampleData> exampleFromJson(const nlohmann::json& j);

} // namespace langextract::document
