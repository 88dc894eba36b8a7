#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <langextract/core/types.h>
#include <langextract/document/alignment_status.h>
#include <langextract/document/char_interval.h>

namespace langextract::alignment {

/**
 * @brief Tuning knobs for locating extracted text inside a source document.
 */
struct AlignmentOptions {
    bool caseSensitive = false;    ///< When false, a case-folded pass is attempted
    bool ignoreWhitespace = true;  ///< Collapse whitespace runs before matching
    bool ignorePunctuation = false; ///< Strip punctuation before matching

    int maxDistance = 5;       ///< Largest edit distance accepted by approximate matching
    double minConfidence = 0.7; ///< Approximate matches scoring below this are rejected
    int maxCandidates = 10;    ///< Approximate candidates retained after ranking
    int windowSize = 100;      ///< Search radius around the position hint, in characters
    std::chrono::milliseconds timeout{5000};

    /// Preferred offset; the nearest qualifying match wins
    std::optional<std::size_t> positionHint;

    /// InvalidArgument when any numeric knob is out of range
    Result<void> validate() const;
};

/**
 * @brief Outcome of aligning one piece of extracted text.
 */
struct AlignmentResult {
    document::CharInterval interval;
    document::AlignmentStatus status = document::AlignmentStatus::None;
    double quality = 0.0;    ///< [0, 100]
    double confidence = 0.0; ///< quality / 100
    std::string method = "none";
    std::string alignedText; ///< Source text covered by @ref interval
    std::size_t editDistance = 0;
    std::size_t candidatesConsidered = 0;
    bool timedOut = false;

    bool found() const noexcept { return status != document::AlignmentStatus::None; }
};

} // namespace langextract::alignment
