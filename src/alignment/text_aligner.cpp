#include <langextract/alignment/text_aligner.h>
#include <langextract/alignment/text_normalizer.h>
#include <langextract/core/format.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <optional>

namespace langextract::alignment {

using document::AlignmentStatus;
using document::CharInterval;

Result<void> AlignmentOptions::validate() const {
    if (maxDistance < 0) {
        return Error{ErrorCode::InvalidArgument,
                     format("max distance must be non-negative, got {}", maxDistance)};
    }
    if (minConfidence < 0.0 || minConfidence > 1.0) {
        return Error{ErrorCode::InvalidArgument,
                     format("min confidence must be within [0, 1], got {}", minConfidence)};
    }
    if (maxCandidates <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     format("max candidates must be positive, got {}", maxCandidates)};
    }
    if (windowSize < 0) {
        return Error{ErrorCode::InvalidArgument,
                     format("window size must be non-negative, got {}", windowSize)};
    }
    if (timeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     format("timeout must be positive, got {}ms", timeout.count())};
    }
    return {};
}

namespace {

using Clock = std::chrono::steady_clock;

constexpr double kQualityStepPerNormalization = 15.0;

// Deadline and cancellation check, charged by the DP cells spent
class SearchBudget {
public:
    static constexpr std::size_t kCellsPerPoll = std::size_t{1} << 16;
    static constexpr std::size_t kCellsPerWindow = 64;

    SearchBudget(std::chrono::milliseconds timeout, const ExecutionContext* ctx)
        : deadline_(Clock::now() + timeout), ctx_(ctx) {}

    bool charge(std::size_t cells) {
        if (exhausted_) {
            return true;
        }
        spent_ += cells;
        if (spent_ < kCellsPerPoll) {
            return false;
        }
        spent_ = 0;
        return poll();
    }

    bool poll() {
        if (Clock::now() >= deadline_ || (ctx_ && !ctx_->check())) {
            exhausted_ = true;
        }
        return exhausted_;
    }

    bool wasExhausted() const noexcept { return exhausted_; }

private:
    Clock::time_point deadline_;
    const ExecutionContext* ctx_;
    std::size_t spent_ = 0;
    bool exhausted_ = false;
};

std::size_t absDiff(std::size_t a, std::size_t b) {
    return a > b ? a - b : b - a;
}

AlignmentResult makeResult(std::string_view source, CharInterval interval, AlignmentStatus status,
                           double quality, std::string method, std::size_t editDistance = 0) {
    AlignmentResult r;
    r.interval = interval;
    r.status = status;
    r.quality = quality;
    r.confidence = quality / 100.0;
    r.method = std::move(method);
    r.alignedText = std::string(source.substr(interval.start, interval.length()));
    r.editDistance = editDistance;
    return r;
}

std::vector<NormalizationLevel> normalizationLevels(const AlignmentOptions& options) {
    std::vector<NormalizationLevel> levels;
    NormalizationLevel level;
    if (!options.caseSensitive) {
        level.foldCase = true;
        levels.push_back(level);
    }
    if (options.ignoreWhitespace) {
        level.collapseWhitespace = true;
        levels.push_back(level);
    }
    if (options.ignorePunctuation) {
        level.stripPunctuation = true;
        levels.push_back(level);
    }
    return levels;
}

NormalizationLevel strongestLevel(const AlignmentOptions& options) {
    NormalizationLevel level;
    level.foldCase = !options.caseSensitive;
    level.collapseWhitespace = options.ignoreWhitespace;
    level.stripPunctuation = options.ignorePunctuation;
    return level;
}

/**
 * Occurrence of @p needle in @p haystack. Without a hint the first one; with a hint the one
 * whose original start (via @p toOriginal) is nearest, ties going to the earliest.
 */
template <typename ToOriginal>
std::optional<std::size_t> findOccurrence(std::string_view haystack, std::string_view needle,
                                          std::optional<std::size_t> hint,
                                          ToOriginal toOriginal) {
    std::size_t pos = haystack.find(needle);
    if (pos == std::string_view::npos || !hint) {
        return pos == std::string_view::npos ? std::nullopt : std::optional<std::size_t>(pos);
    }

    std::size_t best = pos;
    std::size_t bestDist = absDiff(toOriginal(pos), *hint);
    while (toOriginal(pos) < *hint) {
        pos = haystack.find(needle, pos + 1);
        if (pos == std::string_view::npos) {
            break;
        }
        std::size_t dist = absDiff(toOriginal(pos), *hint);
        if (dist < bestDist) {
            best = pos;
            bestDist = dist;
        }
    }
    return best;
}

std::optional<AlignmentResult> exactMatch(std::string_view extracted, std::string_view source,
                                          const AlignmentOptions& options) {
    auto pos = findOccurrence(source, extracted, options.positionHint,
                              [](std::size_t p) { return p; });
    if (!pos) {
        return std::nullopt;
    }
    return makeResult(source, CharInterval{*pos, *pos + extracted.size()}, AlignmentStatus::Exact,
                      100.0, "exact");
}

std::optional<AlignmentResult> normalizedMatch(std::string_view extracted,
                                               std::string_view source,
                                               const NormalizationLevel& level,
                                               const AlignmentOptions& options) {
    std::string needle = normalize(extracted, level);
    if (needle.empty()) {
        return std::nullopt;
    }
    auto hay = NormalizedText::build(source, level);
    auto pos = findOccurrence(hay.text(), needle, options.positionHint, [&](std::size_t p) {
        return hay.toOriginal(p, p + 1).start;
    });
    if (!pos) {
        return std::nullopt;
    }

    const int applied = level.applied();
    const auto status = (applied == 1 && level.foldCase) ? AlignmentStatus::FuzzyCase
                                                         : AlignmentStatus::FuzzyWhitespace;
    const double quality = 100.0 - kQualityStepPerNormalization * applied;
    return makeResult(source, hay.toOriginal(*pos, *pos + needle.size()), status, quality,
                      "normalized");
}

struct Candidate {
    std::size_t distance;
    std::size_t hintDistance;
    CharInterval interval;
    std::size_t lengthGap;
};

std::optional<AlignmentResult> approximateMatch(std::string_view extracted,
                                                std::string_view source,
                                                const AlignmentOptions& options,
                                                const LevenshteinDistance& metric,
                                                SearchBudget& budget) {
    const auto level = strongestLevel(options);
    const std::string needle = normalize(extracted, level);
    const auto hay = NormalizedText::build(source, level);
    if (needle.empty() || hay.empty()) {
        return std::nullopt;
    }

    const auto maxDistance = static_cast<std::size_t>(options.maxDistance);
    const std::size_t needleLen = needle.size();
    const std::size_t minLen = needleLen > maxDistance ? needleLen - maxDistance : 1;
    const std::size_t maxLen = needleLen + maxDistance;

    std::size_t lo = 0;
    std::size_t hi = hay.size();
    if (options.positionHint) {
        const std::size_t center = hay.fromOriginal(*options.positionHint);
        const auto radius = static_cast<std::size_t>(options.windowSize);
        lo = center > radius ? center - radius : 0;
        hi = std::min(hay.size(), center + radius + 1);
    }

    const std::string_view hayView = hay.text();
    const LevenshteinDistance::RowObserver onRow = [&budget](std::size_t cells) {
        return budget.charge(cells);
    };
    std::vector<Candidate> candidates;
    for (std::size_t start = lo; start < hi && !budget.wasExhausted(); ++start) {
        if (hayView[start] == ' ') {
            continue;
        }
        for (std::size_t len = minLen; len <= maxLen; ++len) {
            const std::size_t end = start + len;
            if (end > hayView.size()) {
                break;
            }
            if (budget.charge(SearchBudget::kCellsPerWindow)) {
                break;
            }
            if (hayView[end - 1] == ' ') {
                continue;
            }
            auto dist =
                metric.boundedDistance(needle, hayView.substr(start, len), maxDistance, onRow);
            if (!dist) {
                continue;
            }
            const double quality =
                100.0 * (1.0 - static_cast<double>(*dist) /
                                   static_cast<double>(std::max<std::size_t>(needleLen, 1)));
            if (quality / 100.0 < options.minConfidence) {
                continue;
            }
            const auto interval = hay.toOriginal(start, end);
            const std::size_t hintDistance =
                options.positionHint ? absDiff(interval.start, *options.positionHint) : 0;
            candidates.push_back(Candidate{*dist, hintDistance, interval, absDiff(len, needleLen)});
        }
    }

    if (candidates.empty()) {
        return std::nullopt;
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.distance != b.distance)
            return a.distance < b.distance;
        if (a.hintDistance != b.hintDistance)
            return a.hintDistance < b.hintDistance;
        if (a.interval.start != b.interval.start)
            return a.interval.start < b.interval.start;
        return a.lengthGap < b.lengthGap;
    });
    const std::size_t considered = candidates.size();
    if (candidates.size() > static_cast<std::size_t>(options.maxCandidates)) {
        candidates.resize(static_cast<std::size_t>(options.maxCandidates));
    }

    const auto& best = candidates.front();
    const double quality =
        100.0 * (1.0 - static_cast<double>(best.distance) /
                           static_cast<double>(std::max<std::size_t>(needleLen, 1)));
    auto result = makeResult(source, best.interval, AlignmentStatus::FuzzyApproximate, quality,
                             "approximate", best.distance);
    result.candidatesConsidered = considered;
    return result;
}

} // namespace

TextAligner::TextAligner(AlignmentOptions defaults) : defaults_(std::move(defaults)) {}

Result<AlignmentResult> TextAligner::alignExtraction(std::string_view extractedText,
                                                     std::string_view sourceText) const {
    return alignExtraction(extractedText, sourceText, defaults_);
}

Result<AlignmentResult> TextAligner::alignExtraction(std::string_view extractedText,
                                                     std::string_view sourceText,
                                                     const AlignmentOptions& options,
                                                     const ExecutionContext* ctx) const {
    if (auto valid = options.validate(); !valid) {
        return valid.error();
    }
    if (extractedText.empty() || sourceText.empty()) {
        return AlignmentResult{};
    }

    if (auto exact = exactMatch(extractedText, sourceText, options)) {
        return *exact;
    }

    SearchBudget budget(options.timeout, ctx);
    for (const auto& level : normalizationLevels(options)) {
        if (budget.poll()) {
            break;
        }
        if (auto match = normalizedMatch(extractedText, sourceText, level, options)) {
            return *match;
        }
    }

    if (!budget.wasExhausted()) {
        if (auto approx = approximateMatch(extractedText, sourceText, options, metric_, budget)) {
            approx->timedOut = budget.wasExhausted();
            return *approx;
        }
    }

    AlignmentResult none;
    none.timedOut = budget.wasExhausted();
    if (none.timedOut) {
        spdlog::debug("alignment of '{}' stopped early without a match", extractedText);
    }
    return none;
}

Result<std::vector<AlignmentResult>>
TextAligner::alignExtractions(const std::vector<std::string>& extractedTexts,
                              std::string_view sourceText, const AlignmentOptions& options,
                              const ExecutionContext* ctx) const {
    if (auto valid = options.validate(); !valid) {
        return valid.error();
    }

    std::vector<AlignmentResult> results;
    results.reserve(extractedTexts.size());
    std::optional<std::size_t> hint = options.positionHint;

    for (const auto& text : extractedTexts) {
        AlignmentOptions local = options;
        local.positionHint = hint;
        auto aligned = alignExtraction(text, sourceText, local, ctx);
        if (!aligned) {
            return aligned.error();
        }
        auto result = std::move(aligned).value();

        if (!result.found() && hint) {
            local.positionHint.reset();
            auto retry = alignExtraction(text, sourceText, local, ctx);
            if (!retry) {
                return retry.error();
            }
            result = std::move(retry).value();
        }

        if (result.found()) {
            hint = result.interval.end;
        }
        results.push_back(std::move(result));
    }
    return results;
}

Result<std::size_t> TextAligner::groundExtractions(std::vector<document::Extraction>& extractions,
                                                   const document::Document& doc,
                                                   const AlignmentOptions& options,
                                                   const ExecutionContext* ctx) const {
    return groundExtractions(extractions, doc, CharInterval{0, doc.length()}, options, ctx);
}

Result<std::size_t> TextAligner::groundExtractions(std::vector<document::Extraction>& extractions,
                                                   const document::Document& doc,
                                                   const CharInterval& window,
                                                   const AlignmentOptions& options,
                                                   const ExecutionContext* ctx) const {
    if (window.end < window.start || window.end > doc.length()) {
        return Error{ErrorCode::InvalidArgument,
                     format("window {} is outside document of length {}", window.toString(),
                            doc.length())};
    }
    const std::string_view source =
        std::string_view(doc.text()).substr(window.start, window.length());

    AlignmentOptions local = options;
    if (local.positionHint) {
        if (window.contains(*local.positionHint)) {
            *local.positionHint -= window.start;
        } else {
            local.positionHint.reset();
        }
    }

    std::vector<std::string> texts;
    texts.reserve(extractions.size());
    for (const auto& e : extractions) {
        texts.push_back(e.text);
    }

    auto aligned = alignExtractions(texts, source, local, ctx);
    if (!aligned) {
        return aligned.error();
    }

    std::size_t grounded = 0;
    const auto& results = aligned.value();
    for (std::size_t i = 0; i < extractions.size(); ++i) {
        auto& e = extractions[i];
        const auto& r = results[i];
        e.alignmentStatus = r.status;
        e.alignmentQuality = r.quality;
        if (r.found()) {
            const CharInterval mapped{window.start + r.interval.start,
                                      window.start + r.interval.end};
            e.charInterval = mapped;
            e.tokenInterval = doc.tokenIntervalFor(mapped);
            ++grounded;
        } else {
            e.charInterval.reset();
            e.tokenInterval.reset();
        }
    }
    return grounded;
}

Result<AlignmentResult> TextAligner::findBestAlignment(std::string_view extractedText,
                                                       std::string_view sourceText,
                                                       const AlignmentOptions& options) const {
    if (auto valid = options.validate(); !valid) {
        return valid.error();
    }
    AlignmentResult best;
    if (extractedText.empty() || sourceText.empty()) {
        return best;
    }

    auto consider = [&best](std::optional<AlignmentResult> candidate) {
        if (candidate && candidate->quality > best.quality) {
            best = std::move(*candidate);
        }
    };

    consider(exactMatch(extractedText, sourceText, options));
    for (const auto& level : normalizationLevels(options)) {
        consider(normalizedMatch(extractedText, sourceText, level, options));
    }
    SearchBudget budget(options.timeout, nullptr);
    auto approx = approximateMatch(extractedText, sourceText, options, metric_, budget);
    // Distance zero is a normalized match, already scored above
    if (approx && approx->editDistance > 0) {
        consider(std::move(approx));
    }
    best.timedOut = budget.wasExhausted();
    return best;
}

Result<double> TextAligner::validateAlignment(std::string_view extractedText,
                                              std::string_view sourceText,
                                              const CharInterval& interval) const {
    if (interval.end < interval.start || interval.end > sourceText.size()) {
        return Error{ErrorCode::InvalidArgument,
                     format("interval {} is outside text of length {}", interval.toString(),
                            sourceText.size())};
    }
    const auto slice = sourceText.substr(interval.start, interval.length());
    if (slice == extractedText) {
        return 1.0;
    }
    const auto level = strongestLevel(defaults_);
    return metric_.similarity(normalize(extractedText, level), normalize(slice, level));
}

} // namespace langextract::alignment
