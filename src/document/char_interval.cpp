#include <langextract/core/format.h>
#include <langextract/document/alignment_status.h>
#include <langextract/document/char_interval.h>

namespace langextract::document {

Result<CharInterval> CharInterval::create(std::size_t start, std::size_t end,
                                          std::size_t textLength) {
    if (end < start) {
        return Error{ErrorCode::InvalidArgument,
                     format("interval end {} precedes start {}", end, start)};
    }
    if (end > textLength) {
        return Error{ErrorCode::InvalidArgument,
                     format("interval end {} exceeds text length {}", end, textLength)};
    }
    return CharInterval{start, end};
}

std::optional<CharInterval> CharInterval::intersection(const CharInterval& other) const noexcept {
    if (!overlaps(other)) {
        return std::nullopt;
    }
    return CharInterval{std::max(start, other.start), std::min(end, other.end)};
}

std::string CharInterval::toString() const {
    return format("[{}:{})", start, end);
}

std::string TokenInterval::toString() const {
    return format("[{}:{})", start, end);
}

std::optional<AlignmentStatus> parseAlignmentStatus(std::string_view name) {
    for (auto status : {AlignmentStatus::Exact, AlignmentStatus::FuzzyCase,
                        AlignmentStatus::FuzzyWhitespace, AlignmentStatus::FuzzyApproximate,
                        AlignmentStatus::None}) {
        if (name == toString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

} // namespace langextract::document
