#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace langextract::document {

enum class AlignmentStatus { Exact, FuzzyCase, FuzzyWhitespace, FuzzyApproximate, None };

/// Quality threshold at which an alignment counts as well grounded
inline constexpr double kWellGroundedQuality = 60.0;

/// Nominal quality of a status in [0, 100]
constexpr double nominalQuality(AlignmentStatus status) {
    switch (status) {
        case AlignmentStatus::Exact: return 100.0;
        case AlignmentStatus::FuzzyCase: return 85.0;
        case AlignmentStatus::FuzzyWhitespace: return 70.0;
        case AlignmentStatus::FuzzyApproximate: return 50.0;
        case AlignmentStatus::None: return 0.0;
    }
    return 0.0;
}

constexpr const char* toString(AlignmentStatus status) {
    switch (status) {
        case AlignmentStatus::Exact: return "exact";
        case AlignmentStatus::FuzzyCase: return "fuzzy_case";
        case AlignmentStatus::FuzzyWhitespace: return "fuzzy_whitespace";
        case AlignmentStatus::FuzzyApproximate: return "fuzzy_approximate";
        case AlignmentStatus::None: return "none";
    }
    return "none";
}

std::optional<AlignmentStatus> parseAlignmentStatus(std::string_view name);

} // namespace langextract::document
