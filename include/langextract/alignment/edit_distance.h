#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>

namespace langextract::alignment {

/**
 * @brief Levenshtein distance with unit costs for insert, delete and substitute.
 */
class LevenshteinDistance {
public:
    /// Called after each DP row with the number of cells it filled; returning true abandons
    using RowObserver = std::function<bool(std::size_t cells)>;

    std::size_t distance(std::string_view s1, std::string_view s2) const;

    /**
     * @brief Distance if it is at most @p maxDistance, nullopt otherwise.
     *
     * Gives up as soon as every cell of a DP row exceeds the bound, or when @p onRow asks
     * to stop. An abandoned computation also yields nullopt.
     */
    std::optional<std::size_t> boundedDistance(std::string_view s1, std::string_view s2,
                                               std::size_t maxDistance,
                                               const RowObserver& onRow = {}) const;

    /// 1 - distance / max(len1, len2); 1.0 for two empty strings
    double similarity(std::string_view s1, std::string_view s2) const;
};

} // namespace langextract::alignment
