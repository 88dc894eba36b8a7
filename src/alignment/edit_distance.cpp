#include <langextract/alignment/edit_distance.h>

#include <algorithm>
#include <vector>

namespace langextract::alignment {

std::size_t LevenshteinDistance::distance(std::string_view s1, std::string_view s2) const {
    // No distance exceeds the longer length, so this bound never cuts the search short
    return boundedDistance(s1, s2, std::max(s1.length(), s2.length())).value_or(0);
}

std::optional<std::size_t> LevenshteinDistance::boundedDistance(std::string_view s1,
                                                                std::string_view s2,
                                                                std::size_t maxDistance,
                                                                const RowObserver& onRow) const {
    const std::size_t m = s1.length();
    const std::size_t n = s2.length();
    const std::size_t lengthGap = m > n ? m - n : n - m;
    if (lengthGap > maxDistance) {
        return std::nullopt;
    }
    if (m == 0 || n == 0) {
        return std::max(m, n);
    }

    std::vector<std::size_t> prevRow(n + 1);
    std::vector<std::size_t> currRow(n + 1);
    for (std::size_t j = 0; j <= n; ++j) {
        prevRow[j] = j;
    }

    for (std::size_t i = 1; i <= m; ++i) {
        currRow[0] = i;
        std::size_t rowMin = i;
        const char c = s1[i - 1];

        for (std::size_t j = 1; j <= n; ++j) {
            const std::size_t substitute = prevRow[j - 1] + (c == s2[j - 1] ? 0 : 1);
            currRow[j] = std::min({prevRow[j] + 1, currRow[j - 1] + 1, substitute});
            rowMin = std::min(rowMin, currRow[j]);
        }

        if (rowMin > maxDistance) {
            return std::nullopt;
        }
        if (onRow && onRow(n)) {
            return std::nullopt;
        }
        std::swap(prevRow, currRow);
    }

    if (prevRow[n] > maxDistance) {
        return std::nullopt;
    }
    return prevRow[n];
}

double LevenshteinDistance::similarity(std::string_view s1, std::string_view s2) const {
    const std::size_t longest = std::max(s1.length(), s2.length());
    if (longest == 0) {
        return 1.0;
    }
    return 1.0 - static_cast<double>(distance(s1, s2)) / static_cast<double>(longest);
}

} // namespace langextract::alignment
