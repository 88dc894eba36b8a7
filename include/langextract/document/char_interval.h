#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <langextract/core/types.h>

namespace langextract::document {

/**
 * @brief Half-open character range [start, end) into a document's text.
 */
struct CharInterval {
    std::size_t start = 0;
    std::size_t end = 0;

    /// Validating constructor; rejects end < start and end beyond @p textLength
    static Result<CharInterval> create(std::size_t start, std::size_t end,
                                       std::size_t textLength);

    std::size_t length() const noexcept { return end - start; }
    bool empty() const noexcept { return end == start; }
    bool contains(std::size_t pos) const noexcept { return pos >= start && pos < end; }

    bool overlaps(const CharInterval& other) const noexcept {
        return std::max(start, other.start) < std::min(end, other.end);
    }

    CharInterval unionWith(const CharInterval& other) const noexcept {
        return {std::min(start, other.start), std::max(end, other.end)};
    }

    std::optional<CharInterval> intersection(const CharInterval& other) const noexcept;

    std::string toString() const;

    bool operator==(const CharInterval&) const = default;
};

// Range of whitespace tokens [start, end) covered by an extraction
struct TokenInterval {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t length() const noexcept { return end - start; }
    std::string toString() const;

    bool operator==(const TokenInterval&) const = default;
};

} // namespace langextract::document
