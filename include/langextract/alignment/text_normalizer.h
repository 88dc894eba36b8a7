#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <langextract/document/char_interval.h>

namespace langextract::alignment {

/// Characters removed when punctuation is ignored
bool isAlignmentPunctuation(char c) noexcept;

struct NormalizationLevel {
    bool foldCase = false;
    bool collapseWhitespace = false;
    bool stripPunctuation = false;

    int applied() const noexcept {
        return int(foldCase) + int(collapseWhitespace) + int(stripPunctuation);
    }
};

/**
 * @brief Normalized copy of a text that remembers where each byte came from.
 *
 * offsets[i] is the index in the original text of normalized byte i, so any match in the
 * normalized form maps back to an exact original span.
 */
class NormalizedText {
public:
    static NormalizedText build(std::string_view source, const NormalizationLevel& level);

    const std::string& text() const noexcept { return text_; }
    std::size_t size() const noexcept { return text_.size(); }
    bool empty() const noexcept { return text_.empty(); }

    /// Original span of normalized range [start, end); requires start < end <= size()
    document::CharInterval toOriginal(std::size_t start, std::size_t end) const;

    /// First normalized index whose original offset is at or after @p originalPos
    std::size_t fromOriginal(std::size_t originalPos) const;

private:
    std::string text_;
    std::vector<std::size_t> offsets_;
};

/// Normalized form of @p text without the offset map
std::string normalize(std::string_view text, const NormalizationLevel& level);

} // namespace langextract::alignment
