#include <langextract/alignment/text_normalizer.h>

#include <algorithm>
#include <cctype>
#include <string_view>

namespace langextract::alignment {

namespace {
constexpr std::string_view kPunctuation = ".,!?;:()[]{}\"'-";
} // namespace

bool isAlignmentPunctuation(char c) noexcept {
    return kPunctuation.find(c) != std::string_view::npos;
}

NormalizedText NormalizedText::build(std::string_view source, const NormalizationLevel& level) {
    NormalizedText out;
    out.text_.reserve(source.size());
    out.offsets_.reserve(source.size());

    for (std::size_t i = 0; i < source.size(); ++i) {
        char c = source[i];
        if (level.stripPunctuation && isAlignmentPunctuation(c)) {
            continue;
        }
        if (level.collapseWhitespace && std::isspace(static_cast<unsigned char>(c))) {
            if (out.text_.empty() || out.text_.back() == ' ') {
                continue;
            }
            out.text_.push_back(' ');
            out.offsets_.push_back(i);
            continue;
        }
        if (level.foldCase) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        out.text_.push_back(c);
        out.offsets_.push_back(i);
    }

    if (level.collapseWhitespace && !out.text_.empty() && out.text_.back() == ' ') {
        out.text_.pop_back();
        out.offsets_.pop_back();
    }
    return out;
}

document::CharInterval NormalizedText::toOriginal(std::size_t start, std::size_t end) const {
    return {offsets_[start], offsets_[end - 1] + 1};
}

std::size_t NormalizedText::fromOriginal(std::size_t originalPos) const {
    auto it = std::lower_bound(offsets_.begin(), offsets_.end(), originalPos);
    return static_cast<std::size_t>(it - offsets_.begin());
}

std::string normalize(std::string_view text, const NormalizationLevel& level) {
    return NormalizedText::build(text, level).text();
}

} // namespace langextract::alignment
