#include <langextract/chunking/text_chunker.h>
#include <langextract/core/format.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace langextract::chunking {

using document::CharInterval;

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Titles that end in a period without ending the sentence
bool endsWithAbbreviation(std::string_view text, std::size_t periodPos) {
    static constexpr std::array<std::string_view, 7> kAbbreviations{"Dr", "Mr", "Ms", "Mrs",
                                                                    "Jr", "Sr", "St"};
    for (auto abbr : kAbbreviations) {
        if (periodPos < abbr.size()) {
            continue;
        }
        const std::size_t begin = periodPos - abbr.size();
        if (text.substr(begin, abbr.size()) == abbr && (begin == 0 || isSpace(text[begin - 1]))) {
            return true;
        }
    }
    return false;
}

CharInterval trimmed(std::string_view text, CharInterval span) {
    while (span.start < span.end && isSpace(text[span.start])) {
        ++span.start;
    }
    while (span.end > span.start && isSpace(text[span.end - 1])) {
        --span.end;
    }
    return span;
}

} // namespace

const char* toString(ChunkingStrategy strategy) {
    switch (strategy) {
        case ChunkingStrategy::FixedSize:
            return "fixed";
        case ChunkingStrategy::SentenceBased:
            return "sentence";
        case ChunkingStrategy::ParagraphBased:
            return "paragraph";
    }
    return "unknown";
}

std::optional<ChunkingStrategy> parseChunkingStrategy(std::string_view name) {
    if (name == "fixed") {
        return ChunkingStrategy::FixedSize;
    }
    if (name == "sentence") {
        return ChunkingStrategy::SentenceBased;
    }
    if (name == "paragraph") {
        return ChunkingStrategy::ParagraphBased;
    }
    return std::nullopt;
}

Result<void> ChunkingOptions::validate() const {
    if (maxChunkSize == 0) {
        return Error{ErrorCode::InvalidArgument, "max chunk size must be positive"};
    }
    if (overlapRatio < 0.0 || overlapRatio >= 0.5) {
        return Error{ErrorCode::InvalidArgument,
                     format("overlap ratio must be within [0, 0.5), got {}", overlapRatio)};
    }
    if (minChunkSize >= maxChunkSize) {
        return Error{ErrorCode::InvalidArgument,
                     format("min chunk size {} must be below max chunk size {}", minChunkSize,
                            maxChunkSize)};
    }
    return {};
}

TextChunker::TextChunker(ChunkingOptions options) : options_(std::move(options)) {}

std::size_t TextChunker::estimateChunks(std::size_t textLength) const {
    if (textLength == 0 || options_.maxChunkSize == 0) {
        return 0;
    }
    return (textLength + options_.maxChunkSize - 1) / options_.maxChunkSize;
}

std::vector<std::size_t> TextChunker::findSentenceBoundaries(std::string_view text) {
    std::vector<std::size_t> boundaries;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c != '.' && c != '!' && c != '?') {
            continue;
        }
        if (i + 1 < text.size() && !isSpace(text[i + 1])) {
            continue;
        }
        if (c == '.' && endsWithAbbreviation(text, i)) {
            continue;
        }
        std::size_t boundary = i + 1;
        while (boundary < text.size() && isSpace(text[boundary])) {
            ++boundary;
        }
        boundaries.push_back(boundary);
        i = boundary - 1;
    }
    if (!text.empty() && (boundaries.empty() || boundaries.back() != text.size())) {
        boundaries.push_back(text.size());
    }
    return boundaries;
}

std::vector<std::size_t> TextChunker::findParagraphBoundaries(std::string_view text) {
    std::vector<std::size_t> boundaries;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\n') {
            continue;
        }
        std::size_t j = i + 1;
        while (j < text.size() && text[j] != '\n' && isSpace(text[j])) {
            ++j;
        }
        if (j >= text.size() || text[j] != '\n') {
            continue;
        }
        while (j < text.size() && isSpace(text[j])) {
            ++j;
        }
        boundaries.push_back(j);
        i = j - 1;
    }
    if (!text.empty() && (boundaries.empty() || boundaries.back() != text.size())) {
        boundaries.push_back(text.size());
    }
    return boundaries;
}

std::vector<CharInterval> TextChunker::fixedSpans(std::string_view text, CharInterval range) const {
    std::vector<CharInterval> spans;
    const std::size_t maxBackoff = std::min<std::size_t>(options_.maxChunkSize / 4, 20);

    std::size_t pos = range.start;
    while (pos < range.end) {
        std::size_t end = std::min(pos + options_.maxChunkSize, range.end);
        if (end < range.end) {
            std::size_t e = end;
            while (e > pos && end - e < maxBackoff && !isSpace(text[e])) {
                --e;
            }
            if (e > pos && isSpace(text[e])) {
                end = e;
            }
        }
        spans.push_back(CharInterval{pos, end});
        pos = end;
        while (pos < range.end && isSpace(text[pos])) {
            ++pos;
        }
    }
    return spans;
}

std::vector<CharInterval> TextChunker::packSpans(std::string_view text,
                                                 const std::vector<std::size_t>& boundaries,
                                                 CharInterval range, bool splitBySentence) const {
    std::vector<CharInterval> spans;
    std::optional<CharInterval> current;
    auto flush = [&] {
        if (current) {
            spans.push_back(*current);
            current.reset();
        }
    };

    std::size_t previous = 0;
    for (std::size_t boundary : boundaries) {
        const CharInterval segment{std::max(previous, range.start), std::min(boundary, range.end)};
        previous = boundary;
        if (segment.start >= segment.end) {
            continue;
        }

        if (segment.length() > options_.maxChunkSize) {
            flush();
            auto pieces = splitBySentence
                              ? packSpans(text, findSentenceBoundaries(text), segment, false)
                              : fixedSpans(text, segment);
            spans.insert(spans.end(), pieces.begin(), pieces.end());
            continue;
        }
        if (current && segment.end - current->start > options_.maxChunkSize) {
            flush();
        }
        current = current ? CharInterval{current->start, segment.end} : segment;
    }
    flush();
    return spans;
}

Result<std::vector<TextChunk>> TextChunker::chunk(std::string_view text,
                                                  const ExecutionContext* ctx) const {
    if (auto valid = options_.validate(); !valid) {
        return valid.error();
    }
    if (ctx) {
        if (auto live = ctx->check(); !live) {
            return live.error();
        }
    }

    const CharInterval content = trimmed(text, CharInterval{0, text.size()});
    if (content.empty()) {
        return std::vector<TextChunk>{};
    }

    std::vector<CharInterval> spans;
    if (content.length() <= options_.maxChunkSize) {
        spans.push_back(content);
    } else {
        switch (options_.strategy) {
            case ChunkingStrategy::FixedSize:
                spans = fixedSpans(text, content);
                break;
            case ChunkingStrategy::SentenceBased:
                spans = packSpans(text, findSentenceBoundaries(text), content, false);
                break;
            case ChunkingStrategy::ParagraphBased:
                spans = packSpans(text, findParagraphBoundaries(text), content, true);
                break;
        }
    }

    std::vector<CharInterval> cores;
    cores.reserve(spans.size());
    for (const auto& span : spans) {
        if (auto t = trimmed(text, span); !t.empty()) {
            cores.push_back(t);
        }
    }
    if (cores.size() > 1 && cores.back().length() < options_.minChunkSize) {
        cores[cores.size() - 2].end = cores.back().end;
        cores.pop_back();
    }

    if (ctx) {
        if (auto live = ctx->check(); !live) {
            return live.error();
        }
    }

    const std::size_t overlap = options_.overlapSize();
    std::vector<TextChunk> chunks;
    chunks.reserve(cores.size());
    for (std::size_t i = 0; i < cores.size(); ++i) {
        TextChunk c;
        c.index = i;
        c.totalChunks = cores.size();
        c.interval = cores[i];
        if (i > 0 && overlap > 0) {
            const std::size_t earliest = cores[i - 1].start;
            std::size_t start =
                cores[i].start > earliest + overlap ? cores[i].start - overlap : earliest;
            // Start the carried text on a word
            while (start < cores[i].start && start > earliest && !isSpace(text[start - 1])) {
                ++start;
            }
            while (start < cores[i].start && isSpace(text[start])) {
                ++start;
            }
            c.overlapWithPrevious = cores[i].start - start;
            c.interval.start = start;
        }
        chunks.push_back(c);
    }

    spdlog::debug("chunked {} characters into {} {} chunk(s)", text.size(), chunks.size(),
                  toString(options_.strategy));
    return chunks;
}

} // namespace langextract::chunking
