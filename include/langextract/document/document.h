#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <langextract/document/char_interval.h>

namespace langextract::document {

// Whitespace-delimited token with its position in the source text
struct Token {
    std::string text;
    CharInterval interval;
};

/**
 * @brief Immutable input text plus lazily derived identity and tokenization.
 *
 * Copies share the derived cache; the id and tokens are computed at most once.
 */
class Document {
public:
    explicit Document(std::string text, std::optional<std::string> additionalContext = std::nullopt);

    const std::string& text() const noexcept { return text_; }
    const std::optional<std::string>& additionalContext() const noexcept {
        return additionalContext_;
    }

    /// Content hash of text and context, rendered as "doc_<16 hex>"
    const std::string& id() const;

    const std::vector<Token>& tokens() const;

    std::size_t length() const noexcept { return text_.size(); }
    std::size_t tokenCount() const { return tokens().size(); }

    /// True when the text is empty or whitespace only
    bool isBlank() const noexcept;

    /// Tokens overlapping @p interval, or nullopt when none do
    std::optional<TokenInterval> tokenIntervalFor(const CharInterval& interval) const;

private:
    struct Derived;

    std::string text_;
    std::optional<std::string> additionalContext_;
    std::shared_ptr<Derived> derived_;
};

} // namespace langextract::document
