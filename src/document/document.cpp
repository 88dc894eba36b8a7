#include <langextract/crypto/sha256_hasher.h>
#include <langextract/document/document.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace langextract::document {

struct Document::Derived {
    std::once_flag idOnce;
    std::once_flag tokensOnce;
    std::string id;
    std::vector<Token> tokens;
};

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::vector<Token> tokenize(const std::string& text) {
    std::vector<Token> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && isSpace(text[i])) {
            ++i;
        }
        if (i >= text.size()) {
            break;
        }
        std::size_t start = i;
        while (i < text.size() && !isSpace(text[i])) {
            ++i;
        }
        tokens.push_back(Token{text.substr(start, i - start), CharInterval{start, i}});
    }
    return tokens;
}

} // namespace

Document::Document(std::string text, std::optional<std::string> additionalContext)
    : text_(std::move(text)), additionalContext_(std::move(additionalContext)),
      derived_(std::make_shared<Derived>()) {}

const std::string& Document::id() const {
    std::call_once(derived_->idOnce, [this] {
        crypto::SHA256Hasher hasher;
        hasher.addField(text_);
        if (additionalContext_) {
            hasher.addField(*additionalContext_);
        }
        derived_->id = "doc_" + hasher.finalizeShort(16);
    });
    return derived_->id;
}

const std::vector<Token>& Document::tokens() const {
    std::call_once(derived_->tokensOnce, [this] { derived_->tokens = tokenize(text_); });
    return derived_->tokens;
}

bool Document::isBlank() const noexcept {
    return std::all_of(text_.begin(), text_.end(), isSpace);
}

std::optional<TokenInterval> Document::tokenIntervalFor(const CharInterval& interval) const {
    const auto& toks = tokens();
    std::optional<std::size_t> first;
    std::size_t last = 0;
    for (std::size_t i = 0; i < toks.size(); ++i) {
        const auto& span = toks[i].interval;
        if (span.start >= interval.end) {
            break;
        }
        if (span.overlaps(interval)) {
            if (!first) {
                first = i;
            }
            last = i;
        }
    }
    if (!first) {
        return std::nullopt;
    }
    return TokenInterval{*first, last + 1};
}

} // namespace langextract::document
