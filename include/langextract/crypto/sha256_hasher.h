#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace langextract::crypto {

/**
 * @brief Incremental SHA-256 over OpenSSL EVP.
 *
 * Used for content-derived document ids and response cache keys. Inputs made of several
 * fields go through addField(), which frames each field with its length so that
 * ("ab", "c") and ("a", "bc") hash differently.
 */
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    /// Raw bytes, no framing
    SHA256Hasher& update(std::string_view bytes);

    /// Length-prefixed field
    SHA256Hasher& addField(std::string_view field);

    /// Lowercase hex digest; the hasher starts over afterwards
    std::string finalize();

    /// First @p hexChars characters of the digest
    std::string finalizeShort(std::size_t hexChars);

    std::size_t bytesHashed() const noexcept { return bytesHashed_; }

    static std::string hash(std::string_view text);

private:
    void reset();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
    std::size_t bytesHashed_ = 0;
};

} // namespace langextract::crypto
