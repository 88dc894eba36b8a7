#include <langextract/core/format.h>
#include <langextract/crypto/sha256_hasher.h>

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <stdexcept>

namespace langextract::crypto {

struct SHA256Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

SHA256Hasher::SHA256Hasher() : pImpl(std::make_unique<Impl>()) {
    reset();
}

SHA256Hasher::~SHA256Hasher() = default;

SHA256Hasher::SHA256Hasher(SHA256Hasher&&) noexcept = default;
SHA256Hasher& SHA256Hasher::operator=(SHA256Hasher&&) noexcept = default;

void SHA256Hasher::reset() {
    if (EVP_DigestInit_ex(pImpl->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA256");
    }
    bytesHashed_ = 0;
}

SHA256Hasher& SHA256Hasher::update(std::string_view bytes) {
    if (EVP_DigestUpdate(pImpl->ctx, bytes.data(), bytes.size()) != 1) {
        throw std::runtime_error("Failed to update SHA256");
    }
    bytesHashed_ += bytes.size();
    return *this;
}

SHA256Hasher& SHA256Hasher::addField(std::string_view field) {
    // 8-byte little-endian length, then the bytes
    std::array<char, 8> prefix{};
    auto len = static_cast<std::uint64_t>(field.size());
    for (auto& b : prefix) {
        b = static_cast<char>(len & 0xff);
        len >>= 8;
    }
    update(std::string_view(prefix.data(), prefix.size()));
    return update(field);
}

std::string SHA256Hasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, digest.data(), &digestLen) != 1) {
        throw std::runtime_error("Failed to finalize SHA256");
    }

    std::string hex;
    hex.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        hex += format("{:02x}", digest[i]);
    }
    reset();
    return hex;
}

std::string SHA256Hasher::finalizeShort(std::size_t hexChars) {
    auto hex = finalize();
    if (hexChars < hex.size()) {
        hex.resize(hexChars);
    }
    return hex;
}

std::string SHA256Hasher::hash(std::string_view text) {
    return SHA256Hasher().update(text).finalize();
}

} // namespace langextract::crypto
