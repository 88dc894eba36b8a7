#pragma once

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <langextract/providers/language_model.h>

namespace langextract::engine {

/**
 * @brief Configuration for the provider response cache
 */
struct ResponseCacheConfig {
    std::size_t maxEntries = 1000;         ///< Maximum number of cache entries
    std::chrono::milliseconds ttl{300000}; ///< Entry lifetime (5 minutes)
};

struct ResponseCacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;
    std::uint64_t expirations = 0;
    std::size_t size = 0;
    std::size_t maxEntries = 0;

    double hitRate() const {
        auto total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }
};

/**
 * @brief Thread-safe LRU cache of model replies with a fixed TTL
 */
class ResponseCache {
public:
    struct CachedReply {
        providers::ModelReply reply;
        std::string providerName;
        std::string modelId;
    };

    explicit ResponseCache(ResponseCacheConfig config = {});

    /// SHA-256 over prompt and generation parameters
    static std::string makeKey(const std::string& prompt, const providers::ModelConfig& config);

    /**
     * @brief Get a cached reply
     * @return nullopt if not found or expired
     */
    std::optional<CachedReply> get(const std::string& key);

    void put(const std::string& key, CachedReply value);

    std::size_t size() const;
    void clear();

    /**
     * @brief Remove expired entries
     * @return number of entries removed
     */
    std::size_t removeExpired();

    ResponseCacheStats getStats() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        CachedReply value;
        Clock::time_point insertTime;
        std::list<std::string>::iterator lruPos;
    };

    bool isExpired(const Entry& entry, Clock::time_point now) const {
        return now - entry.insertTime > config_.ttl;
    }

    ResponseCacheConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> lru_; ///< Most recent at the front
    ResponseCacheStats stats_;
};

} // namespace langextract::engine
