#include <langextract/core/format.h>
#include <langextract/crypto/sha256_hasher.h>
#include <langextract/engine/response_cache.h>

namespace langextract::engine {

ResponseCache::ResponseCache(ResponseCacheConfig config) : config_(config) {
    stats_.maxEntries = config_.maxEntries;
}

std::string ResponseCache::makeKey(const std::string& prompt,
                                   const providers::ModelConfig& config) {
    crypto::SHA256Hasher hasher;
    hasher.addField(prompt)
        .addField(config.modelId)
        .addField(config.temperature ? format("{:.4f}", *config.temperature) : "-")
        .addField(config.maxTokens ? std::to_string(*config.maxTokens) : "-");
    return hasher.finalize();
}

std::optional<ResponseCache::CachedReply> ResponseCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++stats_.misses;
        return std::nullopt;
    }

    if (isExpired(it->second, Clock::now())) {
        lru_.erase(it->second.lruPos);
        entries_.erase(it);
        ++stats_.expirations;
        ++stats_.misses;
        stats_.size = entries_.size();
        return std::nullopt;
    }

    // Move to front for LRU
    lru_.splice(lru_.begin(), lru_, it->second.lruPos);
    ++stats_.hits;
    return it->second.value;
}

void ResponseCache::put(const std::string& key, CachedReply value) {
    if (config_.maxEntries == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.value = std::move(value);
        it->second.insertTime = Clock::now();
        lru_.splice(lru_.begin(), lru_, it->second.lruPos);
        return;
    }

    while (entries_.size() >= config_.maxEntries && !lru_.empty()) {
        entries_.erase(lru_.back());
        lru_.pop_back();
        ++stats_.evictions;
    }

    lru_.push_front(key);
    entries_.emplace(key, Entry{std::move(value), Clock::now(), lru_.begin()});
    stats_.size = entries_.size();
}

std::size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
    stats_.size = 0;
}

std::size_t ResponseCache::removeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (isExpired(it->second, now)) {
            lru_.erase(it->second.lruPos);
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    stats_.expirations += removed;
    stats_.size = entries_.size();
    return removed;
}

ResponseCacheStats ResponseCache::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace langextract::engine
