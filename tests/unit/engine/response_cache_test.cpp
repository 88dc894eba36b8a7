#include <thread>
#include <gtest/gtest.h>
#include <langextract/engine/response_cache.h>

using namespace langextract;
using namespace langextract::engine;
using providers::ModelConfig;
using providers::ModelReply;

namespace {

ResponseCache::CachedReply reply(const std::string& text) {
    return {ModelReply{text, 7}, "primary", "model-a"};
}

} // namespace

class ResponseCacheTest : public ::testing::Test {};

TEST_F(ResponseCacheTest, PutAndGet) {
    ResponseCache cache;
    cache.put("k", reply("hello"));
    auto hit = cache.get("k");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->reply.text, "hello");
    EXPECT_EQ(hit->reply.tokensUsed, 7);
    EXPECT_EQ(hit->providerName, "primary");
    EXPECT_FALSE(cache.get("missing").has_value());

    auto stats = cache.getStats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.5);
}

TEST_F(ResponseCacheTest, EvictsLeastRecentlyUsed) {
    ResponseCache cache(ResponseCacheConfig{2, std::chrono::minutes(5)});
    cache.put("a", reply("A"));
    cache.put("b", reply("B"));
    ASSERT_TRUE(cache.get("a").has_value());
    cache.put("c", reply("C"));

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.get("a").has_value());
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_TRUE(cache.get("c").has_value());
    EXPECT_EQ(cache.getStats().evictions, 1u);
}

TEST_F(ResponseCacheTest, OverwriteKeepsSingleEntry) {
    ResponseCache cache;
    cache.put("k", reply("old"));
    cache.put("k", reply("new"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get("k")->reply.text, "new");
}

TEST_F(ResponseCacheTest, EntriesExpire) {
    ResponseCache cache(ResponseCacheConfig{10, std::chrono::milliseconds(1)});
    cache.put("a", reply("A"));
    cache.put("b", reply("B"));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.removeExpired(), 1u);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.getStats().expirations, 2u);
}

TEST_F(ResponseCacheTest, ZeroCapacityStoresNothing) {
    ResponseCache cache(ResponseCacheConfig{0, std::chrono::minutes(1)});
    cache.put("k", reply("v"));
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ResponseCacheTest, ClearEmptiesCache) {
    ResponseCache cache;
    cache.put("a", reply("A"));
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.getStats().size, 0u);
}

TEST_F(ResponseCacheTest, KeyCoversPromptAndParameters) {
    ModelConfig base{"model-a", 0.2, 512};
    const auto key = ResponseCache::makeKey("prompt", base);
    EXPECT_EQ(key.size(), 64u);
    EXPECT_EQ(key, ResponseCache::makeKey("prompt", base));
    EXPECT_NE(key, ResponseCache::makeKey("prompt!", base));

    auto warmer = base;
    warmer.temperature = 0.7;
    EXPECT_NE(key, ResponseCache::makeKey("prompt", warmer));

    auto other = base;
    other.modelId = "model-b";
    EXPECT_NE(key, ResponseCache::makeKey("prompt", other));
}
