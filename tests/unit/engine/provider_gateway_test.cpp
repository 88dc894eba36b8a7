#include <gtest/gtest.h>
#include <langextract/engine/provider_gateway.h>

#include "scripted_provider.h"
#include "test_helpers.h"

using namespace langextract;
using namespace langextract::engine;
using langextract::test::ScriptedProvider;
using providers::ModelReply;

class ProviderGatewayTest : public langextract::test::LangExtractTest {
protected:
    static GatewayConfig fastConfig() {
        GatewayConfig config;
        config.initialBackoff = std::chrono::milliseconds(1);
        config.maxBackoff = std::chrono::milliseconds(4);
        return config;
    }

    static GatewayRequest request(int retryCount = 2) {
        GatewayRequest req;
        req.prompt = "extract things";
        req.model.modelId = "test-model";
        req.retryCount = retryCount;
        return req;
    }
};

TEST_F(ProviderGatewayTest, RejectsNullAndDuplicateProviders) {
    ProviderGateway gateway(fastConfig());
    EXPECT_EQ(gateway.addProvider(nullptr).error().code, ErrorCode::InvalidArgument);
    ASSERT_TRUE(gateway.addProvider(ScriptedProvider::replying("a", "{}")));
    EXPECT_EQ(gateway.addProvider(ScriptedProvider::replying("a", "{}")).error().code,
              ErrorCode::InvalidArgument);
    EXPECT_TRUE(gateway.hasProvider("a"));
    EXPECT_TRUE(gateway.removeProvider("a"));
    EXPECT_FALSE(gateway.hasProvider("a"));
    EXPECT_FALSE(gateway.removeProvider("a"));
}

TEST_F(ProviderGatewayTest, NoProvidersConfigured) {
    ProviderGateway gateway(fastConfig());
    auto result = gateway.executeWithFailover(ExecutionContext{}, request());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ProviderUnavailable);
}

TEST_F(ProviderGatewayTest, OrdersByPreferenceThenPriority) {
    ProviderGateway gateway(fastConfig());
    ASSERT_TRUE(gateway.addProvider(ScriptedProvider::replying("c", "{}"), 5));
    ASSERT_TRUE(gateway.addProvider(ScriptedProvider::replying("a", "{}"), 1));
    ASSERT_TRUE(gateway.addProvider(ScriptedProvider::replying("b", "{}"), 1));

    EXPECT_EQ(gateway.providerOrder(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(gateway.providerOrder("c"), (std::vector<std::string>{"c", "a", "b"}));
    EXPECT_EQ(gateway.providerOrder("unknown"), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(ProviderGatewayTest, SucceedsOnFirstProvider) {
    ProviderGateway gateway(fastConfig());
    auto primary = ScriptedProvider::replying("primary", "reply text", 42);
    ASSERT_TRUE(gateway.addProvider(primary));

    GatewayTrace trace;
    auto result = gateway.executeWithFailover(ExecutionContext{}, request(), &trace);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().text, "reply text");
    EXPECT_EQ(result.value().tokensUsed, 42);
    EXPECT_EQ(result.value().providerName, "primary");
    EXPECT_EQ(result.value().modelId, "test-model");
    EXPECT_EQ(result.value().attempts, 1);
    EXPECT_FALSE(result.value().fromCache);
    EXPECT_TRUE(trace.failovers.empty());
    EXPECT_TRUE(trace.retries.empty());
    EXPECT_EQ(primary->prompts().front(), "extract things");
}

TEST_F(ProviderGatewayTest, RetriesThenFailsOver) {
    ProviderGateway gateway(fastConfig());
    auto a = ScriptedProvider::failing("A", ErrorCode::Timeout, "deadline exceeded");
    auto b = ScriptedProvider::replying("B", "from B");
    ASSERT_TRUE(gateway.addProvider(a, 0));
    ASSERT_TRUE(gateway.addProvider(b, 1));

    GatewayTrace trace;
    auto result = gateway.executeWithFailover(ExecutionContext{}, request(2), &trace);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().providerName, "B");
    EXPECT_EQ(result.value().attempts, 4);
    EXPECT_EQ(a->calls(), 3);
    EXPECT_EQ(b->calls(), 1);

    ASSERT_EQ(trace.failovers.size(), 1u);
    EXPECT_EQ(trace.failovers[0].originalProvider, "A");
    EXPECT_EQ(trace.failovers[0].fallbackProvider, "B");
    EXPECT_EQ(trace.failovers[0].reason, "deadline exceeded");
    EXPECT_TRUE(trace.failovers[0].success);

    ASSERT_EQ(trace.retries.size(), 3u);
    EXPECT_EQ(trace.retries[0].attempt, 1);
    EXPECT_EQ(trace.retries[0].backoff, std::chrono::milliseconds(1));
    EXPECT_EQ(trace.retries[1].backoff, std::chrono::milliseconds(2));
    EXPECT_EQ(trace.retries[2].backoff, std::chrono::milliseconds(0));
    EXPECT_EQ(trace.retries[2].code, ErrorCode::Timeout);
}

TEST_F(ProviderGatewayTest, FailoverSkipsProviderRemovedMidRequest) {
    ProviderGateway gateway(fastConfig());
    auto a = std::make_shared<ScriptedProvider>(
        "A", [&gateway](const ExecutionContext&, const std::string&) -> Result<ModelReply> {
            gateway.removeProvider("B");
            return Error{ErrorCode::Timeout, "deadline exceeded"};
        });
    auto b = ScriptedProvider::replying("B", "from B");
    auto c = ScriptedProvider::replying("C", "from C");
    ASSERT_TRUE(gateway.addProvider(a, 0));
    ASSERT_TRUE(gateway.addProvider(b, 1));
    ASSERT_TRUE(gateway.addProvider(c, 2));

    GatewayTrace trace;
    auto result = gateway.executeWithFailover(ExecutionContext{}, request(0), &trace);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().providerName, "C");
    EXPECT_EQ(b->calls(), 0);

    ASSERT_EQ(trace.failovers.size(), 1u);
    EXPECT_EQ(trace.failovers[0].originalProvider, "A");
    EXPECT_EQ(trace.failovers[0].fallbackProvider, "C");
    EXPECT_TRUE(trace.failovers[0].success);
}

TEST_F(ProviderGatewayTest, NonRecoverableErrorStopsWithoutFailover) {
    ProviderGateway gateway(fastConfig());
    auto a = ScriptedProvider::failing("A", ErrorCode::AuthenticationFailed, "bad key");
    auto b = ScriptedProvider::replying("B", "unused");
    ASSERT_TRUE(gateway.addProvider(a, 0));
    ASSERT_TRUE(gateway.addProvider(b, 1));

    GatewayTrace trace;
    auto result = gateway.executeWithFailover(ExecutionContext{}, request(), &trace);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::AuthenticationFailed);
    EXPECT_EQ(result.error().message, "provider 'A': bad key");
    EXPECT_EQ(a->calls(), 1);
    EXPECT_EQ(b->calls(), 0);
    EXPECT_TRUE(trace.failovers.empty());
}

TEST_F(ProviderGatewayTest, AllProvidersExhausted) {
    ProviderGateway gateway(fastConfig());
    auto a = ScriptedProvider::failing("A", ErrorCode::RateLimited, "slow down");
    auto b = ScriptedProvider::failing("B", ErrorCode::ProviderUnavailable, "503");
    ASSERT_TRUE(gateway.addProvider(a, 0));
    ASSERT_TRUE(gateway.addProvider(b, 1));

    GatewayTrace trace;
    auto result = gateway.executeWithFailover(ExecutionContext{}, request(1), &trace);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ProviderUnavailable);
    EXPECT_EQ(result.error().message, "all 2 providers failed, last error: 503");
    EXPECT_EQ(a->calls(), 2);
    EXPECT_EQ(b->calls(), 2);
    ASSERT_EQ(trace.failovers.size(), 1u);
    EXPECT_FALSE(trace.failovers[0].success);
}

TEST_F(ProviderGatewayTest, ZeroRetriesMeansSingleAttempt) {
    ProviderGateway gateway(fastConfig());
    auto a = ScriptedProvider::failing("A", ErrorCode::Timeout);
    ASSERT_TRUE(gateway.addProvider(a));
    auto result = gateway.executeWithFailover(ExecutionContext{}, request(0));
    ASSERT_FALSE(result);
    EXPECT_EQ(a->calls(), 1);
}

TEST_F(ProviderGatewayTest, TracksHealthAndRecovery) {
    ProviderGateway gateway(fastConfig());
    auto a = std::make_shared<ScriptedProvider>(
        "A", std::vector<Result<ModelReply>>{Error{ErrorCode::Timeout, "t1"},
                                             Error{ErrorCode::Timeout, "t2"},
                                             Error{ErrorCode::Timeout, "t3"},
                                             ModelReply{"recovered", 1}});
    auto b = ScriptedProvider::replying("B", "from B");
    ASSERT_TRUE(gateway.addProvider(a, 0));
    ASSERT_TRUE(gateway.addProvider(b, 1));

    ASSERT_TRUE(gateway.executeWithFailover(ExecutionContext{}, request(2)));
    auto health = gateway.getProviderHealth("A");
    ASSERT_TRUE(health.has_value());
    EXPECT_FALSE(health->isHealthy);
    EXPECT_EQ(health->consecutiveFailures, 3);
    EXPECT_EQ(health->failedRequests, 3u);
    EXPECT_EQ(health->lastError, "t3");
    EXPECT_EQ(gateway.providerOrder(), (std::vector<std::string>{"B", "A"}));

    // Preferring the unhealthy provider still tries it first
    auto req = request();
    req.preferredProvider = "A";
    ASSERT_TRUE(gateway.executeWithFailover(ExecutionContext{}, req));
    EXPECT_FALSE(gateway.getProviderHealth("A")->isHealthy);
    auto second = gateway.executeWithFailover(ExecutionContext{}, req);
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value().providerName, "A");
    EXPECT_TRUE(gateway.getProviderHealth("A")->isHealthy);
    EXPECT_EQ(gateway.getProviderHealth().size(), 2u);
    EXPECT_FALSE(gateway.getProviderHealth("missing").has_value());
}

TEST_F(ProviderGatewayTest, CachesReplies) {
    auto config = fastConfig();
    config.enableCaching = true;
    ProviderGateway gateway(config);
    auto a = ScriptedProvider::replying("A", "cached body");
    ASSERT_TRUE(gateway.addProvider(a));

    ASSERT_TRUE(gateway.executeWithFailover(ExecutionContext{}, request()));
    auto again = gateway.executeWithFailover(ExecutionContext{}, request());
    ASSERT_TRUE(again);
    EXPECT_TRUE(again.value().fromCache);
    EXPECT_EQ(again.value().text, "cached body");
    EXPECT_EQ(again.value().providerName, "A");
    EXPECT_EQ(a->calls(), 1);

    auto stats = gateway.getCacheStats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->hits, 1u);
    EXPECT_EQ(stats->misses, 1u);
}

TEST_F(ProviderGatewayTest, NoCacheStatsWhenDisabled) {
    ProviderGateway gateway(fastConfig());
    EXPECT_FALSE(gateway.getCacheStats().has_value());
}

TEST_F(ProviderGatewayTest, CancelledContextMakesNoCalls) {
    ProviderGateway gateway(fastConfig());
    auto a = ScriptedProvider::replying("A", "never");
    ASSERT_TRUE(gateway.addProvider(a));

    ExecutionContext ctx;
    ctx.cancel();
    auto result = gateway.executeWithFailover(ctx, request());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(a->calls(), 0);
}

TEST_F(ProviderGatewayTest, CancellationDuringCallIsNotCountedAgainstProvider) {
    ProviderGateway gateway(fastConfig());
    auto a = std::make_shared<ScriptedProvider>(
        "A", [](const ExecutionContext& ctx, const std::string&) -> Result<ModelReply> {
            ctx.cancel();
            return Error{ErrorCode::Timeout, "interrupted"};
        });
    auto b = ScriptedProvider::replying("B", "unused");
    ASSERT_TRUE(gateway.addProvider(a, 0));
    ASSERT_TRUE(gateway.addProvider(b, 1));

    auto result = gateway.executeWithFailover(ExecutionContext{}, request());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(b->calls(), 0);
    EXPECT_EQ(gateway.getProviderHealth("A")->totalRequests, 0u);
}

TEST_F(ProviderGatewayTest, DeadlineInterruptsBackoff) {
    auto config = fastConfig();
    config.initialBackoff = std::chrono::milliseconds(5000);
    config.maxBackoff = std::chrono::milliseconds(5000);
    ProviderGateway gateway(config);
    auto a = ScriptedProvider::failing("A", ErrorCode::RateLimited);
    ASSERT_TRUE(gateway.addProvider(a));

    const auto start = std::chrono::steady_clock::now();
    auto result = gateway.executeWithFailover(
        ExecutionContext::withTimeout(std::chrono::milliseconds(50)), request(3));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_EQ(a->calls(), 1);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
}
