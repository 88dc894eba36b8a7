#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <langextract/core/execution_context.h>
#include <langextract/core/types.h>
#include <langextract/engine/response_cache.h>
#include <langextract/providers/language_model.h>

namespace langextract::engine {

struct GatewayConfig {
    int unhealthyThreshold = 3; ///< Consecutive failures before a provider is marked unhealthy
    int recoveryThreshold = 2;  ///< Consecutive successes before it is healthy again
    std::chrono::milliseconds initialBackoff{500};
    double backoffMultiplier = 2.0;
    std::chrono::milliseconds maxBackoff{8000};
    bool enableCaching = false;
    ResponseCacheConfig cache;
};

/// Transition from a failing provider to the next candidate
struct FailoverEvent {
    TimePoint timestamp;
    std::string originalProvider;
    std::string reason;
    std::string fallbackProvider;
    bool success = false; ///< Whether the fallback provider produced a reply
};

struct RetryAttempt {
    std::string provider;
    int attempt = 0; ///< 1-based attempt that failed
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::chrono::milliseconds backoff{0};
};

/// Failovers and retries observed during one gateway call
struct GatewayTrace {
    std::vector<FailoverEvent> failovers;
    std::vector<RetryAttempt> retries;
};

struct ProviderHealth {
    std::string name;
    bool isHealthy = true;
    TimePoint lastCheck;
    int consecutiveFailures = 0;
    int consecutiveSuccesses = 0;
    std::chrono::milliseconds averageLatency{0};
    std::uint64_t totalRequests = 0;
    std::uint64_t successfulRequests = 0;
    std::uint64_t failedRequests = 0;
    std::string lastError;
};

struct GatewayRequest {
    std::string prompt;
    providers::ModelConfig model;
    std::optional<std::string> preferredProvider; ///< Tried first when registered
    int retryCount = 2;                           ///< Retries per provider on recoverable errors
};

struct GatewayResponse {
    std::string text;
    int tokensUsed = 0;
    std::string providerName;
    std::string modelId;
    std::chrono::milliseconds latency{0};
    int attempts = 0; ///< Provider calls made, across all providers
    bool fromCache = false;
};

/**
 * @brief Uniform call surface over several language model backends.
 *
 * Providers are tried in order: the preferred one, then healthy providers by ascending
 * priority value, then unhealthy ones. Each gets 1 + retryCount attempts with exponential
 * backoff for recoverable failures before the gateway fails over to the next. A
 * non-recoverable failure ends the call without failover.
 */
class ProviderGateway {
public:
    explicit ProviderGateway(GatewayConfig config = {});
    ~ProviderGateway();

    ProviderGateway(const ProviderGateway&) = delete;
    ProviderGateway& operator=(const ProviderGateway&) = delete;

    /// Fails with InvalidArgument for a null model or a duplicate name
    Result<void> addProvider(std::shared_ptr<providers::ILanguageModel> model, int priority = 0);
    bool removeProvider(const std::string& name);
    bool hasProvider(const std::string& name) const;

    /// Names in the order a call without preference would try them
    std::vector<std::string> providerOrder(
        const std::optional<std::string>& preferred = std::nullopt) const;

    Result<GatewayResponse> executeWithFailover(const ExecutionContext& ctx,
                                                const GatewayRequest& request,
                                                GatewayTrace* trace = nullptr);

    std::vector<ProviderHealth> getProviderHealth() const;
    std::optional<ProviderHealth> getProviderHealth(const std::string& name) const;

    std::optional<ResponseCacheStats> getCacheStats() const;

    const GatewayConfig& config() const noexcept { return config_; }

private:
    struct Slot {
        std::shared_ptr<providers::ILanguageModel> model;
        int priority = 0;
        std::size_t order = 0;
    };

    std::chrono::milliseconds backoffFor(int attempt) const;
    void recordOutcome(const std::string& name, bool success, std::chrono::milliseconds latency,
                       const std::string& error);

    GatewayConfig config_;
    std::unique_ptr<ResponseCache> cache_;

    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    std::map<std::string, ProviderHealth> health_;
    std::size_t nextOrder_ = 0;
};

} // namespace langextract::engine
