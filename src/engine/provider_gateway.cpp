#include <langextract/core/format.h>
#include <langextract/engine/provider_gateway.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace langextract::engine {

using Clock = std::chrono::steady_clock;

ProviderGateway::ProviderGateway(GatewayConfig config) : config_(std::move(config)) {
    if (config_.enableCaching) {
        cache_ = std::make_unique<ResponseCache>(config_.cache);
    }
}

ProviderGateway::~ProviderGateway() = default;

Result<void> ProviderGateway::addProvider(std::shared_ptr<providers::ILanguageModel> model,
                                          int priority) {
    if (!model) {
        return Error{ErrorCode::InvalidArgument, "provider cannot be null"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& name = model->name();
    if (health_.count(name) > 0) {
        return Error{ErrorCode::InvalidArgument, format("provider '{}' already registered", name)};
    }
    ProviderHealth health;
    health.name = name;
    health.lastCheck = std::chrono::system_clock::now();
    health_.emplace(name, std::move(health));
    slots_.push_back(Slot{std::move(model), priority, nextOrder_++});
    spdlog::debug("gateway: added provider '{}' (priority {})", name, priority);
    return {};
}

bool ProviderGateway::removeProvider(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(slots_.begin(), slots_.end(),
                           [&](const Slot& s) { return s.model->name() == name; });
    if (it == slots_.end()) {
        return false;
    }
    slots_.erase(it);
    health_.erase(name);
    return true;
}

bool ProviderGateway::hasProvider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return health_.count(name) > 0;
}

std::vector<std::string>
ProviderGateway::providerOrder(const std::optional<std::string>& preferred) const {
    std::vector<Slot> slots;
    std::map<std::string, bool> healthy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots = slots_;
        for (const auto& [name, h] : health_) {
            healthy[name] = h.isHealthy;
        }
    }

    std::stable_sort(slots.begin(), slots.end(), [&](const Slot& a, const Slot& b) {
        const auto& an = a.model->name();
        const auto& bn = b.model->name();
        if (preferred && (an == *preferred) != (bn == *preferred)) {
            return an == *preferred;
        }
        if (healthy[an] != healthy[bn]) {
            return healthy[an];
        }
        if (a.priority != b.priority) {
            return a.priority < b.priority;
        }
        return a.order < b.order;
    });

    std::vector<std::string> names;
    names.reserve(slots.size());
    for (const auto& s : slots) {
        names.push_back(s.model->name());
    }
    return names;
}

std::chrono::milliseconds ProviderGateway::backoffFor(int attempt) const {
    const double scaled = static_cast<double>(config_.initialBackoff.count()) *
                          std::pow(config_.backoffMultiplier, std::max(0, attempt - 1));
    const auto capped = std::min(scaled, static_cast<double>(config_.maxBackoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

void ProviderGateway::recordOutcome(const std::string& name, bool success,
                                    std::chrono::milliseconds latency, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = health_.find(name);
    if (it == health_.end()) {
        return;
    }
    auto& h = it->second;
    h.lastCheck = std::chrono::system_clock::now();
    h.totalRequests++;
    if (success) {
        h.successfulRequests++;
        h.consecutiveSuccesses++;
        h.consecutiveFailures = 0;
    } else {
        h.failedRequests++;
        h.consecutiveFailures++;
        h.consecutiveSuccesses = 0;
        h.lastError = error;
    }

    // Running mean over all requests
    const auto n = static_cast<std::int64_t>(h.totalRequests);
    h.averageLatency =
        std::chrono::milliseconds((h.averageLatency.count() * (n - 1) + latency.count()) / n);

    if (success && !h.isHealthy && h.consecutiveSuccesses >= config_.recoveryThreshold) {
        h.isHealthy = true;
        spdlog::info("gateway: provider '{}' recovered", name);
    } else if (!success && h.isHealthy && h.consecutiveFailures >= config_.unhealthyThreshold) {
        h.isHealthy = false;
        spdlog::warn("gateway: provider '{}' marked unhealthy after {} consecutive failures", name,
                     h.consecutiveFailures);
    }
}

Result<GatewayResponse> ProviderGateway::executeWithFailover(const ExecutionContext& ctx,
                                                             const GatewayRequest& request,
                                                             GatewayTrace* trace) {
    if (auto live = ctx.check(); !live) {
        return live.error();
    }

    std::string cacheKey;
    if (cache_) {
        cacheKey = ResponseCache::makeKey(request.prompt, request.model);
        if (auto hit = cache_->get(cacheKey)) {
            spdlog::debug("gateway: cache hit for model '{}'", request.model.modelId);
            GatewayResponse response;
            response.text = hit->reply.text;
            response.tokensUsed = hit->reply.tokensUsed;
            response.providerName = hit->providerName;
            response.modelId = hit->modelId;
            response.fromCache = true;
            return response;
        }
    }

    const auto order = providerOrder(request.preferredProvider);
    if (order.empty()) {
        return Error{ErrorCode::ProviderUnavailable, "no providers configured"};
    }

    const int attemptsPerProvider = 1 + std::max(0, request.retryCount);
    int totalAttempts = 0;
    Error lastError{ErrorCode::ProviderUnavailable, "no provider attempted"};
    std::optional<std::size_t> pendingFailover;
    // Providers removed after the order was taken are skipped and never named in a failover
    std::string lastAttempted;

    for (const auto& name : order) {
        std::shared_ptr<providers::ILanguageModel> model;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = std::find_if(slots_.begin(), slots_.end(),
                                   [&](const Slot& s) { return s.model->name() == name; });
            if (it != slots_.end()) {
                model = it->model;
            }
        }
        if (!model) {
            continue;
        }

        if (!lastAttempted.empty()) {
            FailoverEvent event;
            event.timestamp = std::chrono::system_clock::now();
            event.originalProvider = lastAttempted;
            event.reason = lastError.message;
            event.fallbackProvider = name;
            spdlog::warn("gateway: failing over from '{}' to '{}': {}", event.originalProvider,
                         name, event.reason);
            if (trace) {
                trace->failovers.push_back(std::move(event));
                pendingFailover = trace->failovers.size() - 1;
            }
        }
        lastAttempted = name;

        for (int attempt = 1; attempt <= attemptsPerProvider; ++attempt) {
            if (auto live = ctx.check(); !live) {
                return live.error();
            }

            ++totalAttempts;
            const auto start = Clock::now();
            auto reply = model->call(ctx, request.prompt, request.model);
            const auto latency =
                std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

            if (reply) {
                recordOutcome(name, true, latency, {});
                if (trace && pendingFailover) {
                    trace->failovers[*pendingFailover].success = true;
                }
                GatewayResponse response;
                response.text = reply.value().text;
                response.tokensUsed = reply.value().tokensUsed;
                response.providerName = name;
                response.modelId = request.model.modelId;
                response.latency = latency;
                response.attempts = totalAttempts;
                if (cache_) {
                    cache_->put(cacheKey, {reply.value(), name, request.model.modelId});
                }
                return response;
            }

            const auto& err = reply.error();
            // The caller gave up; this is not the provider's fault
            if (auto live = ctx.check(); !live) {
                return live.error();
            }
            if (err.code == ErrorCode::OperationCancelled) {
                return err;
            }

            recordOutcome(name, false, latency, err.message);
            lastError = err;

            if (!isRecoverable(err.code)) {
                spdlog::error("gateway: provider '{}' failed with non-recoverable error: {}", name,
                              err.message);
                return Error{err.code, format("provider '{}': {}", name, err.message)};
            }

            if (attempt < attemptsPerProvider) {
                const auto wait = backoffFor(attempt);
                spdlog::debug("gateway: provider '{}' attempt {} failed ({}), retrying in {}ms",
                              name, attempt, err.message, wait.count());
                if (trace) {
                    trace->retries.push_back(RetryAttempt{name, attempt, err.code, err.message, wait});
                }
                if (!ctx.waitFor(wait)) {
                    auto live = ctx.check();
                    return live ? Error{ErrorCode::OperationCancelled} : live.error();
                }
            } else if (trace) {
                trace->retries.push_back(
                    RetryAttempt{name, attempt, err.code, err.message, std::chrono::milliseconds(0)});
            }
        }
    }

    return Error{ErrorCode::ProviderUnavailable,
                 format("all {} providers failed, last error: {}", order.size(),
                        lastError.message)};
}

std::vector<ProviderHealth> ProviderGateway::getProviderHealth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProviderHealth> out;
    out.reserve(health_.size());
    for (const auto& [_, h] : health_) {
        out.push_back(h);
    }
    return out;
}

std::optional<ProviderHealth> ProviderGateway::getProviderHealth(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = health_.find(name);
    if (it == health_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ResponseCacheStats> ProviderGateway::getCacheStats() const {
    if (!cache_) {
        return std::nullopt;
    }
    return cache_->getStats();
}

} // namespace langextract::engine
