#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <langextract/core/execution_context.h>
#include <langextract/core/types.h>

namespace langextract::engine {

/// Live view of one in-flight request
struct ActiveRequestInfo {
    std::string requestId;
    std::chrono::steady_clock::time_point startedAt;
    std::string stage;
    double progress = 0.0;
    int currentPass = 0;
    int totalPasses = 0;
    int currentChunk = 0;
    int chunksProcessed = 0; ///< Within the current pass
    int totalChunks = 0;
    std::size_t textLength = 0;
    std::string modelId;
    ExecutionContext context;
};

/**
 * @brief Requests currently inside the pipeline, keyed by id.
 *
 * Readers take a shared lock; the pipeline is the only writer for its own entry.
 */
class RequestRegistry {
public:
    /// InvalidArgument when the id is already registered
    Result<void> add(ActiveRequestInfo info);
    void remove(const std::string& requestId);

    bool contains(const std::string& requestId) const;
    std::optional<ActiveRequestInfo> get(const std::string& requestId) const;
    std::vector<ActiveRequestInfo> snapshot() const;
    std::size_t size() const;

    /// Apply @p mutate to the entry under the write lock; false when absent
    bool update(const std::string& requestId,
                const std::function<void(ActiveRequestInfo&)>& mutate);

    /// Cancel the request's execution context; false when absent
    bool cancel(const std::string& requestId);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ActiveRequestInfo> requests_;
};

} // namespace langextract::engine
