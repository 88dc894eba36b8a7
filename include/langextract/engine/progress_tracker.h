#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <langextract/engine/extraction_request.h>
#include <langextract/engine/request_registry.h>

namespace langextract::engine {

/**
 * @brief Background reporter that samples a request's registry entry on a fixed interval.
 *
 * Owned by the request invocation. The thread exits when the tracker is destroyed or
 * stopped, when the request's context is cancelled, or when the entry leaves the registry.
 * It only reads shared state and hands snapshots to the callback.
 */
class ProgressTracker {
public:
    ProgressTracker(std::string requestId, const RequestRegistry& registry,
                    ProgressCallback callback, std::chrono::milliseconds interval,
                    std::stop_token parent);
    ~ProgressTracker();

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    void stop();

    std::size_t reportsSent() const noexcept { return reports_.load(); }

private:
    void run(std::stop_token token);

    std::string requestId_;
    const RequestRegistry& registry_;
    ProgressCallback callback_;
    std::chrono::milliseconds interval_;
    std::atomic<std::size_t> reports_{0};

    std::jthread thread_;
    std::unique_ptr<std::stop_callback<std::function<void()>>> parentLink_;
};

/// Build the callback payload from a registry entry
ExtractionProgress makeProgress(const ActiveRequestInfo& info, std::string message = {});

} // namespace langextract::engine
