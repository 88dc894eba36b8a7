#include <langextract/engine/progress_tracker.h>

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <mutex>

namespace langextract::engine {

ExtractionProgress makeProgress(const ActiveRequestInfo& info, std::string message) {
    ExtractionProgress p;
    p.requestId = info.requestId;
    p.stage = info.stage;
    p.progress = info.progress;
    p.message = std::move(message);
    p.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - info.startedAt);
    p.currentPass = info.currentPass;
    p.totalPasses = info.totalPasses;
    p.currentChunk = info.currentChunk;
    p.chunksProcessed = info.chunksProcessed;
    p.totalChunks = info.totalChunks;
    return p;
}

ProgressTracker::ProgressTracker(std::string requestId, const RequestRegistry& registry,
                                 ProgressCallback callback, std::chrono::milliseconds interval,
                                 std::stop_token parent)
    : requestId_(std::move(requestId)), registry_(registry), callback_(std::move(callback)),
      interval_(interval), thread_([this](std::stop_token token) { run(std::move(token)); }) {
    parentLink_ = std::make_unique<std::stop_callback<std::function<void()>>>(
        std::move(parent), std::function<void()>([this] { thread_.request_stop(); }));
}

ProgressTracker::~ProgressTracker() {
    parentLink_.reset();
    stop();
}

void ProgressTracker::stop() {
    thread_.request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ProgressTracker::run(std::stop_token token) {
    std::mutex mutex;
    std::condition_variable_any cv;

    while (!token.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(mutex);
            if (cv.wait_for(lock, token, interval_, [] { return false; }) ||
                token.stop_requested()) {
                break;
            }
        }

        auto info = registry_.get(requestId_);
        if (!info) {
            break;
        }
        if (!callback_) {
            continue;
        }
        try {
            callback_(makeProgress(*info));
            reports_.fetch_add(1);
        } catch (const std::exception& e) {
            spdlog::warn("progress callback for request {} threw: {}", requestId_, e.what());
        }
    }
    spdlog::debug("progress tracker for request {} stopped", requestId_);
}

} // namespace langextract::engine
