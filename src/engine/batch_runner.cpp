#include <langextract/core/format.h>
#include <langextract/engine/batch_runner.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <semaphore>
#include <thread>

namespace langextract::engine {

namespace {

class SlotGuard {
public:
    explicit SlotGuard(std::counting_semaphore<>& sem) : sem_(sem) {}
    ~SlotGuard() { sem_.release(); }

    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    std::counting_semaphore<>& sem_;
};

} // namespace

BatchRunner::BatchRunner(ExtractionEngine& engine, BatchOptions options)
    : engine_(engine), options_(options) {
    options_.concurrency = std::max(1, options_.concurrency);
    options_.maxErrors = std::max(0, options_.maxErrors);
}

BatchSummary BatchRunner::run(std::vector<ExtractionRequest> requests,
                              const ExecutionContext& ctx) {
    BatchSummary summary;
    summary.items.resize(requests.size());
    for (std::size_t i = 0; i < requests.size(); ++i) {
        summary.items[i].index = i;
    }

    std::counting_semaphore<> slots(options_.concurrency);
    std::atomic<int> failures{0};
    auto thresholdReached = [&] {
        return options_.maxErrors > 0 && failures.load() >= options_.maxErrors;
    };

    std::size_t next = 0;
    {
        std::vector<std::jthread> workers;
        workers.reserve(requests.size());

        for (; next < requests.size(); ++next) {
            bool acquired = false;
            while (!thresholdReached() && !ctx.isCancelled() && !ctx.isExpired()) {
                if (slots.try_acquire_for(std::chrono::milliseconds(20))) {
                    acquired = true;
                    break;
                }
            }
            if (acquired && thresholdReached()) {
                slots.release();
                acquired = false;
            }
            if (!acquired) {
                summary.aborted = true;
                break;
            }

            auto& item = summary.items[next];
            item.submitted = true;
            auto request = std::move(requests[next]);
            request.context = ctx.child();

            workers.emplace_back([this, &slots, &failures, &item,
                                  request = std::move(request)]() mutable {
                SlotGuard guard(slots);
                item.response = engine_.processExtraction(std::move(request));
                if (!item.response.isSuccessful()) {
                    failures.fetch_add(1);
                    spdlog::warn("batch item {} failed: {}", item.index,
                                 item.response.error->message);
                }
            });
        }
    }

    const auto reason = thresholdReached()
                            ? format("not submitted: {} error(s) reached the limit",
                                     failures.load())
                            : std::string("not submitted: batch cancelled");
    for (std::size_t i = next; i < summary.items.size(); ++i) {
        auto& item = summary.items[i];
        item.response.requestId = requests[i].id;
        item.response.error = Error{ErrorCode::OperationCancelled, reason};
        ++summary.skipped;
    }

    for (const auto& item : summary.items) {
        if (!item.submitted) {
            continue;
        }
        if (item.response.isSuccessful()) {
            ++summary.succeeded;
        } else {
            ++summary.failed;
        }
    }

    if (summary.aborted) {
        spdlog::warn("batch stopped after {} of {} request(s): {}", next, requests.size(),
                     reason);
    }
    spdlog::info("batch finished: {} succeeded, {} failed, {} skipped", summary.succeeded,
                 summary.failed, summary.skipped);
    return summary;
}

} // namespace langextract::engine
