#pragma once

#include <cstddef>
#include <vector>
#include <langextract/core/execution_context.h>
#include <langextract/engine/extraction_engine.h>

namespace langextract::engine {

struct BatchOptions {
    int concurrency = 4; ///< Pipeline invocations in flight at once
    int maxErrors = 0;   ///< Stop submitting once this many have failed; 0 never stops
};

struct BatchItemResult {
    std::size_t index = 0;
    bool submitted = false;
    ExtractionResponse response;
};

struct BatchSummary {
    std::vector<BatchItemResult> items; ///< One per input request, in input order
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    bool aborted = false; ///< Submission stopped early (error threshold or cancellation)
};

/**
 * @brief Bounded fan-out of independent extraction requests over one engine.
 *
 * Each request runs on its own thread once a slot frees up. A failure is recorded on its
 * item and never affects siblings that are already running.
 */
class BatchRunner {
public:
    BatchRunner(ExtractionEngine& engine, BatchOptions options = {});

    /// Every request's context is replaced by a child of @p ctx
    BatchSummary run(std::vector<ExtractionRequest> requests,
                     const ExecutionContext& ctx = ExecutionContext{});

    const BatchOptions& options() const noexcept { return options_; }

private:
    ExtractionEngine& engine_;
    BatchOptions options_;
};

} // namespace langextract::engine
