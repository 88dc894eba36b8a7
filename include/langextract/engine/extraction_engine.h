#pragma once

#include <chrono>
#include <memory>
#include <semaphore>
#include <string>
#include <vector>
#include <langextract/alignment/text_aligner.h>
#include <langextract/chunking/text_chunker.h>
#include <langextract/engine/aggregator.h>
#include <langextract/engine/extraction_request.h>
#include <langextract/engine/extraction_response.h>
#include <langextract/engine/prompt_builder.h>
#include <langextract/engine/provider_gateway.h>
#include <langextract/engine/request_registry.h>
#include <langextract/engine/response_parser.h>

namespace langextract::engine {

/// Pipeline stage names, in execution order
inline constexpr const char* kStageInitialization = "initialization";
inline constexpr const char* kStagePreprocessing = "preprocessing";
inline constexpr const char* kStageExtraction = "extraction";
inline constexpr const char* kStageAggregation = "aggregation";
inline constexpr const char* kStageValidation = "validation";
inline constexpr const char* kStageFinalization = "finalization";

struct EngineOptions {
    int maxConcurrentRequests = 10;
    std::chrono::milliseconds defaultTimeout{60000};
    int defaultRetryCount = 2;

    bool enableMultiPass = false; ///< Pick the pass count from text length when unset
    int maxPasses = 3;
    double passImprovementThreshold = 0.1;

    AggregationOptions aggregation;
    alignment::AlignmentOptions alignment;
    /// When enabled, each pass calls the gateway once per chunk
    chunking::ChunkingOptions chunking;

    bool enableProgressTracking = true;
    std::chrono::milliseconds progressInterval{1000};

    Result<void> validate() const;
};

/**
 * @brief Staged extraction pipeline.
 *
 * initialization -> preprocessing (document and chunk plan) -> extraction (N passes
 * through the gateway, each aligned against its chunk) -> aggregation -> validation ->
 * finalization.
 *
 * processExtraction() is synchronous; many threads may call it at once, bounded by
 * maxConcurrentRequests.
 */
class ExtractionEngine {
public:
    ExtractionEngine(EngineOptions options, std::shared_ptr<ProviderGateway> gateway);
    ~ExtractionEngine();

    ExtractionEngine(const ExtractionEngine&) = delete;
    ExtractionEngine& operator=(const ExtractionEngine&) = delete;

    ExtractionResponse processExtraction(ExtractionRequest request);

    std::vector<ActiveRequestInfo> getActiveRequests() const;
    bool cancelRequest(const std::string& requestId);

    std::vector<ProviderHealth> getProviderHealth() const;
    std::optional<ResponseCacheStats> getCacheStats() const;

    const EngineOptions& options() const noexcept { return options_; }

    /// 1 pass below 5000 characters, 2 below 10000, else 3; capped at @p maxPasses
    static int recommendedPasses(std::size_t textLength, int maxPasses);

private:
    struct Run;
    struct StageOutcome;
    using StageFn = Result<StageOutcome> (ExtractionEngine::*)(Run&);

    Result<void> runStage(Run& run, const char* name, double progressAfter, StageFn stage,
                          bool wrapErrors);
    Result<void> executePipeline(Run& run);

    Result<StageOutcome> stageInitialization(Run& run);
    Result<StageOutcome> stagePreprocessing(Run& run);
    Result<StageOutcome> stageExtraction(Run& run);
    Result<StageOutcome> stageAggregation(Run& run);
    Result<StageOutcome> stageValidation(Run& run);
    Result<StageOutcome> stageFinalization(Run& run);

    Result<void> acquireSlot(const ExecutionContext& ctx);

    EngineOptions options_;
    std::shared_ptr<ProviderGateway> gateway_;
    alignment::TextAligner aligner_;
    Aggregator aggregator_;
    chunking::TextChunker chunker_;
    PromptBuilder promptBuilder_;
    ResponseParser parser_;
    RequestRegistry registry_;
    std::counting_semaphore<> slots_;
};

} // namespace langextract::engine
