#include <langextract/core/format.h>
#include <langextract/core/uuid.h>
#include <langextract/engine/extraction_engine.h>
#include <langextract/engine/progress_tracker.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_set>

namespace langextract::engine {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

struct ExtractionEngine::Run {
    ExtractionRequest& request;
    ExtractionResponse& response;
    ExecutionContext ctx;
    std::optional<document::Document> doc;
    int retryCount = 0;
    int passes = 1;
    std::vector<chunking::TextChunk> chunks;
    std::vector<document::Extraction> extractions;
};

struct ExtractionEngine::StageOutcome {
    StepStatus status = StepStatus::Success;
    std::string message;
    json metadata = json::object();
};

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

Result<void> EngineOptions::validate() const {
    if (maxConcurrentRequests <= 0) {
        return Error{ErrorCode::InvalidArgument, "max concurrent requests must be positive"};
    }
    if (defaultTimeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "default timeout must be positive"};
    }
    if (maxPasses < 1) {
        return Error{ErrorCode::InvalidArgument, "max passes must be at least 1"};
    }
    if (passImprovementThreshold < 0.0 || passImprovementThreshold > 1.0) {
        return Error{ErrorCode::InvalidArgument, "pass improvement threshold must be in [0, 1]"};
    }
    if (aggregation.confidenceThreshold < 0.0 || aggregation.confidenceThreshold > 1.0) {
        return Error{ErrorCode::InvalidArgument, "confidence threshold must be in [0, 1]"};
    }
    if (progressInterval.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "progress interval must be positive"};
    }
    if (chunking.enabled) {
        if (auto valid = chunking.validate(); !valid) {
            return valid;
        }
    }
    return alignment.validate();
}

ExtractionEngine::ExtractionEngine(EngineOptions options, std::shared_ptr<ProviderGateway> gateway)
    : options_(std::move(options)), gateway_(std::move(gateway)), aligner_(options_.alignment),
      aggregator_(options_.aggregation), chunker_(options_.chunking),
      slots_(std::max<std::ptrdiff_t>(1, options_.maxConcurrentRequests)) {}

ExtractionEngine::~ExtractionEngine() = default;

int ExtractionEngine::recommendedPasses(std::size_t textLength, int maxPasses) {
    int passes = 3;
    if (textLength < 5000) {
        passes = 1;
    } else if (textLength < 10000) {
        passes = 2;
    }
    return std::max(1, std::min(passes, maxPasses));
}

std::vector<ActiveRequestInfo> ExtractionEngine::getActiveRequests() const {
    return registry_.snapshot();
}

bool ExtractionEngine::cancelRequest(const std::string& requestId) {
    return registry_.cancel(requestId);
}

std::vector<ProviderHealth> ExtractionEngine::getProviderHealth() const {
    return gateway_ ? gateway_->getProviderHealth() : std::vector<ProviderHealth>{};
}

std::optional<ResponseCacheStats> ExtractionEngine::getCacheStats() const {
    return gateway_ ? gateway_->getCacheStats() : std::nullopt;
}

Result<void> ExtractionEngine::acquireSlot(const ExecutionContext& ctx) {
    while (!slots_.try_acquire_for(std::chrono::milliseconds(20))) {
        if (auto live = ctx.check(); !live) {
            return live.error();
        }
    }
    return {};
}

ExtractionResponse ExtractionEngine::processExtraction(ExtractionRequest request) {
    const auto started = Clock::now();

    ExtractionResponse response;
    response.timestamp = std::chrono::system_clock::now();
    if (request.id.empty()) {
        request.id = core::generateId("req");
    }
    response.requestId = request.id;

    auto timeout = request.timeout.value_or(options_.defaultTimeout);
    Run run{request, response, request.context.child(timeout)};

    if (auto slot = acquireSlot(run.ctx); !slot) {
        response.error = slot.error();
        return response;
    }
    struct SlotRelease {
        std::counting_semaphore<>& sem;
        ~SlotRelease() { sem.release(); }
    } release{slots_};

    ActiveRequestInfo info;
    info.requestId = request.id;
    info.startedAt = started;
    info.stage = kStageInitialization;
    info.textLength = request.document ? request.document->length() : request.text.size();
    info.modelId = request.modelId;
    info.context = run.ctx;
    if (auto added = registry_.add(std::move(info)); !added) {
        response.error = added.error();
        return response;
    }

    {
        std::unique_ptr<ProgressTracker> tracker;
        if (options_.enableProgressTracking && request.progressCallback) {
            tracker = std::make_unique<ProgressTracker>(request.id, registry_,
                                                        request.progressCallback,
                                                        options_.progressInterval,
                                                        run.ctx.stopToken());
        }

        spdlog::debug("request {}: pipeline started", request.id);
        if (auto result = executePipeline(run); !result) {
            response.error = result.error();
            spdlog::error("request {}: {}", request.id, result.error().message);
        }
    }
    registry_.remove(request.id);

    response.extractions = std::move(run.extractions);
    response.executionTime =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    spdlog::debug("request {}: finished in {}ms with {} extraction(s)", request.id,
                  response.executionTime.count(), response.extractions.size());
    return response;
}

Result<void> ExtractionEngine::executePipeline(Run& run) {
    if (auto r = runStage(run, kStageInitialization, 0.05, &ExtractionEngine::stageInitialization,
                          false);
        !r) {
        return r;
    }
    if (auto r = runStage(run, kStagePreprocessing, 0.1, &ExtractionEngine::stagePreprocessing,
                          false);
        !r) {
        return r;
    }
    if (auto r = runStage(run, kStageExtraction, 0.7, &ExtractionEngine::stageExtraction, true);
        !r) {
        return r;
    }
    if (auto r = runStage(run, kStageAggregation, 0.8, &ExtractionEngine::stageAggregation, true);
        !r) {
        return r;
    }
    if (auto r = runStage(run, kStageValidation, 0.9, &ExtractionEngine::stageValidation, true);
        !r) {
        return r;
    }
    return runStage(run, kStageFinalization, 1.0, &ExtractionEngine::stageFinalization, true);
}

Result<void> ExtractionEngine::runStage(Run& run, const char* name, double progressAfter,
                                        StageFn stage, bool wrapErrors) {
    ProcessingStep step;
    step.name = name;
    step.startTime = std::chrono::system_clock::now();
    const auto start = Clock::now();

    registry_.update(run.request.id, [&](ActiveRequestInfo& info) { info.stage = name; });

    Result<StageOutcome> outcome = Error{ErrorCode::InternalError};
    if (auto live = run.ctx.check(); !live) {
        outcome = live.error();
    } else {
        outcome = (this->*stage)(run);
    }
    step.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    if (!outcome) {
        const auto& err = outcome.error();
        step.status = StepStatus::Error;
        step.message = err.message;
        run.response.debug.steps.push_back(std::move(step));
        if (wrapErrors) {
            return Error{err.code, format("{} failed: {}", name, err.message)};
        }
        return err;
    }

    auto& value = outcome.value();
    step.status = value.status;
    step.message = std::move(value.message);
    step.metadata = std::move(value.metadata);
    spdlog::debug("request {}: stage {} {} in {}ms", run.request.id, name, toString(step.status),
                  step.duration.count());
    run.response.debug.steps.push_back(std::move(step));

    registry_.update(run.request.id,
                     [&](ActiveRequestInfo& info) { info.progress = progressAfter; });
    return {};
}

Result<ExtractionEngine::StageOutcome> ExtractionEngine::stageInitialization(Run& run) {
    auto& request = run.request;
    if (auto valid = options_.validate(); !valid) {
        return Error{ErrorCode::InvalidArgument,
                     format("invalid engine options: {}", valid.error().message)};
    }
    if (!gateway_) {
        return Error{ErrorCode::InvalidArgument, "engine has no provider gateway"};
    }
    if (!request.document && request.text.empty()) {
        return Error{ErrorCode::ValidationError, "request must include a document or text"};
    }
    if (isBlank(request.taskDescription)) {
        return Error{ErrorCode::ValidationError, "task description cannot be empty"};
    }
    for (std::size_t i = 0; i < request.examples.size(); ++i) {
        if (auto valid = request.examples[i].validate(); !valid) {
            return Error{ErrorCode::ValidationError,
                         format("example {}: {}", i + 1, valid.error().message)};
        }
    }

    run.retryCount = (request.retryCount && *request.retryCount >= 0) ? *request.retryCount
                                                                      : options_.defaultRetryCount;

    const std::size_t textLength =
        request.document ? request.document->length() : request.text.size();
    if (request.extractionPasses && *request.extractionPasses >= 1) {
        run.passes = *request.extractionPasses;
    } else if (options_.enableMultiPass) {
        run.passes = recommendedPasses(textLength, options_.maxPasses);
    } else {
        run.passes = 1;
    }

    registry_.update(request.id, [&](ActiveRequestInfo& info) { info.totalPasses = run.passes; });

    StageOutcome out;
    out.message = "request validated";
    out.metadata = {{"text_length", textLength},
                    {"has_examples", !request.examples.empty()},
                    {"has_schema", request.schema != nullptr},
                    {"retry_count", run.retryCount},
                    {"extraction_passes", run.passes}};
    return out;
}

Result<ExtractionEngine::StageOutcome> ExtractionEngine::stagePreprocessing(Run& run) {
    auto& request = run.request;
    run.doc = request.document ? *request.document : document::Document(request.text);
    if (run.doc->isBlank()) {
        return Error{ErrorCode::ValidationError, "document text is empty after trimming"};
    }

    if (options_.chunking.enabled) {
        auto chunks = chunker_.chunk(run.doc->text(), &run.ctx);
        if (!chunks) {
            return chunks.error();
        }
        run.chunks = std::move(chunks).value();
    } else {
        chunking::TextChunk whole;
        whole.totalChunks = 1;
        whole.interval = document::CharInterval{0, run.doc->length()};
        run.chunks.push_back(whole);
    }
    registry_.update(request.id, [&](ActiveRequestInfo& info) {
        info.totalChunks = static_cast<int>(run.chunks.size());
    });

    StageOutcome out;
    out.message = "document prepared";
    out.metadata = {{"document_id", run.doc->id()},
                    {"text_length", run.doc->length()},
                    {"token_count", run.doc->tokenCount()},
                    {"chunk_count", run.chunks.size()}};
    if (options_.chunking.enabled) {
        out.metadata["chunking_strategy"] = chunking::toString(options_.chunking.strategy);
    }
    return out;
}

Result<ExtractionEngine::StageOutcome> ExtractionEngine::stageExtraction(Run& run) {
    auto& request = run.request;
    auto& response = run.response;
    const auto& doc = *run.doc;

    std::unordered_set<std::string> seen;
    std::optional<Error> laterFailure;
    bool stoppedEarly = false;

    const std::size_t totalChunks = run.chunks.size();
    for (int pass = 1; pass <= run.passes; ++pass) {
        if (auto live = run.ctx.check(); !live) {
            return live.error();
        }
        registry_.update(request.id, [&](ActiveRequestInfo& info) {
            info.currentPass = pass;
            info.chunksProcessed = 0;
            info.progress = 0.1 + 0.6 * static_cast<double>(pass - 1) / run.passes;
        });

        std::vector<document::Extraction> passExtractions;
        std::size_t groundedCount = 0;
        std::optional<Error> passError;
        for (const auto& chunk : run.chunks) {
            if (auto live = run.ctx.check(); !live) {
                passError = live.error();
                break;
            }
            registry_.update(request.id, [&](ActiveRequestInfo& info) {
                info.currentChunk = static_cast<int>(chunk.index + 1);
            });

            PromptContext promptCtx;
            promptCtx.taskDescription = request.taskDescription;
            promptCtx.examples = &request.examples;
            promptCtx.schema = request.schema.get();
            promptCtx.additionalContext = doc.additionalContext();
            promptCtx.text = std::string(chunk.text(doc.text()));
            promptCtx.passNumber = pass;
            promptCtx.totalPasses = run.passes;
            promptCtx.chunkNumber = chunk.index + 1;
            promptCtx.totalChunks = totalChunks;

            GatewayRequest call;
            call.prompt = promptBuilder_.build(promptCtx);
            call.model.modelId = request.modelId;
            call.model.temperature = request.temperature;
            call.model.maxTokens = request.maxTokens;
            call.retryCount = run.retryCount;
            if (!request.providerName.empty()) {
                call.preferredProvider = request.providerName;
            }
            if (pass == 1 && chunk.index == 0) {
                response.debug.generatedPrompt = call.prompt;
            }

            GatewayTrace trace;
            auto reply = gateway_->executeWithFailover(run.ctx, call, &trace);
            std::move(trace.failovers.begin(), trace.failovers.end(),
                      std::back_inserter(response.debug.failoverEvents));
            std::move(trace.retries.begin(), trace.retries.end(),
                      std::back_inserter(response.debug.retryAttempts));

            Result<std::vector<document::Extraction>> parsed =
                reply ? parser_.parse(reply.value().text)
                      : Result<std::vector<document::Extraction>>(reply.error());
            if (reply) {
                response.debug.rawResponses.push_back(reply.value().text);
                response.providerUsed = reply.value().providerName;
                response.modelUsed = reply.value().modelId;
                response.tokensUsed += reply.value().tokensUsed;
            }
            if (!parsed) {
                passError = totalChunks > 1
                                ? Error{parsed.error().code,
                                        format("chunk {}/{}: {}", chunk.index + 1, totalChunks,
                                               parsed.error().message)}
                                : parsed.error();
                break;
            }

            auto chunkExtractions = std::move(parsed).value();
            auto grounded = aligner_.groundExtractions(chunkExtractions, doc, chunk.interval,
                                                       options_.alignment, &run.ctx);
            if (!grounded) {
                return grounded.error();
            }
            groundedCount += grounded.value();
            std::move(chunkExtractions.begin(), chunkExtractions.end(),
                      std::back_inserter(passExtractions));

            registry_.update(request.id, [&](ActiveRequestInfo& info) {
                info.chunksProcessed = static_cast<int>(chunk.index + 1);
                info.progress =
                    0.1 + 0.6 *
                              (static_cast<double>(pass - 1) +
                               static_cast<double>(chunk.index + 1) /
                                   static_cast<double>(totalChunks)) /
                              run.passes;
            });
        }

        if (passError) {
            const auto& err = *passError;
            const bool aborted = !run.ctx.check();
            if (pass == 1 || aborted) {
                return Error{err.code, format("pass {}: {}", pass, err.message)};
            }
            spdlog::warn("request {}: pass {} failed, keeping {} earlier extraction(s): {}",
                         request.id, pass, run.extractions.size(), err.message);
            laterFailure = Error{err.code, format("pass {} failed: {}", pass, err.message)};
            break;
        }

        std::size_t novel = 0;
        for (auto& e : passExtractions) {
            if (seen.insert(e.dedupKey()).second) {
                ++novel;
            }
            e.index = static_cast<int>(run.extractions.size());
            run.extractions.push_back(std::move(e));
        }
        response.passesCompleted = pass;
        spdlog::debug("request {}: pass {} produced {} extraction(s), {} new, {} grounded",
                      request.id, pass, passExtractions.size(), novel, groundedCount);

        if (pass > 1 && pass < run.passes && !run.extractions.empty()) {
            const double improvement =
                static_cast<double>(novel) / static_cast<double>(run.extractions.size());
            if (improvement < options_.passImprovementThreshold) {
                spdlog::debug("request {}: stopping after pass {} (improvement {:.3f})",
                              request.id, pass, improvement);
                stoppedEarly = true;
                break;
            }
        }
    }

    StageOutcome out;
    out.metadata = {{"passes_planned", run.passes},
                    {"passes_completed", response.passesCompleted},
                    {"chunk_count", totalChunks},
                    {"extraction_count", run.extractions.size()},
                    {"stopped_early", stoppedEarly}};
    if (laterFailure) {
        out.status = StepStatus::Warning;
        out.message = laterFailure->message;
        out.metadata["error"] = laterFailure->message;
    } else {
        out.message = format("completed {} extraction pass(es) with {} extraction(s)",
                             response.passesCompleted, run.extractions.size());
    }
    return out;
}

Result<ExtractionEngine::StageOutcome> ExtractionEngine::stageAggregation(Run& run) {
    StageOutcome out;
    if (!options_.aggregation.enableDeduplication || run.extractions.empty()) {
        out.status = StepStatus::Skipped;
        out.message = run.extractions.empty() ? "no extractions to aggregate"
                                              : "deduplication disabled";
        return out;
    }

    AggregationStats stats;
    run.extractions = aggregator_.aggregate(std::move(run.extractions), run.doc->text(), &stats);
    out.message = format("{} -> {} extraction(s)", stats.originalCount, stats.finalCount);
    out.metadata = {{"original_count", stats.originalCount},
                    {"final_count", stats.finalCount},
                    {"duplicates_removed", stats.duplicatesRemoved},
                    {"overlaps_resolved", stats.overlapsResolved},
                    {"low_confidence_filtered", stats.lowConfidenceFiltered}};
    return out;
}

Result<ExtractionEngine::StageOutcome> ExtractionEngine::stageValidation(Run& run) {
    StageOutcome out;
    const auto& schema = run.request.schema;
    if (!schema || !run.request.validateOutput) {
        out.status = StepStatus::Skipped;
        out.message = schema ? "output validation disabled" : "no schema provided";
        return out;
    }

    std::vector<document::Extraction> valid;
    valid.reserve(run.extractions.size());
    std::size_t invalid = 0;
    for (auto& e : run.extractions) {
        auto issues = schema->validate(e);
        if (issues.empty()) {
            valid.push_back(std::move(e));
            continue;
        }
        ++invalid;
        for (auto& issue : issues) {
            run.response.validationErrors.push_back(std::move(issue));
        }
    }
    run.extractions = std::move(valid);

    out.status = invalid > 0 ? StepStatus::Warning : StepStatus::Success;
    out.message = format("{} valid, {} invalid", run.extractions.size(), invalid);
    out.metadata = {{"valid_count", run.extractions.size()}, {"invalid_count", invalid}};
    return out;
}

Result<ExtractionEngine::StageOutcome> ExtractionEngine::stageFinalization(Run& run) {
    auto& response = run.response;
    const double coverage = document::computeCoverage(run.extractions, run.doc->length());

    double total = 0.0;
    std::size_t scored = 0;
    for (const auto& e : run.extractions) {
        if (e.confidence) {
            total += *e.confidence;
            ++scored;
        }
    }

    response.metrics.extractionCount = run.extractions.size();
    response.metrics.textCoverage = coverage;
    response.metrics.meanConfidence = scored > 0 ? total / static_cast<double>(scored) : 0.0;
    response.annotatedDocument.emplace(*run.doc, run.extractions);

    StageOutcome out;
    out.message = "annotated document ready";
    out.metadata = {{"extraction_count", response.metrics.extractionCount},
                    {"text_coverage", response.metrics.textCoverage},
                    {"confidence_score", response.metrics.meanConfidence}};
    return out;
}

} // namespace langextract::engine
