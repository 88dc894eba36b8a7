#include <langextract/engine/extraction_response.h>

#include <chrono>

namespace langextract::engine {

using json = nlohmann::json;

namespace {

std::int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

const char* toString(StepStatus status) {
    switch (status) {
        case StepStatus::Success: return "success";
        case StepStatus::Warning: return "warning";
        case StepStatus::Error: return "error";
        case StepStatus::Skipped: return "skipped";
    }
    return "success";
}

const ProcessingStep* ExtractionResponse::findStep(const std::string& name) const {
    for (const auto& step : debug.steps) {
        if (step.name == name) {
            return &step;
        }
    }
    return nullptr;
}

json ExtractionResponse::toJson() const {
    json j;
    j["request_id"] = requestId;
    j["timestamp_ms"] = toEpochMillis(timestamp);
    j["success"] = isSuccessful();
    if (error) {
        j["error"] = {{"code", errorToString(error->code)}, {"message", error->message}};
    }

    json items = json::array();
    for (const auto& e : extractions) {
        items.push_back(document::toJson(e));
    }
    j["extractions"] = std::move(items);
    if (annotatedDocument) {
        j["document_id"] = annotatedDocument->document().id();
    }

    j["execution"] = {{"provider", providerUsed},
                      {"model", modelUsed},
                      {"tokens_used", tokensUsed},
                      {"passes_completed", passesCompleted},
                      {"execution_time_ms", executionTime.count()}};
    j["metrics"] = {{"extraction_count", metrics.extractionCount},
                    {"text_coverage", metrics.textCoverage},
                    {"mean_confidence", metrics.meanConfidence}};

    json issues = json::array();
    for (const auto& v : validationErrors) {
        issues.push_back({{"field", v.field},
                          {"value", v.value},
                          {"constraint", v.constraint},
                          {"message", v.message}});
    }
    j["validation_errors"] = std::move(issues);

    json steps = json::array();
    for (const auto& s : debug.steps) {
        steps.push_back({{"name", s.name},
                         {"start_ms", toEpochMillis(s.startTime)},
                         {"duration_ms", s.duration.count()},
                         {"status", toString(s.status)},
                         {"message", s.message},
                         {"metadata", s.metadata}});
    }
    json failovers = json::array();
    for (const auto& f : debug.failoverEvents) {
        failovers.push_back({{"timestamp_ms", toEpochMillis(f.timestamp)},
                             {"original_provider", f.originalProvider},
                             {"reason", f.reason},
                             {"fallback_provider", f.fallbackProvider},
                             {"success", f.success}});
    }
    json retries = json::array();
    for (const auto& r : debug.retryAttempts) {
        retries.push_back({{"provider", r.provider},
                           {"attempt", r.attempt},
                           {"code", errorToString(r.code)},
                           {"message", r.message},
                           {"backoff_ms", r.backoff.count()}});
    }
    j["debug"] = {{"steps", std::move(steps)},
                  {"failover_events", std::move(failovers)},
                  {"retry_attempts", std::move(retries)},
                  {"raw_responses", debug.rawResponses},
                  {"generated_prompt", debug.generatedPrompt}};
    return j;
}

} // namespace langextract::engine
