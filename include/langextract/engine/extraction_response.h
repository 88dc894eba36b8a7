#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <langextract/core/types.h>
#include <langextract/document/annotated_document.h>
#include <langextract/document/schema.h>
#include <langextract/engine/provider_gateway.h>

namespace langextract::engine {

enum class StepStatus { Success, Warning, Error, Skipped };

const char* toString(StepStatus status);

/// One named, timed pipeline stage in the response trace
struct ProcessingStep {
    std::string name;
    TimePoint startTime;
    std::chrono::milliseconds duration{0};
    StepStatus status = StepStatus::Success;
    std::string message;
    nlohmann::json metadata = nlohmann::json::object();
};

struct QualityMetrics {
    std::size_t extractionCount = 0;
    double textCoverage = 0.0;  ///< Fraction of document characters grounded
    double meanConfidence = 0.0; ///< Over extractions that report a confidence
};

struct DebugInfo {
    std::vector<ProcessingStep> steps;
    std::vector<FailoverEvent> failoverEvents;
    std::vector<RetryAttempt> retryAttempts;
    std::vector<std::string> rawResponses;
    std::string generatedPrompt; ///< Prompt of the first pass
};

/**
 * @brief Result of one pipeline invocation.
 *
 * Always carries whatever was accumulated before a failure; check isSuccessful().
 */
struct ExtractionResponse {
    std::string requestId;
    TimePoint timestamp;

    std::vector<document::Extraction> extractions;
    std::optional<document::AnnotatedDocument> annotatedDocument;

    std::string providerUsed;
    std::string modelUsed;
    int tokensUsed = 0;
    int passesCompleted = 0;
    std::chrono::milliseconds executionTime{0};

    QualityMetrics metrics;
    std::vector<document::ValidationIssue> validationErrors;
    std::optional<Error> error;
    DebugInfo debug;

    bool isSuccessful() const noexcept { return !error.has_value(); }

    const ProcessingStep* findStep(const std::string& name) const;

    nlohmann::json toJson() const;
};

} // namespace langextract::engine
