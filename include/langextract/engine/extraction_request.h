#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <langextract/core/execution_context.h>
#include <langextract/document/document.h>
#include <langextract/document/extraction.h>
#include <langextract/document/schema.h>

namespace langextract::engine {

/// Snapshot delivered to progress callbacks
struct ExtractionProgress {
    std::string requestId;
    std::string stage;
    double progress = 0.0; ///< [0, 1]
    std::string message;
    std::chrono::milliseconds elapsed{0};
    int currentPass = 0;
    int totalPasses = 0;
    int currentChunk = 0;
    int chunksProcessed = 0;
    int totalChunks = 0;
};

/// Must not block; invoked from the progress reporter thread
using ProgressCallback = std::function<void(const ExtractionProgress&)>;

/**
 * @brief Input to one pipeline invocation.
 *
 * Either @ref document or @ref text must be set; when both are, the document wins.
 */
struct ExtractionRequest {
    std::string id; ///< Generated when empty

    std::optional<document::Document> document;
    std::string text;

    std::string taskDescription;
    std::vector<document::ExampleData> examples;
    std::shared_ptr<const document::IExtractionSchema> schema;

    std::string providerName; ///< Preferred provider; empty lets the gateway choose
    std::string modelId;
    std::optional<double> temperature;
    std::optional<int> maxTokens;

    std::optional<int> retryCount;      ///< Unset or negative means the engine default
    std::optional<int> extractionPasses; ///< Unset picks a pass count from text length
    std::optional<std::chrono::milliseconds> timeout;
    bool validateOutput = false;

    ExecutionContext context;
    ProgressCallback progressCallback;
};

} // namespace langextract::engine
