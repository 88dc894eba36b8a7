#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <langextract/document/extraction.h>
#include <langextract/document/schema.h>

namespace langextract::engine {

/// Inputs for rendering the prompt of one extraction pass
struct PromptContext {
    std::string taskDescription;
    const std::vector<document::ExampleData>* examples = nullptr;
    const document::IExtractionSchema* schema = nullptr;
    std::optional<std::string> additionalContext;
    std::string text;
    int passNumber = 1;
    int totalPasses = 1;
    std::size_t chunkNumber = 1; ///< 1-based; a part note is added when totalChunks > 1
    std::size_t totalChunks = 1;
};

/**
 * @brief Composes the single prompt sent per pass.
 *
 * Sections in order: instruction, task, few-shot examples, expected classes, context,
 * pass note (later passes only), part note (chunked documents only), text, JSON output
 * contract.
 */
class PromptBuilder {
public:
    std::string build(const PromptContext& context) const;

    /// The JSON shape the model is asked to produce
    static const char* outputContract();
};

} // namespace langextract::engine
