#include <langextract/core/format.h>
#include <langextract/engine/prompt_builder.h>

namespace langextract::engine {

const char* PromptBuilder::outputContract() {
    return "Please extract entities in the following JSON format:\n"
           "{\n"
           "  \"extractions\": [\n"
           "    {\n"
           "      \"extraction_class\": \"class_name\",\n"
           "      \"extraction_text\": \"extracted_text\",\n"
           "      \"confidence\": 0.95\n"
           "    }\n"
           "  ]\n"
           "}";
}

std::string PromptBuilder::build(const PromptContext& context) const {
    std::string prompt;
    prompt += "Extract structured information from the following text.\n\n";

    if (!context.taskDescription.empty()) {
        prompt += format("Task: {}\n\n", context.taskDescription);
    }

    if (context.examples && !context.examples->empty()) {
        prompt += "Examples:\n";
        for (std::size_t i = 0; i < context.examples->size(); ++i) {
            const auto& example = (*context.examples)[i];
            prompt += format("\nExample {}:\nText: {}\n", i + 1, example.text);
            if (!example.extractions.empty()) {
                prompt += "Extractions:\n";
                for (const auto& e : example.extractions) {
                    prompt += format("- {}: {}\n", e.extractionClass, e.text);
                }
            }
        }
        prompt += "\n";
    }

    if (context.schema) {
        const auto classes = context.schema->classNames();
        if (!classes.empty()) {
            prompt += "Expected extraction classes: ";
            for (std::size_t i = 0; i < classes.size(); ++i) {
                if (i > 0) {
                    prompt += ", ";
                }
                prompt += classes[i];
            }
            prompt += "\n\n";
        }
    }

    if (context.additionalContext && !context.additionalContext->empty()) {
        prompt += format("Additional context: {}\n\n", *context.additionalContext);
    }

    if (context.passNumber > 1) {
        prompt += format("This is extraction pass {} of {}. Include entities that an earlier "
                         "pass may have missed.\n\n",
                         context.passNumber, context.totalPasses);
    }

    if (context.totalChunks > 1) {
        prompt += format("The text below is part {} of {} of a longer document. Extract only "
                         "entities that appear in this part.\n\n",
                         context.chunkNumber, context.totalChunks);
    }

    prompt += format("Text to process:\n{}\n\n", context.text);
    prompt += outputContract();
    return prompt;
}

} // namespace langextract::engine
