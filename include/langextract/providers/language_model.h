#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <langextract/core/execution_context.h>
#include <langextract/core/types.h>

namespace langextract::providers {

/// Known backend families; unknown model ids fall back to a registry default
enum class ProviderKind { OpenAI, Gemini, Ollama, Replay };

const char* toString(ProviderKind kind);
std::optional<ProviderKind> parseProviderKind(std::string_view name);

/// Per-call generation parameters
struct ModelConfig {
    std::string modelId;
    std::optional<double> temperature;
    std::optional<int> maxTokens;
};

struct ModelReply {
    std::string text;
    int tokensUsed = 0;
};

/**
 * @brief Opaque language model backend: send a prompt, receive text.
 *
 * Implementations report failures with a typed error so the gateway can decide between
 * retry, failover and abort:
 *  - Timeout, RateLimited, ProviderUnavailable are recoverable
 *  - AuthenticationFailed, InvalidArgument end the pass
 *
 * A call must return promptly with OperationCancelled or Timeout once @p ctx is done.
 */
class ILanguageModel {
public:
    virtual ~ILanguageModel() = default;

    virtual const std::string& name() const = 0;
    virtual ProviderKind kind() const = 0;

    virtual Result<ModelReply> call(const ExecutionContext& ctx, const std::string& prompt,
                                    const ModelConfig& config) = 0;
};

} // namespace langextract::providers
