#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <langextract/providers/language_model.h>
#include <langextract/providers/provider_registry.h>

namespace langextract::providers {

/**
 * @brief Offline backend that plays back recorded model replies in order.
 *
 * Each entry is either a reply text or a typed failure. Once the script runs out the last
 * entry repeats when looping is enabled, otherwise calls fail with ResourceExhausted.
 */
class ReplayProvider : public ILanguageModel {
public:
    struct Entry {
        std::string text;
        int tokensUsed = 0;
        ErrorCode error = ErrorCode::Success;
        std::string errorMessage;
        std::chrono::milliseconds latency{0};
    };

    ReplayProvider(std::string name, std::vector<Entry> script, bool loop = true);

    /**
     * @brief Parse a script from JSON.
     *
     * Accepts an array whose items are plain strings (reply text), JSON objects holding the
     * model output directly, or {"text", "tokens", "latency_ms"} / {"error", "message"}
     * objects. Error names: "timeout", "rate_limited", "unavailable", "auth", "invalid".
     */
    static Result<std::vector<Entry>> parseScript(const nlohmann::json& j);
    static Result<std::vector<Entry>> loadScript(const std::filesystem::path& path);

    const std::string& name() const override { return name_; }
    ProviderKind kind() const override { return ProviderKind::Replay; }

    Result<ModelReply> call(const ExecutionContext& ctx, const std::string& prompt,
                            const ModelConfig& config) override;

    std::size_t callCount() const;
    std::vector<std::string> prompts() const;

private:
    std::string name_;
    std::vector<Entry> script_;
    bool loop_;
    mutable std::mutex mutex_;
    std::size_t cursor_ = 0;
    std::vector<std::string> prompts_;
};

/**
 * @brief Register the replay factory.
 *
 * Settings options: "responses" holds an inline script, "file" a path to one, and "loop"
 * toggles repetition of the last entry (default true).
 */
void registerReplayProvider(ProviderRegistry& registry);

} // namespace langextract::providers
