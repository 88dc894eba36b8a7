#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <langextract/providers/language_model.h>

namespace langextract::providers {

/**
 * @brief Everything a factory needs to build one backend instance.
 */
struct ProviderSettings {
    std::string name; ///< Instance name used in health reports and failover events
    ProviderKind kind = ProviderKind::Ollama;
    std::string modelId;
    std::string apiKey;
    std::string baseUrl;
    nlohmann::json options = nlohmann::json::object();
};

using ProviderFactory =
    std::function<Result<std::shared_ptr<ILanguageModel>>(const ProviderSettings&)>;

/**
 * @brief Factory registry keyed by provider kind.
 *
 * Constructed and owned by the caller; there is no process-wide instance.
 */
class ProviderRegistry {
public:
    explicit ProviderRegistry(ProviderKind defaultKind = ProviderKind::Ollama);

    void registerFactory(ProviderKind kind, ProviderFactory factory);
    bool hasFactory(ProviderKind kind) const;
    std::vector<ProviderKind> registeredKinds() const;

    ProviderKind defaultKind() const noexcept { return defaultKind_; }

    /// Kind implied by a model id; ids of no known family map to the default kind
    ProviderKind inferKind(std::string_view modelId) const;

    Result<std::shared_ptr<ILanguageModel>> create(const ProviderSettings& settings) const;

    /// Infer the kind from @p modelId, then create
    Result<std::shared_ptr<ILanguageModel>> createForModel(const std::string& modelId,
                                                           ProviderSettings settings = {}) const;

private:
    ProviderKind defaultKind_;
    mutable std::mutex mutex_;
    std::map<ProviderKind, ProviderFactory> factories_;
};

} // namespace langextract::providers
