#include <langextract/core/format.h>
#include <langextract/providers/provider_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <initializer_list>
#include <cctype>

namespace langextract::providers {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool startsWithAny(const std::string& id, const std::initializer_list<std::string_view>& prefixes) {
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [&](std::string_view p) { return id.rfind(p, 0) == 0; });
}

} // namespace

const char* toString(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::OpenAI: return "openai";
        case ProviderKind::Gemini: return "gemini";
        case ProviderKind::Ollama: return "ollama";
        case ProviderKind::Replay: return "replay";
    }
    return "ollama";
}

std::optional<ProviderKind> parseProviderKind(std::string_view name) {
    const auto lowered = toLower(name);
    for (auto kind : {ProviderKind::OpenAI, ProviderKind::Gemini, ProviderKind::Ollama,
                      ProviderKind::Replay}) {
        if (lowered == toString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

ProviderRegistry::ProviderRegistry(ProviderKind defaultKind) : defaultKind_(defaultKind) {}

void ProviderRegistry::registerFactory(ProviderKind kind, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[kind] = std::move(factory);
    spdlog::debug("Registered provider factory: {}", toString(kind));
}

bool ProviderRegistry::hasFactory(ProviderKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(kind) > 0;
}

std::vector<ProviderKind> ProviderRegistry::registeredKinds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProviderKind> kinds;
    for (const auto& [kind, _] : factories_) {
        kinds.push_back(kind);
    }
    return kinds;
}

ProviderKind ProviderRegistry::inferKind(std::string_view modelId) const {
    const auto id = toLower(modelId);
    if (startsWithAny(id, {"gpt-", "o1", "o3", "text-davinci"})) {
        return ProviderKind::OpenAI;
    }
    if (startsWithAny(id, {"gemini"})) {
        return ProviderKind::Gemini;
    }
    if (startsWithAny(id, {"llama", "mistral", "codellama", "qwen", "phi", "gemma"})) {
        return ProviderKind::Ollama;
    }
    if (startsWithAny(id, {"replay"})) {
        return ProviderKind::Replay;
    }
    return defaultKind_;
}

Result<std::shared_ptr<ILanguageModel>>
ProviderRegistry::create(const ProviderSettings& settings) const {
    ProviderFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(settings.kind);
        if (it == factories_.end()) {
            return Error{ErrorCode::NotFound,
                         format("no provider factory registered for '{}'",
                                toString(settings.kind))};
        }
        factory = it->second;
    }
    return factory(settings);
}

Result<std::shared_ptr<ILanguageModel>>
ProviderRegistry::createForModel(const std::string& modelId, ProviderSettings settings) const {
    settings.modelId = modelId;
    settings.kind = inferKind(modelId);
    if (settings.name.empty()) {
        settings.name = toString(settings.kind);
    }
    return create(settings);
}

} // namespace langextract::providers
