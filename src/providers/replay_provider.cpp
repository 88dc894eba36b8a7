#include <langextract/core/format.h>
#include <langextract/providers/replay_provider.h>

#include <spdlog/spdlog.h>

#include <fstream>

namespace langextract::providers {

using json = nlohmann::json;

namespace {

std::optional<ErrorCode> parseErrorName(const std::string& name) {
    if (name == "timeout")
        return ErrorCode::Timeout;
    if (name == "rate_limited")
        return ErrorCode::RateLimited;
    if (name == "unavailable")
        return ErrorCode::ProviderUnavailable;
    if (name == "auth")
        return ErrorCode::AuthenticationFailed;
    if (name == "invalid")
        return ErrorCode::InvalidArgument;
    return std::nullopt;
}

} // namespace

ReplayProvider::ReplayProvider(std::string name, std::vector<Entry> script, bool loop)
    : name_(std::move(name)), script_(std::move(script)), loop_(loop) {}

Result<std::vector<ReplayProvider::Entry>> ReplayProvider::parseScript(const json& j) {
    if (!j.is_array()) {
        return Error{ErrorCode::InvalidData, "replay script must be a JSON array"};
    }
    std::vector<Entry> entries;
    for (const auto& item : j) {
        Entry entry;
        if (item.is_string()) {
            entry.text = item.get<std::string>();
        } else if (item.is_object() && item.contains("error")) {
            auto name = item["error"].is_string() ? item["error"].get<std::string>() : "";
            auto code = parseErrorName(name);
            if (!code) {
                return Error{ErrorCode::InvalidData,
                             format("unknown replay error kind '{}'", name)};
            }
            entry.error = *code;
            entry.errorMessage = item.value("message", std::string(errorToString(*code)));
        } else if (item.is_object() && item.contains("text") && item["text"].is_string()) {
            entry.text = item["text"].get<std::string>();
            entry.tokensUsed = item.value("tokens", 0);
        } else if (item.is_object()) {
            entry.text = item.dump();
        } else {
            return Error{ErrorCode::InvalidData, "replay entries must be strings or objects"};
        }
        if (item.is_object()) {
            entry.latency = std::chrono::milliseconds(item.value("latency_ms", 0));
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

Result<std::vector<ReplayProvider::Entry>>
ReplayProvider::loadScript(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, format("cannot open replay script {}", path.string())};
    }
    try {
        return parseScript(json::parse(in));
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData,
                     format("replay script {} is not valid JSON: {}", path.string(), e.what())};
    }
}

Result<ModelReply> ReplayProvider::call(const ExecutionContext& ctx, const std::string& prompt,
                                        const ModelConfig& config) {
    if (auto live = ctx.check(); !live) {
        return live.error();
    }

    Entry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prompts_.push_back(prompt);
        if (script_.empty() || (!loop_ && cursor_ >= script_.size())) {
            return Error{ErrorCode::ResourceExhausted,
                         format("replay provider '{}' has no more responses", name_)};
        }
        entry = script_[std::min(cursor_, script_.size() - 1)];
        ++cursor_;
    }

    spdlog::debug("replay provider '{}' answering call for model '{}'", name_, config.modelId);
    if (entry.latency.count() > 0 && !ctx.waitFor(entry.latency)) {
        auto live = ctx.check();
        return live ? Error{ErrorCode::OperationCancelled} : live.error();
    }
    if (entry.error != ErrorCode::Success) {
        return Error{entry.error, entry.errorMessage};
    }
    return ModelReply{entry.text, entry.tokensUsed};
}

std::size_t ReplayProvider::callCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_;
}

std::vector<std::string> ReplayProvider::prompts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prompts_;
}

void registerReplayProvider(ProviderRegistry& registry) {
    registry.registerFactory(
        ProviderKind::Replay,
        [](const ProviderSettings& settings) -> Result<std::shared_ptr<ILanguageModel>> {
            const auto& opts = settings.options;
            Result<std::vector<ReplayProvider::Entry>> script =
                std::vector<ReplayProvider::Entry>{};
            if (opts.contains("responses")) {
                script = ReplayProvider::parseScript(opts["responses"]);
            } else if (opts.contains("file") && opts["file"].is_string()) {
                script = ReplayProvider::loadScript(opts["file"].get<std::string>());
            } else {
                return Error{ErrorCode::InvalidArgument,
                             "replay provider needs 'responses' or 'file' option"};
            }
            if (!script) {
                return script.error();
            }
            auto name = settings.name.empty() ? std::string("replay") : settings.name;
            return std::shared_ptr<ILanguageModel>(std::make_shared<ReplayProvider>(
                std::move(name), std::move(script).value(), opts.value("loop", true)));
        });
}

} // namespace langextract::providers
