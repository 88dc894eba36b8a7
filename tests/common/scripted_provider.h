#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include <langextract/providers/language_model.h>

namespace langextract::test {

/**
 * Fake backend driven by a callback or a queue of canned outcomes. Once the queue
 * drains, the last outcome repeats.
 */
class ScriptedProvider : public providers::ILanguageModel {
public:
    using Handler =
        std::function<Result<providers::ModelReply>(const ExecutionContext&, const std::string&)>;

    ScriptedProvider(std::string name, Handler handler)
        : name_(std::move(name)), handler_(std::move(handler)) {}

    ScriptedProvider(std::string name, std::vector<Result<providers::ModelReply>> outcomes)
        : name_(std::move(name)), outcomes_(outcomes.begin(), outcomes.end()) {}

    static std::shared_ptr<ScriptedProvider> replying(std::string name, std::string text,
                                                      int tokens = 10) {
        return std::make_shared<ScriptedProvider>(
            std::move(name),
            std::vector<Result<providers::ModelReply>>{providers::ModelReply{std::move(text), tokens}});
    }

    static std::shared_ptr<ScriptedProvider> failing(std::string name, ErrorCode code,
                                                     std::string message = "scripted failure") {
        return std::make_shared<ScriptedProvider>(
            std::move(name),
            std::vector<Result<providers::ModelReply>>{Error{code, std::move(message)}});
    }

    const std::string& name() const override { return name_; }
    providers::ProviderKind kind() const override { return providers::ProviderKind::Replay; }

    Result<providers::ModelReply> call(const ExecutionContext& ctx, const std::string& prompt,
                                       const providers::ModelConfig&) override {
        calls_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prompts_.push_back(prompt);
        }
        if (auto live = ctx.check(); !live) {
            return live.error();
        }
        if (handler_) {
            return handler_(ctx, prompt);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (outcomes_.empty()) {
            return Error{ErrorCode::InternalError, "no scripted outcome"};
        }
        auto outcome = outcomes_.front();
        if (outcomes_.size() > 1) {
            outcomes_.pop_front();
        }
        return outcome;
    }

    int calls() const { return calls_.load(); }

    std::vector<std::string> prompts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return prompts_;
    }

private:
    std::string name_;
    Handler handler_;
    mutable std::mutex mutex_;
    std::deque<Result<providers::ModelReply>> outcomes_;
    std::vector<std::string> prompts_;
    std::atomic<int> calls_{0};
};

/// Model output listing (class, text, confidence) triples in the expected JSON contract
inline std::string extractionsJson(
    const std::vector<std::tuple<std::string, std::string, double>>& items) {
    std::string body = "{\"extractions\": [";
    for (std::size_t i = 0; i < items.size(); ++i) {
        const auto& [cls, text, conf] = items[i];
        if (i > 0) {
            body += ", ";
        }
        body += "{\"extraction_class\": \"" + cls + "\", \"extraction_text\": \"" + text +
                "\", \"confidence\": " + std::to_string(conf) + "}";
    }
    body += "]}";
    return body;
}

} // namespace langextract::test
