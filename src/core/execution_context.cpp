#include <langextract/core/execution_context.h>

#include <condition_variable>
#include <functional>
#include <mutex>

namespace langextract {

struct ExecutionContext::State {
    std::stop_source source;
    std::optional<Clock::time_point> deadline;
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_ptr<std::stop_callback<std::function<void()>>> parentLink;
};

ExecutionContext::ExecutionContext() : state_(std::make_shared<State>()) {}

ExecutionContext::ExecutionContext(std::shared_ptr<State> state) : state_(std::move(state)) {}

ExecutionContext ExecutionContext::withTimeout(std::chrono::milliseconds timeout) {
    return withDeadline(Clock::now() + timeout);
}

ExecutionContext ExecutionContext::withDeadline(Clock::time_point deadline) {
    auto state = std::make_shared<State>();
    state->deadline = deadline;
    return ExecutionContext(std::move(state));
}

ExecutionContext ExecutionContext::child(std::optional<std::chrono::milliseconds> timeout) const {
    auto state = std::make_shared<State>();
    state->deadline = state_->deadline;
    if (timeout) {
        auto candidate = Clock::now() + *timeout;
        if (!state->deadline || candidate < *state->deadline) {
            state->deadline = candidate;
        }
    }
    std::stop_source childSource = state->source;
    state->parentLink = std::make_unique<std::stop_callback<std::function<void()>>>(
        state_->source.get_token(),
        std::function<void()>([childSource]() mutable { childSource.request_stop(); }));
    return ExecutionContext(std::move(state));
}

void ExecutionContext::cancel() const {
    state_->source.request_stop();
}

bool ExecutionContext::isCancelled() const {
    return state_->source.stop_requested();
}

bool ExecutionContext::isExpired() const {
    return state_->deadline && Clock::now() >= *state_->deadline;
}

Result<void> ExecutionContext::check() const {
    if (isCancelled()) {
        return Error{ErrorCode::OperationCancelled, "operation cancelled"};
    }
    if (isExpired()) {
        return Error{ErrorCode::Timeout, "deadline exceeded"};
    }
    return {};
}

std::optional<ExecutionContext::Clock::time_point> ExecutionContext::deadline() const {
    return state_->deadline;
}

std::optional<std::chrono::milliseconds> ExecutionContext::remaining() const {
    if (!state_->deadline) {
        return std::nullopt;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*state_->deadline -
                                                                      Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

std::stop_token ExecutionContext::stopToken() const {
    return state_->source.get_token();
}

bool ExecutionContext::waitFor(std::chrono::milliseconds duration) const {
    auto until = Clock::now() + duration;
    bool capped = false;
    if (state_->deadline && *state_->deadline < until) {
        until = *state_->deadline;
        capped = true;
    }

    auto token = state_->source.get_token();
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_until(lock, token, until, [] { return false; });
    if (token.stop_requested()) {
        return false;
    }
    return !capped;
}

} // namespace langextract
