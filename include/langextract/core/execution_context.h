#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <langextract/core/types.h>

namespace langextract {

/**
 * @brief Cancellation and deadline scope carried by one extraction request.
 *
 * Copies share the same underlying state, so cancelling any copy cancels all of them.
 * A child context observes its parent's cancellation and may tighten the deadline, but
 * cancelling the child never reaches the parent.
 */
class ExecutionContext {
public:
    using Clock = std::chrono::steady_clock;

    ExecutionContext();

    static ExecutionContext withTimeout(std::chrono::milliseconds timeout);
    static ExecutionContext withDeadline(Clock::time_point deadline);

    /// Derive a child scope; the effective deadline is the earlier of parent and timeout
    ExecutionContext child(std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    void cancel() const;

    /// True once cancel() was called on this scope or an ancestor
    [[nodiscard]] bool isCancelled() const;
    [[nodiscard]] bool isExpired() const;

    /// Success while the scope is live, OperationCancelled or Timeout otherwise
    [[nodiscard]] Result<void> check() const;

    [[nodiscard]] std::optional<Clock::time_point> deadline() const;
    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;
    [[nodiscard]] std::stop_token stopToken() const;

    /**
     * @brief Sleep for up to @p duration.
     * @return true if the full duration elapsed, false if interrupted by cancel or deadline
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    struct State;
    explicit ExecutionContext(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

} // namespace langextract
