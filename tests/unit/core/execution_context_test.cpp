#include <atomic>
#include <chrono>
#include <thread>
#include <gtest/gtest.h>
#include <langextract/core/execution_context.h>

using namespace langextract;
using namespace std::chrono_literals;

class ExecutionContextTest : public ::testing::Test {};

TEST_F(ExecutionContextTest, FreshContextIsLive) {
    ExecutionContext ctx;
    EXPECT_FALSE(ctx.isCancelled());
    EXPECT_FALSE(ctx.isExpired());
    EXPECT_TRUE(ctx.check().has_value());
    EXPECT_FALSE(ctx.deadline().has_value());
    EXPECT_FALSE(ctx.remaining().has_value());
}

TEST_F(ExecutionContextTest, CancelIsSharedBetweenCopies) {
    ExecutionContext ctx;
    ExecutionContext copy = ctx;
    copy.cancel();

    EXPECT_TRUE(ctx.isCancelled());
    auto check = ctx.check();
    ASSERT_FALSE(check);
    EXPECT_EQ(check.error().code, ErrorCode::OperationCancelled);
}

TEST_F(ExecutionContextTest, ExpiredDeadlineReportsTimeout) {
    auto ctx = ExecutionContext::withTimeout(0ms);
    EXPECT_TRUE(ctx.isExpired());
    auto check = ctx.check();
    ASSERT_FALSE(check);
    EXPECT_EQ(check.error().code, ErrorCode::Timeout);
    ASSERT_TRUE(ctx.remaining().has_value());
    EXPECT_EQ(ctx.remaining()->count(), 0);
}

TEST_F(ExecutionContextTest, ChildObservesParentCancellation) {
    ExecutionContext parent;
    auto child = parent.child();
    EXPECT_FALSE(child.isCancelled());

    parent.cancel();
    EXPECT_TRUE(child.isCancelled());
}

TEST_F(ExecutionContextTest, ChildCancellationDoesNotReachParent) {
    ExecutionContext parent;
    auto child = parent.child();
    child.cancel();

    EXPECT_TRUE(child.isCancelled());
    EXPECT_FALSE(parent.isCancelled());
}

TEST_F(ExecutionContextTest, ChildKeepsTighterDeadline) {
    auto parent = ExecutionContext::withTimeout(50ms);
    auto looser = parent.child(10s);
    auto tighter = parent.child(1ms);

    ASSERT_TRUE(looser.deadline().has_value());
    EXPECT_EQ(*looser.deadline(), *parent.deadline());
    ASSERT_TRUE(tighter.deadline().has_value());
    EXPECT_LT(*tighter.deadline(), *parent.deadline());
}

TEST_F(ExecutionContextTest, WaitForCompletesWithoutInterruption) {
    ExecutionContext ctx;
    EXPECT_TRUE(ctx.waitFor(5ms));
}

TEST_F(ExecutionContextTest, WaitForIsInterruptedByCancel) {
    ExecutionContext ctx;
    std::thread canceller([ctx] {
        std::this_thread::sleep_for(20ms);
        ctx.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ctx.waitFor(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    canceller.join();
}

TEST_F(ExecutionContextTest, WaitForIsCappedByDeadline) {
    auto ctx = ExecutionContext::withTimeout(20ms);
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ctx.waitFor(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_TRUE(ctx.isExpired());
}

TEST_F(ExecutionContextTest, StopTokenFollowsCancellation) {
    ExecutionContext ctx;
    auto token = ctx.stopToken();
    std::atomic<bool> fired{false};
    std::stop_callback cb(token, [&] { fired = true; });

    ctx.cancel();
    EXPECT_TRUE(token.stop_requested());
    EXPECT_TRUE(fired.load());
}
