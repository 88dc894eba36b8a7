#include <atomic>
#include <thread>
#include <gtest/gtest.h>
#include <langextract/engine/progress_tracker.h>

using namespace langextract;
using namespace langextract::engine;
using namespace std::chrono_literals;

namespace {

template <typename Pred> bool waitUntil(Pred pred, std::chrono::milliseconds limit = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

} // namespace

class ProgressTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ActiveRequestInfo info;
        info.requestId = "req-1";
        info.startedAt = std::chrono::steady_clock::now();
        info.stage = "extraction";
        info.progress = 0.5;
        info.currentPass = 1;
        info.totalPasses = 2;
        info.currentChunk = 3;
        info.chunksProcessed = 2;
        info.totalChunks = 4;
        ASSERT_TRUE(registry_.add(info));
    }

    RequestRegistry registry_;
};

TEST_F(ProgressTrackerTest, MakeProgressCopiesEntry) {
    auto info = registry_.get("req-1");
    ASSERT_TRUE(info.has_value());
    auto p = makeProgress(*info, "working");
    EXPECT_EQ(p.requestId, "req-1");
    EXPECT_EQ(p.stage, "extraction");
    EXPECT_DOUBLE_EQ(p.progress, 0.5);
    EXPECT_EQ(p.message, "working");
    EXPECT_EQ(p.currentPass, 1);
    EXPECT_EQ(p.totalPasses, 2);
    EXPECT_EQ(p.currentChunk, 3);
    EXPECT_EQ(p.chunksProcessed, 2);
    EXPECT_EQ(p.totalChunks, 4);
    EXPECT_GE(p.elapsed.count(), 0);
}

TEST_F(ProgressTrackerTest, ReportsPeriodically) {
    std::atomic<int> seen{0};
    std::stop_source parent;
    ProgressTracker tracker(
        "req-1", registry_,
        [&](const ExtractionProgress& p) {
            EXPECT_EQ(p.requestId, "req-1");
            seen.fetch_add(1);
        },
        5ms, parent.get_token());

    ASSERT_TRUE(waitUntil([&] { return seen.load() >= 3; }));
    tracker.stop();
    const auto sent = tracker.reportsSent();
    EXPECT_GE(sent, 3u);
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(tracker.reportsSent(), sent);
}

TEST_F(ProgressTrackerTest, ParentStopEndsReporting) {
    std::atomic<int> seen{0};
    std::stop_source parent;
    ProgressTracker tracker(
        "req-1", registry_, [&](const ExtractionProgress&) { seen.fetch_add(1); }, 5ms,
        parent.get_token());
    ASSERT_TRUE(waitUntil([&] { return seen.load() >= 1; }));
    parent.request_stop();
    std::this_thread::sleep_for(20ms);
    const auto after = seen.load();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(seen.load(), after);
}

TEST_F(ProgressTrackerTest, StopsWhenRequestLeavesRegistry) {
    std::atomic<int> seen{0};
    ProgressTracker tracker(
        "req-1", registry_, [&](const ExtractionProgress&) { seen.fetch_add(1); }, 5ms,
        std::stop_token{});
    ASSERT_TRUE(waitUntil([&] { return seen.load() >= 1; }));
    registry_.remove("req-1");
    std::this_thread::sleep_for(20ms);
    const auto after = seen.load();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(seen.load(), after);
}

TEST_F(ProgressTrackerTest, ThrowingCallbackDoesNotKillReporter) {
    std::atomic<int> invoked{0};
    ProgressTracker tracker(
        "req-1", registry_,
        [&](const ExtractionProgress&) {
            invoked.fetch_add(1);
            throw std::runtime_error("callback failure");
        },
        5ms, std::stop_token{});
    ASSERT_TRUE(waitUntil([&] { return invoked.load() >= 3; }));
    tracker.stop();
    EXPECT_EQ(tracker.reportsSent(), 0u);
}
