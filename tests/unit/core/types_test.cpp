#include <set>
#include <string>
#include <gtest/gtest.h>
#include <langextract/core/format.h>
#include <langextract/core/types.h>
#include <langextract/core/uuid.h>

using namespace langextract;

TEST(ResultTest, HoldsValueOrError) {
    Result<int> ok = 42;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);
    EXPECT_THROW(ok.error(), std::runtime_error);

    Result<int> failed = Error{ErrorCode::NotFound, "missing"};
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::NotFound);
    EXPECT_EQ(failed.error().message, "missing");
    EXPECT_THROW(failed.value(), std::runtime_error);
}

TEST(ResultTest, VoidResultDefaultsToSuccess) {
    Result<void> ok;
    EXPECT_TRUE(ok);

    Result<void> failed = ErrorCode::Timeout;
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().message, "Operation timed out");
}

TEST(ResultTest, MoveValueOut) {
    Result<std::string> r = std::string("payload");
    std::string moved = std::move(r).value();
    EXPECT_EQ(moved, "payload");
}

TEST(ErrorCodeTest, RecoverableCodes) {
    EXPECT_TRUE(isRecoverable(ErrorCode::Timeout));
    EXPECT_TRUE(isRecoverable(ErrorCode::RateLimited));
    EXPECT_TRUE(isRecoverable(ErrorCode::ProviderUnavailable));

    EXPECT_FALSE(isRecoverable(ErrorCode::AuthenticationFailed));
    EXPECT_FALSE(isRecoverable(ErrorCode::InvalidArgument));
    EXPECT_FALSE(isRecoverable(ErrorCode::OperationCancelled));
    EXPECT_FALSE(isRecoverable(ErrorCode::ResourceExhausted));
}

TEST(ErrorCodeTest, FormatsThroughFmt) {
    EXPECT_EQ(format("{}", ErrorCode::RateLimited), "Rate limited");
}

TEST(GenerateIdTest, PrefixedAndUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = core::generateId("req");
        EXPECT_EQ(id.rfind("req-", 0), 0u);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}
