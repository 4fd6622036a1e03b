/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace diagnostics_engine;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorCode::NotFound, "no such session"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_EQ(r.error().message, "no such session");
}

TEST(ResultTest, MessageOnlyErrorDefaultsToIo) {
    Result<int> r = Error{"disk full"};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Io);
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{ErrorCode::Parse, "fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapKeepsError) {
    Result<int> r = Error{ErrorCode::Rejected, "pool is shut down"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().code, ErrorCode::Rejected);
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 20;
    auto chained = r.and_then([](int v) -> Result<std::string> {
        if (v < 0) return Error{ErrorCode::InvalidArgument, "negative"};
        return std::to_string(v + 1);
    });
    ASSERT_TRUE(chained.has_value());
    EXPECT_EQ(*chained, "21");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> bad = Error{ErrorCode::IllegalState, "already running"};
    EXPECT_TRUE(ok);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::IllegalState);
    EXPECT_THROW((void)ok.error(), std::runtime_error);
}

TEST(ErrorCodeTest, ToString) {
    EXPECT_EQ(to_string(ErrorCode::IllegalState), "illegal_state");
    EXPECT_EQ(to_string(ErrorCode::Compression), "compression");
    EXPECT_EQ(to_string(ErrorCode::TaskFailed), "task_failed");
}
