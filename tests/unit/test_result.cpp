/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using namespace code_sandbox;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().code, ErrorCode::Internal);
}

TEST(ResultTest, ErrorCodeIsCarried) {
    Result<int> r = Error{ErrorCode::QueueUnavailable, "Queue is full (capacity 1)"};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::QueueUnavailable);
    EXPECT_EQ(to_string(r.error().code), "queue_unavailable");
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{"fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{"fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
}

TEST(ResultTest, AndThenShortCircuits) {
    Result<int> r = Error{ErrorCode::Io, "disk"};
    bool called = false;
    auto next = r.and_then([&](int v) -> Result<int> {
        called = true;
        return v + 1;
    });
    EXPECT_FALSE(called);
    ASSERT_FALSE(next);
    EXPECT_EQ(next.error().code, ErrorCode::Io);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{"fail"};
    EXPECT_THROW(static_cast<void>(r.value()), std::runtime_error);
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> r = std::make_unique<int>(7);
    ASSERT_TRUE(r);
    auto owned = std::move(*r);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, CustomErrorType) {
    Result<int, std::vector<int>> r = std::vector<int>{1, 2, 3};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().size(), 3u);
}

TEST(ResultVoidTest, SuccessAndError) {
    Result<void> ok;
    Result<void> bad = Error{ErrorCode::ChannelGone, "gone"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::ChannelGone);
}

TEST(ResultVoidTest, MakeError) {
    auto r = make_error<int>(ErrorCode::CapacityExhausted, "busy");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "busy");
}
