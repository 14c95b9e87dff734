/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace pipeseg;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorCode::InvalidConfig, "something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(r.error().message, "something went wrong");
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{ErrorCode::ParseError, "fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{ErrorCode::ParseError, "fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> failure = Error{ErrorCode::NotFound, "missing"};
    EXPECT_THROW((void)failure.value(), std::runtime_error);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{ErrorCode::InvalidGraph, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().code, ErrorCode::InvalidGraph);
    EXPECT_EQ(doubled.error().message, "fail");
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 4;
    auto halved = r.and_then([](int v) -> Result<std::string> {
        if (v % 2 != 0) return Error{ErrorCode::InvalidConfig, "odd"};
        return std::to_string(v / 2);
    });
    ASSERT_TRUE(halved.has_value());
    EXPECT_EQ(*halved, "2");
}

TEST(ResultTest, MakeError) {
    auto r = make_error<std::string>(ErrorCode::InvalidNetwork, "bad layer");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidNetwork);
    EXPECT_EQ(r.error().what(), "bad layer");
}

TEST(ResultTest, VoidSuccessByDefault) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());
    EXPECT_THROW((void)ok.error(), std::runtime_error);

    Result<void> failed = Error{ErrorCode::InvalidNetwork, "dup"};
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().message, "dup");
}

TEST(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(to_string(ErrorCode::NotFound), "not_found");
    EXPECT_EQ(to_string(ErrorCode::InvalidGraph), "invalid_graph");
}

TEST(ResultTest, InvariantViolationIsLogicError) {
    try {
        throw InvariantViolation("broken");
    } catch (const std::logic_error& e) {
        EXPECT_STREQ(e.what(), "broken");
    }
}
