/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E>.
 */

#include "core/result.hpp"
#include "parser/line_parser.hpp"

#include <gtest/gtest.h>

using namespace lineproto_csv;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
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

TEST(ResultTest, AccessingWrongAlternativeThrows) {
    Result<int> success = 1;
    Result<int> failure = Error{"fail"};
    EXPECT_THROW((void)failure.value(), std::logic_error);
    EXPECT_THROW((void)success.error(), std::logic_error);
}

TEST(ResultTest, MoveOutValue) {
    Result<std::string> r = std::string{"payload"};
    std::string taken = std::move(r).value();
    EXPECT_EQ(taken, "payload");
}

TEST(ResultTest, MakeError) {
    auto r = make_error<std::string>("nope");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().what(), "nope");
}

TEST(ResultTest, VoidSpecialization) {
    Result<void> ok;
    Result<void> failed = make_error<void>("disk full");
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "disk full");
}

TEST(ResultTest, CustomErrorType) {
    Result<Record, ParseError> r = ParseError{ParseErrorKind::MalformedLine, "why", "text"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ParseErrorKind::MalformedLine);
    EXPECT_FALSE(r.error().is_skip());
}
