/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> error type.
 * @author Dimitris Kafetzis
 */

#include "core/result.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace node_order;

TEST(ResultTest, SuccessValue) {
    Result<int64_t> r = int64_t{7};
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 7);
}

TEST(ResultTest, ErrorValue) {
    Result<int64_t> r = Error{"node not found"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "node not found");
}

TEST(ResultTest, ValueOnErrorThrowsWithMessage) {
    Result<double> r = Error{"scoring pass aborted"};
    try {
        (void)r.value();
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("scoring pass aborted"), std::string::npos);
    }
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapAndThen) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);

    auto chained = r.and_then([](int v) -> Result<int> {
        if (v > 10) return Error{"too large"};
        return v;
    });
    ASSERT_FALSE(chained.has_value());
    EXPECT_EQ(chained.error().message, "too large");
}

TEST(ResultTest, MapOnErrorPropagates) {
    Result<int> r = Error{"fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> failed = Error{"duplicate node <n1>"};
    EXPECT_TRUE(ok.has_value());
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "duplicate node <n1>");
    EXPECT_THROW((void)ok.error(), std::runtime_error);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>("bad weight");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().what(), "bad weight");
}

TEST(ResultTest, ErrorWithContext) {
    Error inner{"values set can't be empty"};
    auto outer = inner.with_context("nodeorder");
    EXPECT_EQ(outer.message, "nodeorder: values set can't be empty");
    EXPECT_EQ(inner.message, "values set can't be empty");
}
