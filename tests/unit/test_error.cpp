/**
 * @file test_error.cpp
 * @brief Unit tests for linepipe error handling
 *
 * Tests coverage for:
 * - ErrorCode: categories, names
 * - Error: context entries, cause chains, formatting
 * - Result<T>: void and value forms
 * - LINEPIPE_TRY / LINEPIPE_TRY_ASSIGN propagation
 */

#include <gtest/gtest.h>
#include <linepipe/common/error.hpp>
#include <memory>
#include <string>

using namespace linepipe::common;

// ============================================================================
// ErrorCode Tests
// ============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, SuccessCode) {
    EXPECT_TRUE(is_success(ErrorCode::SUCCESS));
    EXPECT_FALSE(is_success(ErrorCode::UNKNOWN_ERROR));
}

TEST_F(ErrorCodeTest, CategoryExtraction) {
    EXPECT_EQ(get_category(ErrorCode::INVALID_ARGUMENT), ErrorCategory::GENERAL);
    EXPECT_EQ(get_category(ErrorCode::READ_ERROR), ErrorCategory::IO);
    EXPECT_EQ(get_category(ErrorCode::WRITE_ERROR), ErrorCategory::IO);
    EXPECT_EQ(get_category(ErrorCode::UNKNOWN_SELECTOR), ErrorCategory::CONFIG);
    EXPECT_EQ(get_category(ErrorCode::TRANSFORM_NOT_INVOCABLE), ErrorCategory::CONFIG);
    EXPECT_EQ(get_category(ErrorCode::STAGE_FAILED), ErrorCategory::TRANSFORM);
    EXPECT_EQ(get_category(ErrorCode::LINE_FAILED), ErrorCategory::PROCESSING);
    EXPECT_EQ(get_category(ErrorCode::SERIALIZE_FAILED), ErrorCategory::SERIALIZATION);
    EXPECT_EQ(get_category(ErrorCode::EMPTY_VALUE), ErrorCategory::VALIDATION);
    EXPECT_EQ(get_category(ErrorCode::SYSCALL_FAILED), ErrorCategory::PLATFORM);
}

TEST_F(ErrorCodeTest, Names) {
    EXPECT_EQ(error_name(ErrorCode::LINE_FAILED), "LINE_FAILED");
    EXPECT_EQ(error_name(ErrorCode::UNKNOWN_SELECTOR), "UNKNOWN_SELECTOR");
    EXPECT_EQ(category_name(ErrorCategory::IO), "I/O");
    EXPECT_EQ(category_name(ErrorCategory::PROCESSING), "Processing");
}

// ============================================================================
// Error Tests
// ============================================================================

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, DefaultIsSuccess) {
    Error error;
    EXPECT_TRUE(error.is_success());
    EXPECT_FALSE(error.is_error());
    EXPECT_EQ(error.cause(), nullptr);
}

TEST_F(ErrorTest, CodeAndMessage) {
    Error error(ErrorCode::READ_ERROR, "disk gone");
    EXPECT_TRUE(error.is_error());
    EXPECT_EQ(error.code(), ErrorCode::READ_ERROR);
    EXPECT_EQ(error.category(), ErrorCategory::IO);
    EXPECT_EQ(error.message(), "disk gone");
}

TEST_F(ErrorTest, LocationCaptured) {
    Error error(ErrorCode::INVALID_ARGUMENT, "bad", LINEPIPE_CURRENT_LOCATION);
#if defined(LINEPIPE_HAS_SOURCE_LOCATION)
    EXPECT_TRUE(error.location().is_valid());
    EXPECT_NE(std::string(error.location().file).find("test_error"), std::string::npos);
#endif
}

TEST_F(ErrorTest, ContextLookup) {
    Error error(ErrorCode::LINE_FAILED, "failed");
    error.with_context("line", "7").with_context("path", "/tmp/x");

    ASSERT_TRUE(error.context("line").has_value());
    EXPECT_EQ(*error.context("line"), "7");
    EXPECT_EQ(*error.context("path"), "/tmp/x");
    EXPECT_FALSE(error.context("missing").has_value());
}

TEST_F(ErrorTest, ContextFirstMatchWins) {
    Error error(ErrorCode::LINE_FAILED);
    error.with_context("line", "1").with_context("line", "2");
    EXPECT_EQ(*error.context("line"), "1");
}

TEST_F(ErrorTest, CauseChain) {
    Error root(ErrorCode::BROKEN_PIPE, "pipe closed");
    Error middle(ErrorCode::WRITE_ERROR, "write failed");
    middle.with_cause(root);
    Error top(ErrorCode::LINE_FAILED, "line 3");
    top.with_cause(middle);

    ASSERT_NE(top.cause(), nullptr);
    EXPECT_EQ(top.cause()->code(), ErrorCode::WRITE_ERROR);
    EXPECT_EQ(top.root_cause().code(), ErrorCode::BROKEN_PIPE);
    EXPECT_EQ(root.root_cause().code(), ErrorCode::BROKEN_PIPE);
}

TEST_F(ErrorTest, CopySurvivesRewrapOfOriginal) {
    Error original(ErrorCode::LINE_FAILED, "outer");
    original.with_cause(Error(ErrorCode::TRANSFORM_FAILED, "inner"));

    Error copy = original;
    original.with_cause(Error(ErrorCode::READ_ERROR, "replaced"));

    ASSERT_NE(copy.cause(), nullptr);
    EXPECT_EQ(copy.cause()->code(), ErrorCode::TRANSFORM_FAILED);
    EXPECT_EQ(copy.cause()->message(), "inner");
}

TEST_F(ErrorTest, ToStringIncludesEverything) {
    Error error(ErrorCode::LINE_FAILED, "processing failed on line 2");
    error.with_context("line", "2");
    error.with_cause(Error(ErrorCode::TRANSFORM_FAILED, "bad input"));

    std::string text = error.to_string();
    EXPECT_NE(text.find("[Processing] LINE_FAILED (0x0400)"), std::string::npos);
    EXPECT_NE(text.find("processing failed on line 2"), std::string::npos);
    EXPECT_NE(text.find("line: 2"), std::string::npos);
    EXPECT_NE(text.find("Caused by: [Transform] TRANSFORM_FAILED"), std::string::npos);
    EXPECT_NE(text.find("bad input"), std::string::npos);
}

TEST_F(ErrorTest, FullMessageJoinsChain) {
    Error error(ErrorCode::LINE_FAILED, "processing failed on line 2");
    error.with_cause(Error(ErrorCode::TRANSFORM_FAILED, "bad input"));
    EXPECT_EQ(error.full_message(), "processing failed on line 2: bad input");
}

TEST_F(ErrorTest, FullMessageFallsBackToName) {
    Error error(ErrorCode::WRITE_ERROR);
    EXPECT_EQ(error.full_message(), "WRITE_ERROR");
}

// ============================================================================
// Result Tests
// ============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, VoidSuccess) {
    Result<void> result = ok();
    EXPECT_TRUE(result.is_success());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.code(), ErrorCode::SUCCESS);
}

TEST_F(ResultTest, VoidError) {
    Result<void> result(ErrorCode::WRITE_ERROR, "nope");
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::WRITE_ERROR);
    EXPECT_EQ(result.message(), "nope");
}

TEST_F(ResultTest, ValueSuccess) {
    Result<std::string> result(std::string("hello"));
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.value(), "hello");
    EXPECT_EQ(result.code(), ErrorCode::SUCCESS);
}

TEST_F(ResultTest, ValueError) {
    Result<int> result(ErrorCode::INVALID_ARGUMENT, "missing");
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.value_or(42), 42);
}

TEST_F(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(5));
    ASSERT_TRUE(result);
    auto ptr = std::move(result).value();
    EXPECT_EQ(*ptr, 5);
}

TEST_F(ResultTest, CopyAndMove) {
    Result<std::string> a(std::string("text"));
    Result<std::string> b = a;
    Result<std::string> c = std::move(a);
    EXPECT_EQ(b.value(), "text");
    EXPECT_EQ(c.value(), "text");
}

// ============================================================================
// Propagation Macro Tests
// ============================================================================

namespace {

Result<int> parse_positive(int v) {
    if (v <= 0) {
        return Result<int>(ErrorCode::VALUE_OUT_OF_RANGE, "not positive");
    }
    return v;
}

Result<void> check(int v) {
    LINEPIPE_TRY(parse_positive(v));
    return ok();
}

Result<std::string> describe(int v) {
    int parsed = 0;
    LINEPIPE_TRY_ASSIGN(parsed, parse_positive(v));
    return std::to_string(parsed);
}

}  // namespace

TEST(PropagationTest, TryPassesSuccess) {
    EXPECT_TRUE(check(1));
}

TEST(PropagationTest, TryReturnsError) {
    auto result = check(-1);
    EXPECT_EQ(result.code(), ErrorCode::VALUE_OUT_OF_RANGE);
    EXPECT_EQ(result.message(), "not positive");
}

TEST(PropagationTest, TryAssignAcrossTypes) {
    EXPECT_EQ(describe(3).value(), "3");
    EXPECT_EQ(describe(0).code(), ErrorCode::VALUE_OUT_OF_RANGE);
}
