/**
 * @file test_error.cpp
 * @brief Unit tests for confix Error handling system
 *
 * Tests coverage for:
 * - ErrorCode: Error codes, categories, helper functions
 * - SourceLocation: Source tracking
 * - Error: Error class with context and cause chains
 * - Result<T>: Result type for void, value and custom error types
 * - CONFIX_TRY / CONFIX_TRY_ASSIGN propagation macros
 */

#include <gtest/gtest.h>
#include <confix/common/error.hpp>
#include <string>
#include <vector>

using namespace confix::common;

// ============================================================================
// ErrorCode Tests
// ============================================================================

class ErrorCodeTest : public ::testing::Test {
protected:
    void SetUp() override {}
};

TEST_F(ErrorCodeTest, SuccessCode) {
    EXPECT_TRUE(is_success(ErrorCode::SUCCESS));
    EXPECT_FALSE(is_success(ErrorCode::CONFIG_INVALID));
}

TEST_F(ErrorCodeTest, CategoryExtraction) {
    // General category (0x00xx)
    EXPECT_EQ(get_category(ErrorCode::SUCCESS), ErrorCategory::GENERAL);

    // Config category (0x04xx)
    EXPECT_EQ(get_category(ErrorCode::CONFIG_INVALID), ErrorCategory::CONFIG);
    EXPECT_EQ(get_category(ErrorCode::CONFIG_REQUIRED_MISSING), ErrorCategory::CONFIG);
    EXPECT_EQ(get_category(ErrorCode::CONFIG_KEY_CONFLICT), ErrorCategory::CONFIG);

    // Serialization category (0x08xx)
    EXPECT_EQ(get_category(ErrorCode::SERIALIZE_FAILED), ErrorCategory::SERIALIZATION);

    // Validation category (0x09xx)
    EXPECT_EQ(get_category(ErrorCode::VALUE_OUT_OF_RANGE), ErrorCategory::VALIDATION);

    // Platform category (0x0Axx)
    EXPECT_EQ(get_category(ErrorCode::OS_ERROR), ErrorCategory::PLATFORM);
}

TEST_F(ErrorCodeTest, CategoryNames) {
    EXPECT_EQ(category_name(ErrorCategory::GENERAL), "General");
    EXPECT_EQ(category_name(ErrorCategory::CONFIG), "Configuration");
    EXPECT_EQ(category_name(ErrorCategory::SERIALIZATION), "Serialization");
    EXPECT_EQ(category_name(ErrorCategory::VALIDATION), "Validation");
    EXPECT_EQ(category_name(ErrorCategory::PLATFORM), "Platform");
}

TEST_F(ErrorCodeTest, ErrorNames) {
    EXPECT_EQ(error_name(ErrorCode::SUCCESS), "SUCCESS");
    EXPECT_EQ(error_name(ErrorCode::CONFIG_TYPE_MISMATCH), "CONFIG_TYPE_MISMATCH");
    EXPECT_EQ(error_name(ErrorCode::CONFIG_KEY_CONFLICT), "CONFIG_KEY_CONFLICT");
    EXPECT_EQ(error_name(ErrorCode::CONFIG_PARSE_ERROR), "CONFIG_PARSE_ERROR");
    EXPECT_EQ(error_name(ErrorCode::OS_ERROR), "OS_ERROR");
    EXPECT_EQ(error_name(static_cast<ErrorCode>(0x0001)), "UNKNOWN");
}

// ============================================================================
// SourceLocation Tests
// ============================================================================

class SourceLocationTest : public ::testing::Test {};

TEST_F(SourceLocationTest, DefaultConstruction) {
    SourceLocation loc;
    EXPECT_FALSE(loc.is_valid());
    EXPECT_EQ(loc.line, 0u);
}

TEST_F(SourceLocationTest, ManualConstruction) {
    SourceLocation loc("reader.cpp", "read_op", 42, 10);
    EXPECT_TRUE(loc.is_valid());
    EXPECT_STREQ(loc.file, "reader.cpp");
    EXPECT_STREQ(loc.function, "read_op");
    EXPECT_EQ(loc.line, 42u);
    EXPECT_EQ(loc.column, 10u);
}

// ============================================================================
// Error Tests
// ============================================================================

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, DefaultConstruction) {
    Error err;
    EXPECT_TRUE(err.is_success());
    EXPECT_FALSE(err.is_error());
    EXPECT_EQ(err.code(), ErrorCode::SUCCESS);
    EXPECT_TRUE(err.message().empty());
}

TEST_F(ErrorTest, ConstructWithMessage) {
    Error err(ErrorCode::CONFIG_REQUIRED_MISSING, "missing value");
    EXPECT_TRUE(err.is_error());
    EXPECT_EQ(err.code(), ErrorCode::CONFIG_REQUIRED_MISSING);
    EXPECT_EQ(err.category(), ErrorCategory::CONFIG);
    EXPECT_EQ(err.message(), "missing value");
}

TEST_F(ErrorTest, ConstructWithLocation) {
    SourceLocation loc("loader.cpp", "load_file", 100);
    Error err(ErrorCode::CONFIG_FILE_NOT_FOUND, std::string("no such file"), loc);

    EXPECT_TRUE(err.location().is_valid());
    EXPECT_STREQ(err.location().file, "loader.cpp");

    std::string str = err.to_string();
    EXPECT_NE(str.find("at loader.cpp:100"), std::string::npos);
}

TEST_F(ErrorTest, WithContext) {
    Error err(ErrorCode::CONFIG_TYPE_MISMATCH, "expected int32");
    err.with_context("path", "server.port").with_context("value", "abc");

    std::string str = err.to_string();
    EXPECT_NE(str.find("path: server.port"), std::string::npos);
    EXPECT_NE(str.find("value: abc"), std::string::npos);

    ASSERT_TRUE(err.context_value("path").has_value());
    EXPECT_EQ(*err.context_value("path"), "server.port");
    EXPECT_FALSE(err.context_value("missing").has_value());
}

TEST_F(ErrorTest, WithCause) {
    Error root_cause(ErrorCode::OS_ERROR, "permission denied");
    Error err(ErrorCode::CONFIG_INVALID, "cannot load configuration");
    err.with_cause(root_cause);

    ASSERT_NE(err.cause(), nullptr);
    EXPECT_EQ(err.cause()->code(), ErrorCode::OS_ERROR);
    EXPECT_NE(err.to_string().find("Caused by"), std::string::npos);
}

TEST_F(ErrorTest, ToString) {
    Error err(ErrorCode::CONFIG_PARSE_ERROR, "unexpected token");
    std::string str = err.to_string();

    EXPECT_NE(str.find("[Configuration]"), std::string::npos);
    EXPECT_NE(str.find("CONFIG_PARSE_ERROR"), std::string::npos);
    EXPECT_NE(str.find("0x0402"), std::string::npos);
    EXPECT_NE(str.find("unexpected token"), std::string::npos);
}

TEST_F(ErrorTest, CopyKeepsCauseChain) {
    Error original(ErrorCode::CONFIG_INVALID, "bad source");
    original.with_context("source", "environment");
    original.with_cause(Error(ErrorCode::CONFIG_INVALID_VALUE));

    Error copy(original);
    EXPECT_EQ(copy.message(), "bad source");
    ASSERT_NE(copy.cause(), nullptr);
    EXPECT_EQ(copy.cause()->code(), ErrorCode::CONFIG_INVALID_VALUE);

    Error assigned;
    assigned = original;
    EXPECT_EQ(assigned.context().size(), 1u);
}

TEST_F(ErrorTest, MoveConstruction) {
    Error original(ErrorCode::OS_ERROR, "disk full");
    Error moved(std::move(original));

    EXPECT_EQ(moved.code(), ErrorCode::OS_ERROR);
    EXPECT_EQ(moved.message(), "disk full");
}

// ============================================================================
// Result<void> Tests
// ============================================================================

class ResultVoidTest : public ::testing::Test {};

TEST_F(ResultVoidTest, DefaultConstruction) {
    Result<void> result;
    EXPECT_TRUE(result.is_success());
    EXPECT_FALSE(result.is_error());
    EXPECT_TRUE(static_cast<bool>(result));
}

TEST_F(ResultVoidTest, ConstructWithErrorCode) {
    Result<void> result(ErrorCode::CONFIG_INVALID);
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_INVALID);
}

TEST_F(ResultVoidTest, ConstructWithMessage) {
    Result<void> result(ErrorCode::OS_ERROR, "cannot write");
    EXPECT_EQ(result.message(), "cannot write");
}

// ============================================================================
// Result<T> Tests
// ============================================================================

class ResultValueTest : public ::testing::Test {};

TEST_F(ResultValueTest, ConstructWithValue) {
    Result<int> result(42);
    EXPECT_TRUE(result.is_success());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(result.code(), ErrorCode::SUCCESS);
}

TEST_F(ResultValueTest, ConstructWithError) {
    Result<int> result(ErrorCode::CONFIG_TYPE_MISMATCH, "expected int32");
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_TYPE_MISMATCH);
    EXPECT_EQ(result.message(), "expected int32");
}

TEST_F(ResultValueTest, ValueOr) {
    Result<int> success(7);
    Result<int> failure(ErrorCode::CONFIG_FILE_NOT_FOUND);

    EXPECT_EQ(success.value_or(0), 7);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST_F(ResultValueTest, MoveOutValue) {
    Result<std::vector<std::string>> result(std::vector<std::string>{"a", "b"});
    auto values = std::move(result).value();
    EXPECT_EQ(values.size(), 2u);
}

TEST_F(ResultValueTest, Map) {
    Result<int> success(20);
    auto doubled = success.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.is_success());
    EXPECT_EQ(doubled.value(), 40);

    Result<int> failure(ErrorCode::CONFIG_INVALID_VALUE);
    auto mapped = failure.map([](int v) { return std::to_string(v); });
    EXPECT_TRUE(mapped.is_error());
    EXPECT_EQ(mapped.code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(ResultValueTest, CopyAndAssign) {
    Result<std::string> original(std::string("value"));
    Result<std::string> copy(original);
    EXPECT_EQ(copy.value(), "value");

    Result<std::string> failure(ErrorCode::CONFIG_FILE_NOT_FOUND);
    copy = failure;
    EXPECT_TRUE(copy.is_error());
    EXPECT_EQ(copy.code(), ErrorCode::CONFIG_FILE_NOT_FOUND);
}

// ============================================================================
// Custom Error Type Tests
// ============================================================================

namespace {

struct TaggedError {
    ErrorCode code_ = ErrorCode::SUCCESS;
    std::string message_;
    std::string tag;

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
};

}  // namespace

class ResultCustomErrorTest : public ::testing::Test {};

TEST_F(ResultCustomErrorTest, CarriesErrorObject) {
    Result<int, TaggedError> result(TaggedError{ErrorCode::CONFIG_INVALID, "bad", "left"});
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_INVALID);
    EXPECT_EQ(result.message(), "bad");
    EXPECT_EQ(result.error().tag, "left");
}

TEST_F(ResultCustomErrorTest, MapKeepsErrorType) {
    Result<int, TaggedError> result(TaggedError{ErrorCode::CONFIG_INVALID, "bad", "right"});
    auto mapped = result.map([](int v) { return v + 1; });
    static_assert(std::is_same_v<decltype(mapped)::error_type, TaggedError>);
    EXPECT_EQ(mapped.error().tag, "right");
}

// ============================================================================
// Helper and Macro Tests
// ============================================================================

namespace {

Result<int> parse_positive(int v) {
    if (v <= 0) {
        return err<int>(ErrorCode::VALUE_OUT_OF_RANGE, "not positive");
    }
    return ok(v);
}

Result<int> add_positive(int a, int b) {
    CONFIX_TRY_ASSIGN(int first, parse_positive(a));
    CONFIX_TRY_ASSIGN(int second, parse_positive(b));
    return ok(first + second);
}

Result<void> check_positive(int v) {
    CONFIX_TRY(parse_positive(v));
    return ok();
}

}  // namespace

class ResultHelpersTest : public ::testing::Test {};

TEST_F(ResultHelpersTest, OkAndErr) {
    EXPECT_TRUE(ok(1).is_success());
    EXPECT_TRUE(ok().is_success());
    EXPECT_EQ(err(ErrorCode::CONFIG_INVALID_VALUE).code(), ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_EQ(err<int>(Error(ErrorCode::CONFIG_FILE_NOT_FOUND, "gone")).message(), "gone");
}

TEST_F(ResultHelpersTest, TryAssignPropagates) {
    auto sum = add_positive(2, 3);
    ASSERT_TRUE(sum.is_success());
    EXPECT_EQ(sum.value(), 5);

    auto failed = add_positive(2, -1);
    EXPECT_TRUE(failed.is_error());
    EXPECT_EQ(failed.code(), ErrorCode::VALUE_OUT_OF_RANGE);
}

TEST_F(ResultHelpersTest, TryPropagates) {
    EXPECT_TRUE(check_positive(1).is_success());
    EXPECT_EQ(check_positive(0).code(), ErrorCode::VALUE_OUT_OF_RANGE);
}
