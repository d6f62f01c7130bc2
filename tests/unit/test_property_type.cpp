/**
 * @file test_property_type.cpp
 * @brief Unit tests for scalar string conversions
 *
 * Tests coverage for:
 * - PropertyType<T>::parse for every supported scalar
 * - Range and format failures
 * - render() output parsing back to the same value
 * - PropertyTypeInfo type erasure
 */

#include <gtest/gtest.h>
#include <confix/core/config/property_type.hpp>

#include <any>
#include <chrono>
#include <limits>
#include <string>

using namespace confix::core::config;
using confix::common::ErrorCode;
using namespace std::chrono_literals;

// ============================================================================
// Text and Boolean Tests
// ============================================================================

class PropertyTypeTextTest : public ::testing::Test {};

TEST_F(PropertyTypeTextTest, StringIsIdentity) {
    EXPECT_EQ(PropertyType<std::string>::parse(" spaced ").value(), " spaced ");
    EXPECT_EQ(PropertyType<std::string>::parse("").value(), "");
    EXPECT_EQ(PropertyType<std::string>::name, "string");
}

TEST_F(PropertyTypeTextTest, BooleanIsCaseInsensitive) {
    EXPECT_TRUE(PropertyType<bool>::parse("true").value());
    EXPECT_TRUE(PropertyType<bool>::parse("TRUE").value());
    EXPECT_FALSE(PropertyType<bool>::parse("False").value());
}

TEST_F(PropertyTypeTextTest, BooleanRejectsOtherWords) {
    auto result = PropertyType<bool>::parse("yes");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_TYPE_MISMATCH);
    EXPECT_EQ(result.message(), "expected boolean");
}

TEST_F(PropertyTypeTextTest, BooleanRender) {
    EXPECT_EQ(PropertyType<bool>::render(true), "true");
    EXPECT_EQ(PropertyType<bool>::render(false), "false");
}

// ============================================================================
// Number Tests
// ============================================================================

class PropertyTypeNumberTest : public ::testing::Test {};

TEST_F(PropertyTypeNumberTest, Integers) {
    EXPECT_EQ(PropertyType<int32_t>::parse("-42").value(), -42);
    EXPECT_EQ(PropertyType<int64_t>::parse("9000000000").value(), 9000000000LL);
    EXPECT_EQ(PropertyType<uint32_t>::parse("4294967295").value(), 4294967295u);
    EXPECT_EQ(PropertyType<uint64_t>::parse("0").value(), 0u);
}

TEST_F(PropertyTypeNumberTest, RejectsPartialInput) {
    EXPECT_EQ(PropertyType<int32_t>::parse("12abc").code(), ErrorCode::CONFIG_TYPE_MISMATCH);
    EXPECT_EQ(PropertyType<int32_t>::parse("not-a-number").message(), "expected int32");
    EXPECT_EQ(PropertyType<int32_t>::parse("").code(), ErrorCode::CONFIG_TYPE_MISMATCH);
    EXPECT_EQ(PropertyType<int32_t>::parse(" 1").code(), ErrorCode::CONFIG_TYPE_MISMATCH);
}

TEST_F(PropertyTypeNumberTest, OutOfRange) {
    EXPECT_EQ(PropertyType<int32_t>::parse("2147483648").code(), ErrorCode::VALUE_OUT_OF_RANGE);
    EXPECT_EQ(PropertyType<uint32_t>::parse("-1").code(), ErrorCode::CONFIG_TYPE_MISMATCH);
}

TEST_F(PropertyTypeNumberTest, FloatingPoint) {
    EXPECT_DOUBLE_EQ(PropertyType<double>::parse("3.25").value(), 3.25);
    EXPECT_FLOAT_EQ(PropertyType<float>::parse("-0.5").value(), -0.5f);
    EXPECT_EQ(PropertyType<double>::parse("1.0x").code(), ErrorCode::CONFIG_TYPE_MISMATCH);
}

TEST_F(PropertyTypeNumberTest, RenderParsesBack) {
    const int64_t big = std::numeric_limits<int64_t>::min();
    EXPECT_EQ(PropertyType<int64_t>::parse(PropertyType<int64_t>::render(big)).value(), big);

    const double d = 0.1;
    EXPECT_EQ(PropertyType<double>::parse(PropertyType<double>::render(d)).value(), d);

    EXPECT_EQ(PropertyType<int32_t>::render(-7), "-7");
}

// ============================================================================
// Duration Tests
// ============================================================================

class PropertyTypeDurationTest : public ::testing::Test {};

TEST_F(PropertyTypeDurationTest, Units) {
    using Duration = PropertyType<std::chrono::milliseconds>;
    EXPECT_EQ(Duration::parse("250").value(), 250ms);
    EXPECT_EQ(Duration::parse("250ms").value(), 250ms);
    EXPECT_EQ(Duration::parse("30s").value(), 30s);
    EXPECT_EQ(Duration::parse("2m").value(), 2min);
    EXPECT_EQ(Duration::parse("1h").value(), 1h);
}

TEST_F(PropertyTypeDurationTest, RejectsUnknownUnit) {
    using Duration = PropertyType<std::chrono::milliseconds>;
    EXPECT_EQ(Duration::parse("5d").code(), ErrorCode::CONFIG_TYPE_MISMATCH);
    EXPECT_EQ(Duration::parse("s").code(), ErrorCode::CONFIG_TYPE_MISMATCH);
}

TEST_F(PropertyTypeDurationTest, NegativeValues) {
    using Duration = PropertyType<std::chrono::milliseconds>;
    EXPECT_EQ(Duration::parse("-5ms").value(), -5ms);
    EXPECT_EQ(Duration::parse("-2s").value(), -2s);
    EXPECT_EQ(Duration::parse(Duration::render(-5ms)).value(), -5ms);
    EXPECT_EQ(Duration::parse("-").code(), ErrorCode::CONFIG_TYPE_MISMATCH);
    EXPECT_EQ(Duration::parse("--5").code(), ErrorCode::CONFIG_TYPE_MISMATCH);
}

TEST_F(PropertyTypeDurationTest, UnitScalingOutOfRange) {
    using Duration = PropertyType<std::chrono::milliseconds>;
    EXPECT_EQ(Duration::parse("9223372036854775807h").code(), ErrorCode::VALUE_OUT_OF_RANGE);
    EXPECT_EQ(Duration::parse("-9223372036854775807s").code(), ErrorCode::VALUE_OUT_OF_RANGE);
    EXPECT_EQ(Duration::parse("99999999999999999999").code(), ErrorCode::VALUE_OUT_OF_RANGE);

    const auto max = std::numeric_limits<int64_t>::max();
    EXPECT_EQ(Duration::parse(std::to_string(max) + "ms").value().count(), max);
}

TEST_F(PropertyTypeDurationTest, RendersMilliseconds) {
    using Duration = PropertyType<std::chrono::milliseconds>;
    EXPECT_EQ(Duration::render(30s), "30000ms");
    EXPECT_EQ(Duration::parse(Duration::render(90s)).value(), 90s);
}

// ============================================================================
// Type Info Tests
// ============================================================================

class PropertyTypeInfoTest : public ::testing::Test {};

TEST_F(PropertyTypeInfoTest, ErasedParseAndRender) {
    auto info = make_type_info<int32_t>();
    EXPECT_EQ(info.name, "int32");

    auto parsed = info.parse("17");
    ASSERT_TRUE(parsed.is_success());
    EXPECT_EQ(std::any_cast<int32_t>(parsed.value()), 17);
    EXPECT_EQ(info.render(std::any(int32_t{17})), "17");
}

TEST_F(PropertyTypeInfoTest, ErasedParseFailureKeepsError) {
    auto parsed = make_type_info<bool>().parse("maybe");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.code(), ErrorCode::CONFIG_TYPE_MISMATCH);
    EXPECT_EQ(parsed.message(), "expected boolean");
}
