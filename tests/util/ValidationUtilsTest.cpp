#include <gtest/gtest.h>
#include <sankeyedit/util/ValidationUtils.h>

#include <string>

using namespace sankeyedit;

// ============== Hex Colors ==============

TEST(ValidationUtilsTest, HexColorNormalized) {
    auto full = ValidationUtils::validateHexColor("#AABBCC");
    EXPECT_TRUE(full.valid);
    EXPECT_EQ(full.normalized, "#aabbcc");

    auto bare = ValidationUtils::validateHexColor("1a2B3c");
    EXPECT_TRUE(bare.valid);
    EXPECT_EQ(bare.normalized, "#1a2b3c");
}

TEST(ValidationUtilsTest, ShortHexColorExpanded) {
    auto result = ValidationUtils::validateHexColor("#F0a");

    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.normalized, "#ff00aa");
}

TEST(ValidationUtilsTest, InvalidHexColor) {
    EXPECT_FALSE(ValidationUtils::validateHexColor("").valid);
    EXPECT_FALSE(ValidationUtils::validateHexColor("#12345").valid);
    EXPECT_FALSE(ValidationUtils::validateHexColor("#ggg").valid);
    EXPECT_FALSE(ValidationUtils::validateHexColor("##abc").valid);

    auto result = ValidationUtils::validateHexColor("red");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, "Invalid hex color format");
    EXPECT_TRUE(result.normalized.empty());
}

// ============== Clamped Fields ==============

TEST(ValidationUtilsTest, OpacityInRange) {
    auto result = ValidationUtils::validateOpacity("42.5");

    EXPECT_TRUE(result.valid);
    EXPECT_DOUBLE_EQ(result.value, 42.5);
    EXPECT_FALSE(result.adjusted);
    EXPECT_TRUE(result.error.empty());
}

TEST(ValidationUtilsTest, OpacityClamped) {
    auto high = ValidationUtils::validateOpacity("150");
    EXPECT_TRUE(high.valid);
    EXPECT_TRUE(high.adjusted);
    EXPECT_DOUBLE_EQ(high.value, 100.0);

    auto low = ValidationUtils::validateOpacity("-3");
    EXPECT_DOUBLE_EQ(low.value, 0.0);
    EXPECT_TRUE(low.adjusted);
}

TEST(ValidationUtilsTest, NonNumericFallsBackToDefault) {
    auto opacity = ValidationUtils::validateOpacity("abc");
    EXPECT_FALSE(opacity.valid);
    EXPECT_DOUBLE_EQ(opacity.value, 100.0);
    EXPECT_EQ(opacity.error, "Opacity must be a number");

    EXPECT_DOUBLE_EQ(ValidationUtils::validateMargin("").value, 0.0);
    EXPECT_DOUBLE_EQ(ValidationUtils::validateFontSize("big").value, 16.0);
    EXPECT_DOUBLE_EQ(ValidationUtils::validatePositionOffset("x").value, 0.0);
}

TEST(ValidationUtilsTest, IntegralFieldsTruncate) {
    EXPECT_DOUBLE_EQ(ValidationUtils::validateMargin("12.9").value, 12.0);
    EXPECT_DOUBLE_EQ(ValidationUtils::validatePositionOffset("-3.7").value, -3.0);
    EXPECT_DOUBLE_EQ(ValidationUtils::validateFontSize(" 14px").value, 14.0);
}

TEST(ValidationUtilsTest, FontSizeRange) {
    EXPECT_DOUBLE_EQ(ValidationUtils::validateFontSize("4").value, 8.0);
    EXPECT_DOUBLE_EQ(ValidationUtils::validateFontSize("100").value, 72.0);
    EXPECT_FALSE(ValidationUtils::validateFontSize("24").adjusted);
}

TEST(ValidationUtilsTest, PositionOffsetRange) {
    auto result = ValidationUtils::validatePositionOffset("-5000");

    EXPECT_TRUE(result.adjusted);
    EXPECT_DOUBLE_EQ(result.value, -1000.0);
    EXPECT_EQ(result.error, "Position clamped to -1000 to 1000 range");
}

// ============== Flow Amounts ==============

TEST(ValidationUtilsTest, FlowAmount) {
    auto ok = ValidationUtils::validateFlowAmount("12.5");
    EXPECT_TRUE(ok.valid);
    EXPECT_DOUBLE_EQ(ok.value, 12.5);

    EXPECT_FALSE(ValidationUtils::validateFlowAmount("0").valid);
    EXPECT_FALSE(ValidationUtils::validateFlowAmount("-4").valid);
    EXPECT_FALSE(ValidationUtils::validateFlowAmount("none").valid);
    EXPECT_FALSE(ValidationUtils::validateFlowAmount("inf").valid);
}

// ============== Text ==============

TEST(ValidationUtilsTest, TextTrimmed) {
    auto result = ValidationUtils::validateText("  Budget \n");

    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.sanitized, "Budget");
    EXPECT_FALSE(result.adjusted);
}

TEST(ValidationUtilsTest, TextTruncated) {
    auto result = ValidationUtils::validateText(std::string(600, 'x'));

    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.adjusted);
    EXPECT_EQ(result.sanitized.size(), ValidationUtils::MAX_TEXT_LENGTH);
}

TEST(ValidationUtilsTest, EmptyTextRejected) {
    EXPECT_FALSE(ValidationUtils::validateText("").valid);
}
