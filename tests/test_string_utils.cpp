// Hydromat - String Utils Tests

#include <gtest/gtest.h>

#include "core/utils/string_utils.h"

// --- trim ---

TEST(StringUtils, Trim_RemovesBothSides) {
    EXPECT_EQ(hm::str::trim("  hello  "), "hello");
}

TEST(StringUtils, Trim_TabsAndNewlines) {
    EXPECT_EQ(hm::str::trim("\t\nhello\n\t"), "hello");
}

TEST(StringUtils, Trim_AllWhitespace) {
    EXPECT_EQ(hm::str::trim("   "), "");
}

TEST(StringUtils, TrimLeftRight) {
    EXPECT_EQ(hm::str::trimLeft("  a  "), "a  ");
    EXPECT_EQ(hm::str::trimRight("  a  "), "  a");
}

// --- case conversion ---

TEST(StringUtils, ToLower_Mixed) {
    EXPECT_EQ(hm::str::toLower("HeLLo WoRLd"), "hello world");
}

// --- split / join ---

TEST(StringUtils, Split_DropsEmptyFields) {
    auto parts = hm::str::split(";90x18;;68x18;", ';');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "90x18");
    EXPECT_EQ(parts[1], "68x18");
}

TEST(StringUtils, Split_NoDelimiter) {
    auto parts = hm::str::split("single", ',');
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], "single");
}

TEST(StringUtils, Join) {
    EXPECT_EQ(hm::str::join({"90 x 18", "68 x 18"}, "; "), "90 x 18; 68 x 18");
    EXPECT_EQ(hm::str::join({}, ", "), "");
}

// --- prefix ---

TEST(StringUtils, StartsWith) {
    EXPECT_TRUE(hm::str::startsWith("profile_0007.pdf", "profile_"));
    EXPECT_FALSE(hm::str::startsWith("pro", "profile_"));
}

TEST(StringUtils, IsDigits) {
    EXPECT_TRUE(hm::str::isDigits("001"));
    EXPECT_FALSE(hm::str::isDigits(""));
    EXPECT_FALSE(hm::str::isDigits("12A"));
    EXPECT_FALSE(hm::str::isDigits("-1"));
}

// --- number parsing ---

TEST(StringUtils, ParseInt) {
    int v = 0;
    EXPECT_TRUE(hm::str::parseInt("42", v));
    EXPECT_EQ(v, 42);
    EXPECT_TRUE(hm::str::parseInt("-7", v));
    EXPECT_EQ(v, -7);
    EXPECT_FALSE(hm::str::parseInt("42abc", v));
    EXPECT_FALSE(hm::str::parseInt("", v));
}

TEST(StringUtils, ParseInt64) {
    int64_t v = 0;
    EXPECT_TRUE(hm::str::parseInt64("9000000000", v));
    EXPECT_EQ(v, 9000000000LL);
    EXPECT_FALSE(hm::str::parseInt64("1.5", v));
}

TEST(StringUtils, ParseDouble) {
    double v = 0.0;
    EXPECT_TRUE(hm::str::parseDouble("2.5", v));
    EXPECT_DOUBLE_EQ(v, 2.5);
    EXPECT_FALSE(hm::str::parseDouble("2.5mm", v));
    EXPECT_FALSE(hm::str::parseDouble("", v));
}

// --- formatting ---

TEST(StringUtils, FormatDecimal_TrimsZeros) {
    EXPECT_EQ(hm::str::formatDecimal(100.0), "100");
    EXPECT_EQ(hm::str::formatDecimal(0.50), "0.5");
    EXPECT_EQ(hm::str::formatDecimal(18.125), "18.125");
    EXPECT_EQ(hm::str::formatDecimal(2.3456, 2), "2.35");
    EXPECT_EQ(hm::str::formatDecimal(-0.0001), "0");
}

TEST(StringUtils, PadRight) {
    EXPECT_EQ(hm::str::padRight("7", 4), "7   ");
    EXPECT_EQ(hm::str::padRight("Straight", 7), "Straight");
}

TEST(StringUtils, EscapeLike) {
    EXPECT_EQ(hm::str::escapeLike("100%_a\\b"), "100\\%\\_a\\\\b");
    EXPECT_EQ(hm::str::escapeLike("plain"), "plain");
}
