#include <gtest/gtest.h>

#include "core/Blend.h"

namespace wordpulse {
namespace {

TEST(BlendTest, EndpointsAreForegroundAndBackground) {
    Rgb fg{255, 255, 255};
    Rgb bg{0, 0, 0};
    EXPECT_EQ(blend(fg, bg, 1.0), fg);
    EXPECT_EQ(blend(fg, bg, 0.0), bg);
}

TEST(BlendTest, HalfOpacityRoundsPerChannel) {
    Rgb out = blend({255, 100, 0}, {0, 0, 255}, 0.5);
    EXPECT_EQ(out.r, 128);  // 127.5 rounds up
    EXPECT_EQ(out.g, 50);
    EXPECT_EQ(out.b, 128);
}

TEST(BlendTest, OpacityIsClamped) {
    Rgb fg{200, 10, 30};
    Rgb bg{20, 40, 60};
    EXPECT_EQ(blend(fg, bg, 1.7), fg);
    EXPECT_EQ(blend(fg, bg, -0.3), bg);
}

TEST(BlendTest, AlphaTracksOpacity) {
    EXPECT_EQ(alphaFor(0.0), 0);
    EXPECT_EQ(alphaFor(1.0), 255);
    EXPECT_EQ(alphaFor(0.5), 128);
    EXPECT_EQ(alphaFor(2.0), 255);
}

TEST(BlendTest, ParsesHexAndTriples) {
    auto a = parseRgb("#ff8000");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, (Rgb{255, 128, 0}));

    auto b = parseRgb("00FF10");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, (Rgb{0, 255, 16}));

    auto c = parseRgb("12, 34,56");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(*c, (Rgb{12, 34, 56}));
}

TEST(BlendTest, RejectsMalformedColours) {
    EXPECT_FALSE(parseRgb("").has_value());
    EXPECT_FALSE(parseRgb("#fff").has_value());
    EXPECT_FALSE(parseRgb("#gg0000").has_value());
    EXPECT_FALSE(parseRgb("1,2").has_value());
    EXPECT_FALSE(parseRgb("1,2,3,4").has_value());
    EXPECT_FALSE(parseRgb("1,2,300").has_value());
}

TEST(BlendTest, HexFormatting) {
    EXPECT_EQ(toHex({255, 0, 16}), "#ff0010");
}

} // namespace
} // namespace wordpulse
