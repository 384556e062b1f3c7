#include <gtest/gtest.h>

#include "core/TimeModel.h"

namespace wordpulse {
namespace {

TEST(TimeModelTest, QuarterNoteAt120IsHalfSecond) {
    EXPECT_DOUBLE_EQ(noteToSeconds("1/4", 120.0), 0.5);
    EXPECT_DOUBLE_EQ(secondsPerBeat(120.0), 0.5);
}

TEST(TimeModelTest, NoteValuesScaleFromQuarter) {
    EXPECT_DOUBLE_EQ(noteToSeconds("1/32", 120.0), 0.0625);
    EXPECT_DOUBLE_EQ(noteToSeconds("1/16", 120.0), 0.125);
    EXPECT_DOUBLE_EQ(noteToSeconds("1/8", 120.0), 0.25);
    EXPECT_DOUBLE_EQ(noteToSeconds("1/2", 120.0), 1.0);
    EXPECT_DOUBLE_EQ(noteToSeconds("1", 120.0), 2.0);
    EXPECT_DOUBLE_EQ(noteToSeconds("16", 120.0), 32.0);
    EXPECT_DOUBLE_EQ(noteToSeconds("1/4", 60.0), 1.0);
}

TEST(TimeModelTest, NoneIsZeroAtAnyTempo) {
    EXPECT_DOUBLE_EQ(noteToSeconds("none", 120.0), 0.0);
    EXPECT_DOUBLE_EQ(noteToSeconds("0", 300.0), 0.0);
    auto none = parseNoteValue("none");
    ASSERT_TRUE(none.has_value());
    EXPECT_TRUE(none->isNone());
}

TEST(TimeModelTest, UnknownTokensAreRejected) {
    EXPECT_FALSE(parseNoteValue("1/3").has_value());
    EXPECT_FALSE(parseNoteValue("quarter").has_value());
    EXPECT_DOUBLE_EQ(noteToSeconds("1/3", 120.0), 0.0);
}

TEST(TimeModelTest, BarIsNumeratorBeats) {
    EXPECT_DOUBLE_EQ(barSeconds(4, 120.0), 2.0);
    EXPECT_DOUBLE_EQ(barSeconds(3, 120.0), 1.5);
    EXPECT_DOUBLE_EQ(barSeconds(7, 60.0), 7.0);
}

TEST(TimeModelTest, TokenListIsOrderedShortestFirst) {
    const auto& tokens = noteTokens();
    ASSERT_EQ(tokens.size(), 10u);
    EXPECT_EQ(tokens.front(), "1/32");
    EXPECT_EQ(tokens.back(), "16");
    double last = 0.0;
    for (const auto& t : tokens) {
        double s = noteToSeconds(t, 120.0);
        EXPECT_GT(s, last) << t;
        last = s;
    }
}

} // namespace
} // namespace wordpulse
