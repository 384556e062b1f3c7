#include <gtest/gtest.h>

#include "core/MetronomeClock.h"

#include <cmath>
#include <vector>

namespace wordpulse {
namespace {

TEST(MetronomeClockTest, FirstQueryTicksBeatZero) {
    MetronomeClock clock(120.0, 4);
    std::vector<BeatTick> ticks;
    clock.onTick([&](const BeatTick& t) { ticks.push_back(t); });

    EXPECT_EQ(clock.advanceTo(0.0), 1);
    ASSERT_EQ(ticks.size(), 1u);
    EXPECT_EQ(ticks[0].beatIndex, 0);
    EXPECT_TRUE(ticks[0].accent);
}

TEST(MetronomeClockTest, TickCountMatchesElapsedBeats) {
    MetronomeClock clock(120.0, 4);
    std::vector<BeatTick> ticks;
    clock.onTick([&](const BeatTick& t) { ticks.push_back(t); });

    const double end = 3.3;
    for (int i = 0; i <= 330; ++i) clock.advanceTo(i * 0.01);

    const size_t expected = static_cast<size_t>(std::floor(end / 0.5)) + 1;
    ASSERT_EQ(ticks.size(), expected);
    for (size_t i = 0; i < ticks.size(); ++i) {
        EXPECT_EQ(ticks[i].beatIndex, static_cast<int64_t>(i)) << "no duplicates or gaps";
        EXPECT_EQ(ticks[i].beat, static_cast<int>(i % 4));
        EXPECT_EQ(ticks[i].bar, static_cast<int>(i / 4));
        EXPECT_EQ(ticks[i].accent, i % 4 == 0);
    }
}

TEST(MetronomeClockTest, SlowQueryCatchesUp) {
    MetronomeClock clock(120.0, 4);
    int fired = 0;
    clock.onTick([&](const BeatTick&) { ++fired; });

    EXPECT_EQ(clock.advanceTo(2.0), 5);
    EXPECT_EQ(fired, 5);
    EXPECT_EQ(clock.lastBeatIndex(), 4);

    EXPECT_EQ(clock.advanceTo(2.0), 0);
    EXPECT_EQ(clock.advanceTo(1.0), 0);
    EXPECT_EQ(fired, 5);
}

TEST(MetronomeClockTest, ResetStartsOver) {
    MetronomeClock clock(120.0, 4);
    clock.advanceTo(1.2);
    clock.reset();
    EXPECT_EQ(clock.lastBeatIndex(), -1);
    EXPECT_EQ(clock.advanceTo(0.0), 1);
}

TEST(MetronomeClockTest, PositionWithinBar) {
    MetronomeClock clock(120.0, 4);
    MetronomePosition pos = clock.positionAt(2.25);
    EXPECT_EQ(pos.beatIndex, 4);
    EXPECT_EQ(pos.bar, 1);
    EXPECT_EQ(pos.beat, 0);
    EXPECT_NEAR(pos.beatFraction, 0.5, 1e-9);

    MetronomePosition odd = MetronomeClock(90.0, 3).positionAt(2.0);
    EXPECT_EQ(odd.beatIndex, 3);
    EXPECT_EQ(odd.bar, 1);
    EXPECT_EQ(odd.beat, 0);
}

TEST(MetronomeClockTest, CountInTimesAreNegative) {
    MetronomeClock clock(120.0, 4);
    EXPECT_DOUBLE_EQ(clock.countInTime(0), -2.0);
    EXPECT_DOUBLE_EQ(clock.countInTime(3), -0.5);
    EXPECT_DOUBLE_EQ(clock.secondsPerBar(), 2.0);
}

} // namespace
} // namespace wordpulse
