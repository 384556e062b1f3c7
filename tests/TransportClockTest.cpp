#include <gtest/gtest.h>

#include "core/TransportClock.h"

#include <chrono>
#include <thread>

namespace wordpulse {
namespace {

TEST(TransportClockTest, FrameClockCountsFrames) {
    FrameTransportClock clock(30);
    EXPECT_DOUBLE_EQ(clock.elapsed(), 0.0);
    clock.advance(45);
    EXPECT_EQ(clock.frame(), 45);
    EXPECT_DOUBLE_EQ(clock.elapsed(), 1.5);
    clock.reset();
    EXPECT_EQ(clock.frame(), 0);
}

TEST(TransportClockTest, FrameAtRounds) {
    FrameTransportClock clock(30);
    EXPECT_EQ(clock.frameAt(0.5), 15);
    EXPECT_EQ(clock.frameAt(0.25), 8);   // 7.5 rounds away from zero
    EXPECT_EQ(clock.frameAt(0.0), 0);
    EXPECT_EQ(FrameTransportClock(0).fps(), 1);
}

TEST(TransportClockTest, SteadyClockIdleBeforeStart) {
    SteadyTransportClock clock;
    EXPECT_FALSE(clock.isStarted());
    EXPECT_DOUBLE_EQ(clock.elapsed(), 0.0);
}

TEST(TransportClockTest, PauseFreezesElapsed) {
    SteadyTransportClock clock;
    clock.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    clock.pause();
    const double frozen = clock.elapsed();
    EXPECT_GT(frozen, 0.0);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_DOUBLE_EQ(clock.elapsed(), frozen);

    clock.resume();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    const double resumed = clock.elapsed();
    EXPECT_GT(resumed, frozen);
    // The paused 200 ms never enter the running total
    EXPECT_LT(resumed - frozen, 0.15);
}

} // namespace
} // namespace wordpulse
