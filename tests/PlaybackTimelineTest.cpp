#include <gtest/gtest.h>

#include "core/PlaybackTimeline.h"

#include <vector>

namespace wordpulse {
namespace {

ResolvedTiming timingFor(const char* word, const char* fadeIn, const char* fadeOut,
                         const char* gap, bool negativeGap = false, int bpm = 120) {
    TimingSettings t;
    t.bpm = bpm;
    t.wordNote = *parseNoteValue(word);
    t.fadeInNote = *parseNoteValue(fadeIn);
    t.fadeOutNote = *parseNoteValue(fadeOut);
    t.gapNote = *parseNoteValue(gap);
    t.gapIsNegative = negativeGap;
    return resolveTiming(t);
}

std::vector<TimedSegment> walk(const PlaybackTimeline& timeline, double timeBox = 0.0) {
    std::vector<TimedSegment> out;
    PassCursor cursor(timeline, timeBox);
    TimedSegment ts;
    while (cursor.next(ts)) out.push_back(ts);
    return out;
}

TEST(PlaybackTimelineTest, PlainWordsAreSingleHolds) {
    PlaybackTimeline timeline(timingFor("1/4", "none", "none", "none"), 3, 1);
    auto segs = walk(timeline);
    ASSERT_EQ(segs.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(segs[i].segment.kind, SegmentKind::Hold);
        EXPECT_EQ(segs[i].segment.wordIndex, i);
        EXPECT_DOUBLE_EQ(segs[i].start, 0.5 * i);
        EXPECT_DOUBLE_EQ(segs[i].duration, 0.5);
    }
    EXPECT_DOUBLE_EQ(timeline.passDuration(), 1.5);
}

TEST(PlaybackTimelineTest, FadesShareTheWordDuration) {
    PlaybackTimeline timeline(timingFor("1/4", "1/16", "1/16", "none"), 1, 1);
    auto segs = timeline.segmentsForWord(0);
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs[0].kind, SegmentKind::FadeIn);
    EXPECT_EQ(segs[1].kind, SegmentKind::Hold);
    EXPECT_EQ(segs[2].kind, SegmentKind::FadeOut);
    EXPECT_DOUBLE_EQ(segs[0].duration, 0.125);
    EXPECT_DOUBLE_EQ(segs[1].duration, 0.25);
    EXPECT_DOUBLE_EQ(segs[2].duration, 0.125);
}

TEST(PlaybackTimelineTest, AllWordsPassTotal) {
    // 4 words of 0.5 s each plus 3 gaps of 0.25 s; no gap after the last word
    PlaybackTimeline timeline(timingFor("1/4", "1/16", "1/16", "1/8"), 4, 1);
    EXPECT_DOUBLE_EQ(timeline.passDuration(), 2.75);

    auto segs = walk(timeline);
    ASSERT_FALSE(segs.empty());
    EXPECT_NE(segs.back().segment.kind, SegmentKind::Gap);
    EXPECT_DOUBLE_EQ(segs.back().end(), 2.75);
}

TEST(PlaybackTimelineTest, HoldHasAFloor) {
    PlaybackTimeline timeline(timingFor("1/32", "1/16", "1/16", "none"), 1, 1);
    auto segs = timeline.segmentsForWord(0);
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_DOUBLE_EQ(segs[1].duration, PlaybackTimeline::kMinHoldSeconds);
}

TEST(PlaybackTimelineTest, NegativeGapCrossDissolves) {
    PlaybackTimeline timeline(timingFor("1/4", "1/16", "1/16", "1/16", true), 2, 1);

    auto first = timeline.segmentsForWord(0);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].previousWordIndex, -1);
    EXPECT_EQ(first[1].kind, SegmentKind::Hold);

    auto second = timeline.segmentsForWord(1);
    ASSERT_EQ(second.size(), 2u);
    ASSERT_EQ(second[0].kind, SegmentKind::FadeIn);
    EXPECT_EQ(second[0].previousWordIndex, 0);

    for (double p : {0.0, 0.25, 0.5, 0.9, 1.0}) {
        DisplayState d = displayAt(second[0], p);
        EXPECT_DOUBLE_EQ(d.opacity + d.previousOpacity, 1.0) << "p=" << p;
        EXPECT_EQ(d.wordIndex, 1);
        EXPECT_EQ(d.previousWordIndex, 0);
    }
}

TEST(PlaybackTimelineTest, DisplayOpacities) {
    Segment in{SegmentKind::FadeIn, 2, -1, 0.1};
    Segment out{SegmentKind::FadeOut, 2, -1, 0.1};
    Segment gap{SegmentKind::Gap, 2, -1, 0.1};
    EXPECT_DOUBLE_EQ(displayAt(in, 0.25).opacity, 0.25);
    EXPECT_DOUBLE_EQ(displayAt(out, 0.25).opacity, 0.75);
    EXPECT_TRUE(displayAt(gap, 0.5).isBlank());
    EXPECT_TRUE(displayAt(in, 0.0).isBlank());
    EXPECT_DOUBLE_EQ(displayAt(in, 3.0).opacity, 1.0);
}

TEST(PlaybackTimelineTest, StartIndexSkipsLeadingWords) {
    PlaybackTimeline timeline(timingFor("1/4", "none", "none", "none"), 5, 3);
    EXPECT_EQ(timeline.firstWord(), 2);
    EXPECT_EQ(timeline.passLength(), 3);
    EXPECT_TRUE(timeline.segmentsForWord(1).empty());

    auto segs = walk(timeline);
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs.front().segment.wordIndex, 2);
}

TEST(PlaybackTimelineTest, TimeBoxTruncatesMidPass) {
    // One bar at 120 bpm is 2 s; half-note words are 1 s each
    PlaybackTimeline timeline(timingFor("1/2", "none", "none", "none"), 3, 1);
    auto segs = walk(timeline, 2.0);
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0].segment.wordIndex, 0);
    EXPECT_EQ(segs[1].segment.wordIndex, 1);
    EXPECT_DOUBLE_EQ(segs.back().end(), 2.0);
}

TEST(PlaybackTimelineTest, TimeBoxCutsAWordShort) {
    PlaybackTimeline timeline(timingFor("1/2", "none", "none", "none"), 3, 1);
    auto segs = walk(timeline, 1.5);
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_TRUE(segs[1].truncated);
    EXPECT_DOUBLE_EQ(segs[1].duration, 0.5);
}

TEST(PlaybackTimelineTest, TimeBoxPadsWithBlank) {
    PlaybackTimeline timeline(timingFor("1/4", "none", "none", "none"), 2, 1);
    auto segs = walk(timeline, 2.0);
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs[2].segment.kind, SegmentKind::Gap);
    EXPECT_EQ(segs[2].segment.wordIndex, -1);
    EXPECT_DOUBLE_EQ(segs[2].duration, 1.0);
    EXPECT_DOUBLE_EQ(segs[2].end(), 2.0);
}

TEST(PlaybackTimelineTest, SessionEstimates) {
    PlaybackTimeline timeline(timingFor("1/4", "none", "none", "none"), 3, 1);

    LoopSettings loop;
    SessionEstimate once = estimateSession(timeline, loop);
    EXPECT_DOUBLE_EQ(once.passSeconds, 1.5);
    EXPECT_EQ(once.iterations, 1);
    EXPECT_DOUBLE_EQ(once.totalSeconds, 1.5);

    loop.enabled = true;
    loop.mode = LoopMode::ByBars;
    loop.loopBars = 2;
    loop.loopTimes = 3;
    SessionEstimate bars = estimateSession(timeline, loop);
    EXPECT_DOUBLE_EQ(bars.passSeconds, 4.0);
    EXPECT_DOUBLE_EQ(bars.totalSeconds, 12.0);

    loop.infinite = true;
    SessionEstimate forever = estimateSession(timeline, loop);
    EXPECT_EQ(forever.iterations, -1);
    EXPECT_DOUBLE_EQ(forever.totalSeconds, 4.0);
}

} // namespace
} // namespace wordpulse
