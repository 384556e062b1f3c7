#include "core/PlaybackTimeline.h"

#include <algorithm>

namespace wordpulse {

namespace {

// Tolerance for comparing accumulated segment times against the time box
constexpr double kTimeEpsilon = 1e-9;

} // namespace

const char* segmentKindName(SegmentKind kind) {
    switch (kind) {
        case SegmentKind::FadeIn:  return "FadeIn";
        case SegmentKind::Hold:    return "Hold";
        case SegmentKind::FadeOut: return "FadeOut";
        case SegmentKind::Gap:     return "Gap";
    }
    return "Unknown";
}

DisplayState displayAt(const Segment& segment, double progress) {
    double p = std::clamp(progress, 0.0, 1.0);
    DisplayState d;
    switch (segment.kind) {
        case SegmentKind::FadeIn:
            d.wordIndex = segment.wordIndex;
            d.opacity = p;
            if (segment.previousWordIndex >= 0) {
                d.previousWordIndex = segment.previousWordIndex;
                d.previousOpacity = 1.0 - p;
            }
            break;
        case SegmentKind::Hold:
            d.wordIndex = segment.wordIndex;
            d.opacity = 1.0;
            break;
        case SegmentKind::FadeOut:
            d.wordIndex = segment.wordIndex;
            d.opacity = 1.0 - p;
            break;
        case SegmentKind::Gap:
            break;
    }
    return d;
}

PlaybackTimeline::PlaybackTimeline(const ResolvedTiming& timing, int wordCount, int startIndex)
    : timing_(timing)
    , wordCount_(std::max(0, wordCount))
{
    int start = wordCount_ > 0 ? std::max(1, std::min(startIndex, wordCount_)) : 1;
    firstWord_ = wordCount_ > 0 ? start - 1 : 0;
}

std::vector<Segment> PlaybackTimeline::segmentsForWord(int wordIndex) const {
    std::vector<Segment> out;
    if (wordIndex < firstWord_ || wordIndex >= wordCount_) return out;

    const bool firstInPass = (wordIndex == firstWord_);
    const bool lastInPass = (wordIndex == wordCount_ - 1);

    if (timing_.fadeIn > 0.0) {
        Segment s{SegmentKind::FadeIn, wordIndex, -1, timing_.fadeIn};
        if (timing_.gap < 0.0 && !firstInPass) {
            s.previousWordIndex = wordIndex - 1;
        }
        out.push_back(s);
    }

    // With a negative gap the next word's fade-in takes over the fade-out
    const double fadeOut = (timing_.gap >= 0.0) ? timing_.fadeOut : 0.0;

    double hold = std::max(kMinHoldSeconds, timing_.word - timing_.fadeIn - fadeOut);
    out.push_back({SegmentKind::Hold, wordIndex, -1, hold});

    if (fadeOut > 0.0) {
        out.push_back({SegmentKind::FadeOut, wordIndex, -1, fadeOut});
    }

    // Gaps separate words; none after the last word of a pass
    if (timing_.gap > 0.0 && !lastInPass) {
        out.push_back({SegmentKind::Gap, wordIndex, -1, timing_.gap});
    }
    return out;
}

double PlaybackTimeline::wordSpan(int wordIndex) const {
    double total = 0.0;
    for (const auto& s : segmentsForWord(wordIndex)) total += s.duration;
    return total;
}

double PlaybackTimeline::passDuration() const {
    double total = 0.0;
    for (int i = firstWord_; i < wordCount_; ++i) total += wordSpan(i);
    return total;
}

PassCursor::PassCursor(const PlaybackTimeline& timeline, double timeBox)
    : timeline_(timeline)
    , timeBox_(timeBox)
    , nextWord_(timeline.firstWord())
{
}

bool PassCursor::refill() {
    while (pendingPos_ >= pending_.size()) {
        if (nextWord_ >= timeline_.wordCount()) return false;
        pending_ = timeline_.segmentsForWord(nextWord_++);
        pendingPos_ = 0;
    }
    return true;
}

bool PassCursor::next(TimedSegment& out) {
    if (done_) return false;

    if (!refill()) {
        // Words exhausted. A time-boxed pass still lasts the whole box.
        done_ = true;
        if (timeBox_ > 0.0 && timeBox_ - position_ > kTimeEpsilon) {
            out.segment = {SegmentKind::Gap, -1, -1, timeBox_ - position_};
            out.start = position_;
            out.duration = out.segment.duration;
            out.truncated = false;
            position_ = timeBox_;
            return true;
        }
        return false;
    }

    const Segment& seg = pending_[pendingPos_++];

    if (timeBox_ > 0.0) {
        double remaining = timeBox_ - position_;
        if (remaining <= kTimeEpsilon) {
            done_ = true;
            return false;
        }
        if (seg.duration > remaining + kTimeEpsilon) {
            out.segment = seg;
            out.start = position_;
            out.duration = remaining;
            out.truncated = true;
            position_ = timeBox_;
            done_ = true;
            return true;
        }
    }

    out.segment = seg;
    out.start = position_;
    out.duration = seg.duration;
    out.truncated = false;
    position_ += seg.duration;
    return true;
}

double passTimeBox(const ResolvedTiming& timing, const LoopSettings& loop) {
    if (!loop.isTimeBoxed()) return 0.0;
    return loop.loopBars * timing.bar;
}

SessionEstimate estimateSession(const PlaybackTimeline& timeline, const LoopSettings& loop) {
    SessionEstimate e;
    double box = passTimeBox(timeline.timing(), loop);
    e.passSeconds = box > 0.0 ? box : timeline.passDuration();
    e.iterations = loop.totalIterations();
    e.totalSeconds = e.passSeconds * (e.iterations > 0 ? e.iterations : 1);
    return e;
}

} // namespace wordpulse
