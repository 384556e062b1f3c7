#pragma once

#include "core/MetronomeClock.h"
#include "core/PlaybackTimeline.h"
#include "core/Settings.h"
#include "core/TransportClock.h"

#include <cstdint>
#include <memory>

namespace wordpulse {

/// Everything needed to draw one exported frame
struct FrameDescriptor {
    int64_t frameIndex = 0;         // Global, across loop iterations
    int loopIteration = 0;          // 0-based
    int wordIndex = -1;             // Word owning the segment, -1 for blank padding
    SegmentKind kind = SegmentKind::Gap;
    DisplayState display;
    int beat = 0;
    int bar = 0;
};

/// Frame-quantized walk over the playback timeline.
///
/// Segments come from the same PassCursor the live scheduler walks, so the
/// ByBars cut and blank padding fall where they fall live. A segment spans
/// round(end * fps) - round(start * fps) frames of its nominal pass times:
/// within one frame of round(duration * fps), and the error never adds up
/// across a pass. A fade of n frames shows opacity i / n on its i-th frame
/// (1 - i / n fading out). Fully deterministic; no wall clock is involved.
class FrameSequencer {
public:
    FrameSequencer(const SessionSettings& settings, int wordCount);

    /// Produce the next frame. Returns false after the last one.
    bool next(FrameDescriptor& out);

    /// Frames the whole export will contain
    int64_t estimateTotalFrames() const;

    /// Frames in one pass (the ByBars budget when time-boxed)
    int64_t framesPerPass() const;

    /// Iterations an export renders: an infinite loop exports once
    int iterations() const { return iterations_; }

    int fps() const { return clock_.fps(); }
    const PlaybackTimeline& timeline() const { return timeline_; }

private:
    void beginPass();
    bool loadSegment();

    int64_t framesFor(double seconds) const { return clock_.frameAt(seconds); }

    ResolvedTiming timing_;
    PlaybackTimeline timeline_;
    MetronomeClock metronome_;
    FrameTransportClock clock_;
    double timeBox_ = 0.0;          // Seconds per pass when time-boxed, else 0
    int iterations_ = 1;

    std::unique_ptr<PassCursor> cursor_;
    int iteration_ = 0;
    int64_t passStartFrame_ = 0;
    bool finished_ = false;

    Segment current_;
    int64_t segFrames_ = 0;         // Frames actually rendered for the segment
    int64_t nominalFrames_ = 1;     // Frames of the unclipped segment (fade steps)
    int64_t frameInSeg_ = 0;
};

} // namespace wordpulse
