#pragma once

#include "core/Settings.h"

#include <vector>

namespace wordpulse {

/// Phase of a single word's display
enum class SegmentKind {
    FadeIn,   // Opacity 0 -> 1 (cross-dissolves the previous word when gap < 0)
    Hold,     // Full opacity
    FadeOut,  // Opacity 1 -> 0
    Gap       // Blank display
};

const char* segmentKindName(SegmentKind kind);

/// One timed phase of a word. Generated per word as playback advances,
/// consumed immediately, never stored beyond the current word.
struct Segment {
    SegmentKind kind = SegmentKind::Hold;
    int wordIndex = -1;           // 0-based; -1 for blank padding
    int previousWordIndex = -1;   // Outgoing word of a cross-dissolve, or -1
    double duration = 0.0;        // Seconds

    bool isFade() const { return kind == SegmentKind::FadeIn || kind == SegmentKind::FadeOut; }
};

/// What the screen shows at one instant
struct DisplayState {
    int wordIndex = -1;
    double opacity = 0.0;
    int previousWordIndex = -1;
    double previousOpacity = 0.0;

    bool isBlank() const {
        return (wordIndex < 0 || opacity <= 0.0) &&
               (previousWordIndex < 0 || previousOpacity <= 0.0);
    }

    bool operator==(const DisplayState& o) const {
        return wordIndex == o.wordIndex && opacity == o.opacity &&
               previousWordIndex == o.previousWordIndex &&
               previousOpacity == o.previousOpacity;
    }
    bool operator!=(const DisplayState& o) const { return !(*this == o); }
};

/// Display for a segment at progress in [0, 1]. The only place opacities
/// are derived; live preview and export both call it.
DisplayState displayAt(const Segment& segment, double progress);

/// Produces, one word at a time, the segments needed to show that word.
class PlaybackTimeline {
public:
    /// Floor for the hold phase when fades eat the whole word
    static constexpr double kMinHoldSeconds = 0.01;

    /// @param timing Resolved durations
    /// @param wordCount Number of words in the sequence
    /// @param startIndex 1-based first word of every pass (clamped)
    PlaybackTimeline(const ResolvedTiming& timing, int wordCount, int startIndex);

    /// Segments for a word (0-based index within the whole sequence)
    std::vector<Segment> segmentsForWord(int wordIndex) const;

    /// Nominal duration of a word's segments
    double wordSpan(int wordIndex) const;

    /// Nominal duration of one untruncated pass
    double passDuration() const;

    int firstWord() const { return firstWord_; }
    int wordCount() const { return wordCount_; }

    /// Words in one pass (from the start index to the end)
    int passLength() const { return wordCount_ - firstWord_; }

    const ResolvedTiming& timing() const { return timing_; }

private:
    ResolvedTiming timing_;
    int wordCount_;
    int firstWord_;
};

/// A segment placed on a pass's time axis
struct TimedSegment {
    Segment segment;
    double start = 0.0;       // Seconds since the pass started (nominal)
    double duration = 0.0;    // Playable duration after time-box clipping
    bool truncated = false;   // Cut short by the time box; ends the pass

    double end() const { return start + duration; }
};

/// Walks one pass of a timeline. With a time box (ByBars looping) the pass
/// is pre-empted at the box boundary, even mid-word, and padded with blank
/// display when the words run out first.
class PassCursor {
public:
    /// @param timeBox Pass length in seconds, or <= 0 for unbounded
    explicit PassCursor(const PlaybackTimeline& timeline, double timeBox = 0.0);

    /// Next segment of the pass. Returns false when the pass is over.
    bool next(TimedSegment& out);

    /// Nominal seconds consumed so far
    double position() const { return position_; }

    bool finished() const { return done_; }

private:
    bool refill();

    const PlaybackTimeline& timeline_;
    double timeBox_;
    int nextWord_;
    std::vector<Segment> pending_;
    size_t pendingPos_ = 0;
    double position_ = 0.0;
    bool done_ = false;
};

/// Loop length and iteration count, for duration read-outs
struct SessionEstimate {
    double passSeconds = 0.0;
    int iterations = 1;       // -1 = infinite
    double totalSeconds = 0.0; // Of the finite part (one pass when infinite)
};

SessionEstimate estimateSession(const PlaybackTimeline& timeline, const LoopSettings& loop);

/// Time box for a pass: loopBars * barSeconds in ByBars mode, else 0 (none)
double passTimeBox(const ResolvedTiming& timing, const LoopSettings& loop);

} // namespace wordpulse
