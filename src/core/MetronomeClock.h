#pragma once

#include <cstdint>
#include <functional>

namespace wordpulse {

/// Position within the metronome's timeline
struct MetronomePosition {
    double elapsed = 0.0;       // Seconds since the clock's origin
    int64_t beatIndex = 0;      // Absolute beat number from the origin
    int bar = 0;                // Current bar (0-indexed, -1 during count-in)
    int beat = 0;               // Current beat within bar (0-indexed)
    double beatFraction = 0.0;  // Fractional position within current beat [0, 1)
};

/// Emitted once per beat boundary
struct BeatTick {
    int64_t beatIndex = 0;
    int beat = 0;
    int bar = 0;
    bool accent = false;        // Downbeat (beat 0)
    double time = 0.0;          // Nominal time of the boundary
};

/// Maps elapsed time to beat/bar positions. Not self-driven: the owner
/// queries it with monotonically non-decreasing times and receives one tick
/// per beat index reached, starting with beat 0 at time 0.
class MetronomeClock {
public:
    using TickCallback = std::function<void(const BeatTick&)>;

    MetronomeClock(double bpm = 120.0, int beatsPerBar = 4);

    /// Position for an arbitrary elapsed time (pure)
    MetronomePosition positionAt(double elapsed) const;

    /// Move to elapsed seconds, firing the tick callback for every beat
    /// index not yet emitted. Earlier times than the last query are ignored.
    /// Returns the number of ticks fired.
    int advanceTo(double elapsed);

    /// Forget emitted beats; the next query at 0 ticks beat 0 again
    void reset();

    /// Highest beat index emitted so far (-1 before the first tick)
    int64_t lastBeatIndex() const { return lastBeat_; }

    double secondsPerBeat() const { return secondsPerBeat_; }
    double secondsPerBar() const { return secondsPerBeat_ * beatsPerBar_; }

    double bpm() const { return bpm_; }
    int beatsPerBar() const { return beatsPerBar_; }

    /// Nominal elapsed time reported for a count-in beat: -(beatsPerBar - beat) beats
    double countInTime(int beat) const;

    void onTick(TickCallback cb) { tickCallback_ = std::move(cb); }

private:
    int64_t beatIndexAt(double elapsed) const;

    double bpm_;
    int beatsPerBar_;
    double secondsPerBeat_ = 0.5;

    int64_t lastBeat_ = -1;
    double lastElapsed_ = 0.0;

    TickCallback tickCallback_;
};

} // namespace wordpulse
