#include "core/MetronomeClock.h"
#include <algorithm>
#include <cmath>

namespace wordpulse {

namespace {

// Absorbs rounding when elapsed lands exactly on a boundary (k * spb)
constexpr double kBoundaryEpsilon = 1e-9;

} // namespace

MetronomeClock::MetronomeClock(double bpm, int beatsPerBar)
    : bpm_(std::max(1.0, bpm))
    , beatsPerBar_(std::max(1, std::min(beatsPerBar, 16)))
{
    secondsPerBeat_ = 60.0 / bpm_;
}

int64_t MetronomeClock::beatIndexAt(double elapsed) const {
    if (elapsed < 0.0) return -1;
    return static_cast<int64_t>(std::floor(elapsed / secondsPerBeat_ + kBoundaryEpsilon));
}

MetronomePosition MetronomeClock::positionAt(double elapsed) const {
    MetronomePosition pos;
    pos.elapsed = elapsed;

    int64_t whole = std::max<int64_t>(0, beatIndexAt(elapsed));
    pos.beatIndex = whole;
    pos.bar = static_cast<int>(whole / beatsPerBar_);
    pos.beat = static_cast<int>(whole % beatsPerBar_);

    double beats = std::max(0.0, elapsed) / secondsPerBeat_;
    pos.beatFraction = std::max(0.0, beats - static_cast<double>(whole));
    if (pos.beatFraction >= 1.0) pos.beatFraction = 0.0;
    return pos;
}

int MetronomeClock::advanceTo(double elapsed) {
    if (elapsed < lastElapsed_) return 0;
    lastElapsed_ = elapsed;

    int64_t current = beatIndexAt(elapsed);
    int fired = 0;

    // Catch up on every boundary crossed since the last query; a slow
    // query never drops a beat and a repeated one never duplicates it.
    for (int64_t b = lastBeat_ + 1; b <= current; ++b) {
        BeatTick tick;
        tick.beatIndex = b;
        tick.beat = static_cast<int>(b % beatsPerBar_);
        tick.bar = static_cast<int>(b / beatsPerBar_);
        tick.accent = (tick.beat == 0);
        tick.time = static_cast<double>(b) * secondsPerBeat_;
        lastBeat_ = b;
        ++fired;
        if (tickCallback_) tickCallback_(tick);
    }
    return fired;
}

void MetronomeClock::reset() {
    lastBeat_ = -1;
    lastElapsed_ = 0.0;
}

double MetronomeClock::countInTime(int beat) const {
    return -static_cast<double>(beatsPerBar_ - beat) * secondsPerBeat_;
}

} // namespace wordpulse
