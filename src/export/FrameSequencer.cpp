#include "export/FrameSequencer.h"

#include <algorithm>

namespace wordpulse {

FrameSequencer::FrameSequencer(const SessionSettings& settings, int wordCount)
    : timing_(resolveTiming(settings.timing))
    , timeline_(timing_, wordCount, settings.startIndex)
    , metronome_(static_cast<double>(settings.timing.bpm), settings.timing.timeSigNum)
    , clock_(settings.exportSettings.fps)
{
    timeBox_ = passTimeBox(timing_, settings.loop);
    iterations_ = (settings.loop.enabled && !settings.loop.infinite)
                      ? std::max(1, settings.loop.loopTimes) : 1;
    beginPass();
}

void FrameSequencer::beginPass() {
    cursor_ = std::make_unique<PassCursor>(timeline_, timeBox_);
    metronome_.reset();
    passStartFrame_ = clock_.frame();
    segFrames_ = 0;
    frameInSeg_ = 0;
}

bool FrameSequencer::loadSegment() {
    while (!finished_) {
        TimedSegment ts;
        if (cursor_->next(ts)) {
            // Pass-relative boundaries; only the differences matter
            const int64_t startFrame = framesFor(ts.start);
            current_ = ts.segment;
            segFrames_ = framesFor(ts.end()) - startFrame;
            nominalFrames_ = std::max<int64_t>(
                1, framesFor(ts.start + ts.segment.duration) - startFrame);
            frameInSeg_ = 0;
            return true;
        }
        if (++iteration_ >= iterations_) {
            finished_ = true;
            return false;
        }
        beginPass();
    }
    return false;
}

bool FrameSequencer::next(FrameDescriptor& out) {
    // Segments shorter than half a frame get no frames at all
    while (frameInSeg_ >= segFrames_) {
        if (!loadSegment()) return false;
    }

    const Segment& seg = current_;
    const double progress = seg.isFade()
        ? static_cast<double>(frameInSeg_) / static_cast<double>(nominalFrames_)
        : 0.0;

    const double passTime = static_cast<double>(clock_.frame() - passStartFrame_) /
                            static_cast<double>(clock_.fps());
    const MetronomePosition pos = metronome_.positionAt(passTime);

    out.frameIndex = clock_.frame();
    out.loopIteration = iteration_;
    out.wordIndex = seg.wordIndex;
    out.kind = seg.kind;
    out.display = displayAt(seg, progress);
    out.beat = pos.beat;
    out.bar = pos.bar;

    ++frameInSeg_;
    clock_.advance();
    return true;
}

int64_t FrameSequencer::framesPerPass() const {
    PassCursor cursor(timeline_, timeBox_);
    TimedSegment ts;
    double end = 0.0;
    while (cursor.next(ts)) end = ts.end();
    return framesFor(end);
}

int64_t FrameSequencer::estimateTotalFrames() const {
    return framesPerPass() * iterations_;
}

} // namespace wordpulse
