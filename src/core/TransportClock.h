#pragma once

#include <chrono>
#include <cstdint>

namespace wordpulse {

/// Monotonic virtual clock consumed by the schedulers. The live path
/// advances it by measured wall-clock deltas, the export path by whole frames.
class TransportClock {
public:
    virtual ~TransportClock() = default;

    /// Seconds of transport time since start
    virtual double elapsed() const = 0;
};

/// Steady-clock transport time that freezes while paused.
/// Paused spans are excluded by accumulation, never by subtracting raw
/// timestamps across a pause.
class SteadyTransportClock : public TransportClock {
public:
    using Clock = std::chrono::steady_clock;

    /// Start (or restart) from zero, running
    void start();

    void pause();
    void resume();

    bool isPaused() const { return paused_; }
    bool isStarted() const { return started_; }

    double elapsed() const override;

private:
    bool started_ = false;
    bool paused_ = false;
    Clock::time_point runningSince_{};
    double accumulated_ = 0.0;  // Seconds banked before the current running span
};

/// Frame-counting transport time: elapsed = frame / fps
class FrameTransportClock : public TransportClock {
public:
    explicit FrameTransportClock(int fps) : fps_(fps > 0 ? fps : 1) {}

    void advance(int64_t frames = 1) { frame_ += frames; }
    void reset() { frame_ = 0; }

    int64_t frame() const { return frame_; }
    int fps() const { return fps_; }

    double elapsed() const override {
        return static_cast<double>(frame_) / static_cast<double>(fps_);
    }

    /// Frame on which a nominal time falls: round(seconds * fps)
    int64_t frameAt(double seconds) const;

private:
    int fps_;
    int64_t frame_ = 0;
};

} // namespace wordpulse
