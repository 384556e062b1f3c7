#include "core/TransportClock.h"
#include <cmath>

namespace wordpulse {

void SteadyTransportClock::start() {
    started_ = true;
    paused_ = false;
    accumulated_ = 0.0;
    runningSince_ = Clock::now();
}

void SteadyTransportClock::pause() {
    if (!started_ || paused_) return;
    accumulated_ += std::chrono::duration<double>(Clock::now() - runningSince_).count();
    paused_ = true;
}

void SteadyTransportClock::resume() {
    if (!started_ || !paused_) return;
    runningSince_ = Clock::now();
    paused_ = false;
}

double SteadyTransportClock::elapsed() const {
    if (!started_) return 0.0;
    if (paused_) return accumulated_;
    return accumulated_ +
           std::chrono::duration<double>(Clock::now() - runningSince_).count();
}

int64_t FrameTransportClock::frameAt(double seconds) const {
    return static_cast<int64_t>(std::llround(seconds * static_cast<double>(fps_)));
}

} // namespace wordpulse
