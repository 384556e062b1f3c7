#pragma once

#include "core/MetronomeClock.h"
#include "core/PlaybackEvent.h"
#include "core/PlaybackTimeline.h"
#include "core/Settings.h"
#include "core/EventQueue.h"
#include "core/Status.h"
#include "core/TransportClock.h"
#include "core/WordSequence.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace wordpulse {

/// Real-time playback driver.
///
/// A single background thread owns the playback state and walks the
/// PlaybackTimeline against a pausable steady clock, posting events to a
/// lock-free queue that the controlling (UI) thread drains with pollEvent().
/// The controlling thread steers it through an atomic transport state;
/// setting Idle (stop) is the only cancellation signal.
class LiveScheduler {
public:
    /// Called on the driver thread for each metronome tick. Must not block.
    using TickSink = std::function<void(const BeatTick&)>;

    /// Display updates per fade
    static constexpr int kFadeSteps = 20;

    /// Flag polling granularity of the driver loops
    static constexpr std::chrono::milliseconds kPollInterval{1};

    LiveScheduler();
    ~LiveScheduler();

    LiveScheduler(const LiveScheduler&) = delete;
    LiveScheduler& operator=(const LiveScheduler&) = delete;

    /// Start playback from the start index with a snapshot of the settings.
    /// Resumes when paused; does nothing while already playing.
    /// Configuration errors are returned before anything starts.
    Status play(const SessionSettings& settings, const WordSequence& words);

    void pause();
    void resume();

    /// Abort the current pass and return to Idle. Blocks until the driver exits.
    void stop();

    /// stop() then play() with the last snapshot
    Status restart();

    /// While stopped: show a word in the preview (clamped to the sequence)
    void seek(int wordIndex, const WordSequence& words);

    /// Drain one event (controlling thread only)
    bool pollEvent(PlaybackEvent& ev) { return events_.pop(ev); }

    TransportState state() const { return state_.load(std::memory_order_acquire); }

    /// True in CountIn, Playing or Paused
    bool isActive() const;

    PlaybackSnapshot snapshot() const;

    /// Install before play(); not changed while the driver runs
    void setTickSink(TickSink sink) { tickSink_ = std::move(sink); }

    /// Events lost because the queue was full
    uint64_t droppedEvents() const { return events_.dropped(); }

private:
    // Driver thread
    void run();
    bool runCountIn(MetronomeClock& metronome);
    bool runPass(const PlaybackTimeline& timeline, double timeBox,
                 MetronomeClock& metronome, double& origin);
    bool driveSegment(const TimedSegment& ts, double origin, MetronomeClock& metronome);
    bool waitWhilePaused();
    void finishRun();

    void publish(const PlaybackEvent& ev);
    void publishState(TransportState s);
    void joinDriver();

    SessionSettings settings_;
    WordSequence words_;
    ResolvedTiming timing_;
    bool hasSnapshot_ = false;

    std::thread thread_;
    std::mutex controlMutex_;  // Serialises play/stop/seek from the controlling side

    std::atomic<TransportState> state_{TransportState::Idle};
    std::atomic<TransportState> pausedFrom_{TransportState::Playing};
    std::atomic<int> currentWordIndex_{-1};
    std::atomic<int> loopIteration_{0};
    std::atomic<double> elapsed_{0.0};

    // Driver-thread only
    SteadyTransportClock clock_;
    double tickElapsed_ = 0.0;

    TickSink tickSink_;
    EventQueue<PlaybackEvent, 4096> events_;
};

} // namespace wordpulse
