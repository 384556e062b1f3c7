#pragma once

#include "core/PlaybackEvent.h"
#include "core/Settings.h"
#include "core/WordSequence.h"

#include <cstdint>
#include <string>
#include <vector>

namespace wordpulse {

/// Export progress for display
struct ExportSnapshot {
    bool running = false;
    int percent = 0;
    std::string status;             // "Loop 1/2 - Word 3/8", "Complete", error text
    int64_t framesWritten = 0;
    int64_t totalFrames = 0;
};

/// Complete player state snapshot, updated once per TUI frame
struct PlayerSnapshot {
    TransportState state = TransportState::Idle;

    DisplayState display;
    int wordIndex = -1;
    int wordCurrent = 0;            // 1-based position within the pass
    int wordTotal = 0;

    int bar = 0;                    // -1 during count-in
    int beat = 0;
    double elapsed = 0.0;
    uint64_t beatSerial = 0;        // Increments on every tick (for flashing)

    int loopIteration = 0;
    int loopTotal = 1;              // -1 = infinite

    double passSeconds = 0.0;       // Estimated, for the duration read-out
    double totalSeconds = 0.0;

    ExportSnapshot exportState;

    bool clickEnabled = true;
    uint64_t droppedEvents = 0;

    /// Messages received since last poll
    std::vector<std::string> messages;
};

/// Abstract interface for controlling playback and export.
/// The TUI uses this instead of the schedulers directly.
class PlayerClient {
public:
    virtual ~PlayerClient() = default;

    // --- Transport ---
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void togglePlay() = 0;
    virtual void stop() = 0;
    virtual void restart() = 0;

    /// Preview a word while stopped (0-based, clamped)
    virtual void seek(int wordIndex) = 0;

    // --- Settings (apply to the next run) ---
    virtual void setBpm(int bpm) = 0;
    virtual void setClickEnabled(bool on) = 0;
    virtual void setLoopEnabled(bool on) = 0;
    virtual void setCountIn(bool on) = 0;

    // --- Export ---
    virtual void startExport() = 0;
    virtual void cancelExport() = 0;

    // --- State ---
    virtual const SessionSettings& settings() const = 0;
    virtual const WordSequence& words() const = 0;
    virtual const PlayerSnapshot& snapshot() const = 0;

    /// Drain pending events into the snapshot. Called once per TUI frame.
    virtual void poll() = 0;
};

} // namespace wordpulse
