#pragma once

#include "core/MetronomeClock.h"
#include "core/PlaybackTimeline.h"

#include <string>

namespace wordpulse {

/// Transport states shared by the live scheduler and the exporter.
/// Idle -> CountIn -> Playing <-> Paused -> Completed; Stop returns to Idle.
enum class TransportState {
    Idle,
    CountIn,
    Playing,
    Paused,
    Completed
};

inline const char* transportStateName(TransportState s) {
    switch (s) {
        case TransportState::Idle:      return "IDLE";
        case TransportState::CountIn:   return "COUNT-IN";
        case TransportState::Playing:   return "PLAYING";
        case TransportState::Paused:    return "PAUSED";
        case TransportState::Completed: return "COMPLETE";
    }
    return "?";
}

enum class PlaybackEventType {
    Display,        // display: what the screen should show now
    WordProgress,   // wordIndex, current / total within the pass
    BeatTick,       // tick, elapsed
    LoopStatus,     // loopIteration / loopTotal
    StateChanged,   // state
    Completed,      // Playback reached its natural end
    Message         // text, for the log panel
};

/// Event posted from the playback driver to the controlling context
struct PlaybackEvent {
    PlaybackEventType type = PlaybackEventType::Message;

    DisplayState display;

    int wordIndex = -1;
    int current = 0;            // 1-based position within the pass
    int total = 0;              // Words in the pass

    BeatTick tick;
    double elapsed = 0.0;       // Seconds since the pass started (negative in count-in)

    int loopIteration = 0;      // 0-based
    int loopTotal = 1;          // -1 = infinite

    TransportState state = TransportState::Idle;

    std::string text;
};

/// Read-only view of the scheduler's playback state
struct PlaybackSnapshot {
    TransportState state = TransportState::Idle;
    int currentWordIndex = -1;
    int loopIteration = 0;
    double elapsed = 0.0;
};

} // namespace wordpulse
