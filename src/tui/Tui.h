#pragma once

#include "client/PlayerClient.h"
#include <string>
#include <vector>
#include <mutex>
#include <deque>
#include <chrono>
#include <cstdint>

namespace wordpulse {

/// ncurses front end: the current word in its blended colour inside an
/// aspect-ratio frame, metronome and loop read-outs, export progress and
/// a message log. Keyboard drives the PlayerClient.
class Tui {
public:
    explicit Tui(PlayerClient& client);
    ~Tui();

    /// Initialize ncurses
    bool init();

    /// Shut down ncurses
    void shutdown();

    /// Process one frame of the TUI: handle input, redraw.
    /// Returns false if the user wants to quit.
    bool update();

    /// Add a message to the log
    void addMessage(const std::string& msg);

private:
    void draw();
    void drawHeader(int row);
    void drawStage(int startRow, int rows);
    void drawMetronome(int row);
    void drawProgress(int row);
    void drawExport(int row);
    void drawControls(int startRow);
    void drawMessages(int startRow);
    void handleKey(int key);
    void handleTapTempo();

    /// Colour pair for a word at the given opacity (0 = terminal default)
    int wordColourPair(double opacity);

    PlayerClient& client_;
    bool initialized_ = false;
    bool needsRedraw_ = true;
    bool richColour_ = false;

    std::mutex messageMutex_;
    std::deque<std::string> messages_;
    static constexpr int maxMessages_ = 6;

    int termWidth_ = 80;
    int termHeight_ = 24;

    uint64_t lastBeatSerial_ = 0;
    std::chrono::steady_clock::time_point beatFlashUntil_{};

    // Tap tempo state
    std::vector<std::chrono::steady_clock::time_point> tapTimes_;
    static constexpr int maxTaps_ = 8;
    static constexpr double tapTimeoutSec_ = 2.0;
};

} // namespace wordpulse
