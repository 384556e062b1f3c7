#include "tui/Tui.h"
#include "core/Blend.h"
#include <ncurses.h>
#include <cmath>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace wordpulse {

namespace {

constexpr int kWordPair = 10;
constexpr int kStagePair = 11;

/// Nearest entry of the xterm 6x6x6 colour cube
int xtermIndex(Rgb c) {
    auto level = [](uint8_t v) { return v < 48 ? 0 : v < 115 ? 1 : (v - 35) / 40; };
    return 16 + 36 * level(c.r) + 6 * level(c.g) + level(c.b);
}

std::string formatSeconds(double s) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << s << "s";
    return out.str();
}

} // namespace

Tui::Tui(PlayerClient& client)
    : client_(client)
{
}

Tui::~Tui() {
    shutdown();
}

bool Tui::init() {
    initscr();
    if (!stdscr) return false;

    cbreak();             // Disable line buffering
    noecho();             // Don't echo input
    keypad(stdscr, TRUE); // Enable special keys
    nodelay(stdscr, TRUE); // Non-blocking input
    curs_set(0);          // Hide cursor

    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(1, COLOR_GREEN, -1);    // Playing
        init_pair(2, COLOR_YELLOW, -1);   // Paused / count-in
        init_pair(3, COLOR_RED, -1);      // Accent beat
        init_pair(4, COLOR_CYAN, -1);     // Beat
        init_pair(5, COLOR_WHITE, -1);    // Default
        init_pair(6, COLOR_MAGENTA, -1);  // Export
        init_pair(7, COLOR_BLUE, -1);     // Header
        richColour_ = COLORS >= 256 && COLOR_PAIRS > kStagePair;
        if (richColour_) {
            Rgb bg = client_.settings().display.background;
            init_pair(kStagePair, xtermIndex(bg), xtermIndex(bg));
        }
    }

    getmaxyx(stdscr, termHeight_, termWidth_);
    initialized_ = true;
    needsRedraw_ = true;
    return true;
}

void Tui::shutdown() {
    if (initialized_) {
        endwin();
        initialized_ = false;
    }
}

bool Tui::update() {
    if (!initialized_) return false;

    // Poll client for latest state
    client_.poll();

    // Drain messages from client into our log
    for (const auto& msg : client_.snapshot().messages) {
        addMessage(msg);
    }

    const auto& snap = client_.snapshot();
    if (snap.beatSerial != lastBeatSerial_) {
        lastBeatSerial_ = snap.beatSerial;
        beatFlashUntil_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(100);
    }

    // Handle resize
    int h, w;
    getmaxyx(stdscr, h, w);
    if (h != termHeight_ || w != termWidth_) {
        termHeight_ = h;
        termWidth_ = w;
        needsRedraw_ = true;
    }

    // Process all available input
    int key;
    while ((key = getch()) != ERR) {
        if (key == 'q' || key == 'Q') {
            return false;
        }
        handleKey(key);
        needsRedraw_ = true;
    }

    // Redraw
    draw();

    return true;
}

void Tui::draw() {
    erase();

    const int fixedRows = 2 + 3 + 2 + 5 + 1;
    int stageRows = std::max(5, termHeight_ - fixedRows - maxMessages_ - 1);

    int row = 0;
    drawHeader(row);
    row += 2;

    drawStage(row, stageRows);
    row += stageRows;

    drawMetronome(row);
    row += 3;

    drawProgress(row);
    row += 1;

    drawExport(row);
    row += 1;

    drawControls(row);
    row += 5;

    drawMessages(row);

    refresh();
    needsRedraw_ = false;
}

void Tui::drawHeader(int row) {
    const auto& snap = client_.snapshot();
    const auto& s = client_.settings();

    attron(A_BOLD | COLOR_PAIR(7));
    mvprintw(row, 0, "WORDPULSE");
    attroff(A_BOLD | COLOR_PAIR(7));
    mvprintw(row, 11, "- Rhythmic Word Display");

    int pair = 5;
    switch (snap.state) {
        case TransportState::Playing:   pair = 1; break;
        case TransportState::CountIn:
        case TransportState::Paused:    pair = 2; break;
        default: break;
    }
    attron(A_BOLD | COLOR_PAIR(pair));
    mvprintw(row, std::max(36, termWidth_ - 12), "%-10s", transportStateName(snap.state));
    attroff(A_BOLD | COLOR_PAIR(pair));

    std::ostringstream info;
    info << "Word " << s.timing.wordNote.token
         << "  Fade " << s.timing.fadeInNote.token << "/" << s.timing.fadeOutNote.token
         << "  Gap " << (s.timing.gapIsNegative && !s.timing.gapNote.isNone() ? "-" : "")
         << s.timing.gapNote.token
         << "  Loop " << (s.loop.enabled ? (s.loop.mode == LoopMode::ByBars
                                              ? std::to_string(s.loop.loopBars) + " bars"
                                              : std::string("words"))
                                         : std::string("off"))
         << "  Count-in " << (s.countIn ? "on" : "off");
    mvprintw(row + 1, 0, "%s", info.str().c_str());
}

void Tui::drawStage(int startRow, int rows) {
    const auto& snap = client_.snapshot();
    const auto& display = client_.settings().display;

    // Terminal cells are about twice as tall as they are wide
    int availW = std::max(10, termWidth_ - 4);
    int availH = std::max(3, rows - 1);
    double ratio = display.aspect.ratio();
    int fw = availW;
    int fh = static_cast<int>(std::lround(fw / ratio / 2.0));
    if (fh > availH) {
        fh = availH;
        fw = std::min(availW, static_cast<int>(std::lround(fh * 2.0 * ratio)));
    }
    fw = std::max(fw, 10);
    fh = std::max(fh, 3);

    int top = startRow;
    int left = (termWidth_ - fw) / 2;

    // Frame
    mvaddch(top, left, ACS_ULCORNER);
    mvhline(top, left + 1, ACS_HLINE, fw - 2);
    mvaddch(top, left + fw - 1, ACS_URCORNER);
    for (int y = 1; y < fh - 1; ++y) {
        mvaddch(top + y, left, ACS_VLINE);
        mvaddch(top + y, left + fw - 1, ACS_VLINE);
        if (richColour_) {
            attron(COLOR_PAIR(kStagePair));
            mvhline(top + y, left + 1, ' ', fw - 2);
            attroff(COLOR_PAIR(kStagePair));
        }
    }
    mvaddch(top + fh - 1, left, ACS_LLCORNER);
    mvhline(top + fh - 1, left + 1, ACS_HLINE, fw - 2);
    mvaddch(top + fh - 1, left + fw - 1, ACS_LRCORNER);
    mvprintw(top + fh - 1, left + 2, " %d:%d ", display.aspect.w, display.aspect.h);

    // One word fits in a cell row: show whichever of a cross-dissolve dominates
    const DisplayState& d = snap.display;
    int index = d.wordIndex;
    double opacity = d.opacity;
    if (d.previousWordIndex >= 0 && d.previousOpacity > d.opacity) {
        index = d.previousWordIndex;
        opacity = d.previousOpacity;
    }
    const auto& words = client_.words();
    if (index < 0 || index >= words.size() || opacity <= 0.0) return;

    int pair = wordColourPair(opacity);

    std::string word = words.at(index);
    int maxLen = fw - 4;
    if (static_cast<int>(word.size()) > maxLen) word = word.substr(0, static_cast<size_t>(maxLen));
    int x = left + (fw - static_cast<int>(word.size())) / 2;
    int y = top + fh / 2;

    int attrs = COLOR_PAIR(pair) | A_BOLD;
    if (!richColour_ && opacity < 0.5) attrs = COLOR_PAIR(pair) | A_DIM;
    attron(attrs);
    mvprintw(y, x, "%s", word.c_str());
    attroff(attrs);
}

int Tui::wordColourPair(double opacity) {
    if (!richColour_) return has_colors() ? 5 : 0;

    const auto& display = client_.settings().display;
    Rgb c = blend(display.foreground, display.background, opacity);
    init_pair(kWordPair, xtermIndex(c), xtermIndex(display.background));
    return kWordPair;
}

void Tui::drawMetronome(int row) {
    const auto& snap = client_.snapshot();
    const auto& s = client_.settings();
    const int beats = s.timing.timeSigNum;

    attron(A_BOLD);
    mvprintw(row, 0, "METRONOME");
    attroff(A_BOLD);

    std::ostringstream info;
    info << s.timing.bpm << " BPM  "
         << s.timing.timeSigNum << "/" << s.timing.timeSigDen << "  "
         << "Click: " << (snap.clickEnabled ? "ON" : "OFF");
    mvprintw(row, 12, "%s", info.str().c_str());

    std::ostringstream posStr;
    if (snap.bar < 0) {
        posStr << "Count-in  Beat " << (snap.beat + 1);
    } else {
        posStr << "Bar " << (snap.bar + 1) << "  Beat " << (snap.beat + 1);
    }
    posStr << "  " << formatSeconds(snap.elapsed);
    mvprintw(row + 1, 2, "%s", posStr.str().c_str());

    // Beat indicator; the current beat lights briefly on each tick
    bool flash = std::chrono::steady_clock::now() < beatFlashUntil_ &&
                 snap.state != TransportState::Idle;
    int col = 36;
    for (int b = 0; b < beats && col + 4 < termWidth_; ++b) {
        bool current = (b == snap.beat) && snap.state != TransportState::Idle;
        if (current) {
            int pair = b == 0 ? 3 : 4;
            attron(COLOR_PAIR(pair) | (flash ? A_BOLD | A_REVERSE : A_BOLD));
            mvprintw(row + 1, col, "[%c]", b == 0 ? 'X' : 'x');
            attroff(COLOR_PAIR(pair) | A_BOLD | A_REVERSE);
        } else {
            mvprintw(row + 1, col, "[ ]");
        }
        col += 4;
    }

    std::string loopStr;
    if (snap.loopTotal < 0) {
        loopStr = "Loop " + std::to_string(snap.loopIteration + 1) + "/inf";
    } else {
        loopStr = "Loop " + std::to_string(snap.loopIteration + 1) + "/" +
                  std::to_string(snap.loopTotal);
    }
    std::string duration = "Pass " + formatSeconds(snap.passSeconds);
    if (snap.loopTotal < 0) {
        duration += " x inf";
    } else if (snap.loopTotal > 1) {
        duration += "  Total " + formatSeconds(snap.totalSeconds);
    }
    mvprintw(row + 2, 2, "%s  %s", loopStr.c_str(), duration.c_str());
    if (snap.droppedEvents > 0)
        mvprintw(row + 2, 48, "(%llu events dropped)",
                 static_cast<unsigned long long>(snap.droppedEvents));
}

void Tui::drawProgress(int row) {
    const auto& snap = client_.snapshot();

    attron(A_BOLD);
    mvprintw(row, 0, "WORD");
    attroff(A_BOLD);

    int total = std::max(1, snap.wordTotal);
    mvprintw(row, 12, "%d/%d", snap.wordCurrent, snap.wordTotal);

    int barWidth = std::max(10, std::min(40, termWidth_ - 30));
    int filled = static_cast<int>(std::lround(
        static_cast<double>(barWidth) * std::clamp(snap.wordCurrent, 0, total) / total));
    std::string bar(static_cast<size_t>(filled), '#');
    bar.append(static_cast<size_t>(barWidth - filled), '-');
    mvprintw(row, 24, "[%s]", bar.c_str());
}

void Tui::drawExport(int row) {
    const auto& ex = client_.snapshot().exportState;

    attron(A_BOLD);
    mvprintw(row, 0, "EXPORT");
    attroff(A_BOLD);

    if (!ex.running && ex.status.empty()) {
        mvprintw(row, 12, "(idle)");
        return;
    }
    attron(COLOR_PAIR(6));
    mvprintw(row, 12, "%3d%%  %s", ex.percent, ex.status.c_str());
    attroff(COLOR_PAIR(6));
}

void Tui::drawControls(int startRow) {
    attron(A_BOLD);
    mvprintw(startRow, 0, "CONTROLS");
    attroff(A_BOLD);

    mvprintw(startRow + 1, 2, "SPACE: Play/pause    s: Stop          r: Restart");
    mvprintw(startRow + 2, 2, "Left/Right: Seek     Home: First word  +/-: BPM +/-5");
    mvprintw(startRow + 3, 2, "M: Click on/off      l: Loop on/off    c: Count-in   t: Tap tempo");
    mvprintw(startRow + 4, 2, "e: Export            x: Cancel export  q: Quit");
}

void Tui::drawMessages(int startRow) {
    attron(A_BOLD);
    mvprintw(startRow, 0, "LOG");
    attroff(A_BOLD);

    std::lock_guard<std::mutex> lock(messageMutex_);
    int row = startRow + 1;
    for (const auto& msg : messages_) {
        if (row >= termHeight_) break;
        mvprintw(row, 2, "%s", msg.c_str());
        ++row;
    }
}

void Tui::handleKey(int key) {
    const auto& snap = client_.snapshot();
    const auto& s = client_.settings();

    switch (key) {
        case ' ':
            client_.togglePlay();
            break;

        case 's':
            client_.stop();
            break;

        case 'r':
            client_.restart();
            break;

        // Seek (stopped only)
        case KEY_LEFT:
            client_.seek(s.startIndex - 2);
            break;
        case KEY_RIGHT:
            client_.seek(s.startIndex);
            break;
        case KEY_HOME:
            client_.seek(0);
            break;

        // BPM adjust
        case '+':
        case '=':
            client_.setBpm(s.timing.bpm + 5);
            addMessage("BPM: " + std::to_string(client_.settings().timing.bpm));
            break;

        case '-':
            client_.setBpm(s.timing.bpm - 5);
            addMessage("BPM: " + std::to_string(client_.settings().timing.bpm));
            break;

        // Toggle metronome click
        case 'M': {
            bool on = !snap.clickEnabled;
            client_.setClickEnabled(on);
            addMessage(std::string("Metronome click: ") + (on ? "ON" : "OFF"));
            break;
        }

        case 'l':
            client_.setLoopEnabled(!s.loop.enabled);
            break;

        case 'c':
            client_.setCountIn(!s.countIn);
            break;

        // Tap tempo
        case 't':
            handleTapTempo();
            break;

        case 'e':
            client_.startExport();
            break;

        case 'x':
        case 27: // Escape
            client_.cancelExport();
            break;

        default:
            break;
    }
}

void Tui::handleTapTempo() {
    auto now = std::chrono::steady_clock::now();

    // Reset if too long since last tap
    if (!tapTimes_.empty()) {
        double elapsed = std::chrono::duration<double>(now - tapTimes_.back()).count();
        if (elapsed > tapTimeoutSec_) {
            tapTimes_.clear();
        }
    }

    tapTimes_.push_back(now);

    // Keep only the most recent taps
    while (static_cast<int>(tapTimes_.size()) > maxTaps_) {
        tapTimes_.erase(tapTimes_.begin());
    }

    // Need at least 2 taps to compute BPM
    if (tapTimes_.size() < 2) {
        addMessage("Tap tempo: tap again...");
        return;
    }

    // Average the intervals
    double totalSec = std::chrono::duration<double>(
        tapTimes_.back() - tapTimes_.front()).count();
    double avgInterval = totalSec / static_cast<double>(tapTimes_.size() - 1);
    int bpm = static_cast<int>(std::lround(60.0 / avgInterval));

    client_.setBpm(bpm);
    addMessage("Tap tempo: " + std::to_string(client_.settings().timing.bpm) + " BPM");
}

void Tui::addMessage(const std::string& msg) {
    std::lock_guard<std::mutex> lock(messageMutex_);
    messages_.push_front(msg);
    while (static_cast<int>(messages_.size()) > maxMessages_) {
        messages_.pop_back();
    }
}

} // namespace wordpulse
