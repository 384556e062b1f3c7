#pragma once

#include "core/Blend.h"
#include "core/Status.h"
#include "core/TimeModel.h"

#include <string>

namespace wordpulse {

class WordSequence;

struct TimingSettings {
    int bpm = 120;                  // 20..300
    int timeSigNum = 4;             // 1..16
    int timeSigDen = 4;             // 2, 4, 8 or 16 (display only)
    NoteValue wordNote = *parseNoteValue("1/4");
    NoteValue fadeInNote = *parseNoteValue("1/16");
    NoteValue fadeOutNote = *parseNoteValue("1/16");
    NoteValue gapNote = NoteValue::none();
    bool gapIsNegative = false;     // Negative gap = cross-fade overlap
};

/// Durations derived from TimingSettings, all in seconds
struct ResolvedTiming {
    double word = 0.0;
    double fadeIn = 0.0;
    double fadeOut = 0.0;
    double gap = 0.0;               // Signed: < 0 means overlap
    double beat = 0.5;
    double bar = 2.0;
    int beatsPerBar = 4;
};

ResolvedTiming resolveTiming(const TimingSettings& timing);

enum class LoopMode {
    AllWords,   // One pass over the words from the start index
    ByBars      // Fixed number of bars, regardless of word count
};

struct LoopSettings {
    bool enabled = false;
    LoopMode mode = LoopMode::AllWords;
    int loopBars = 4;
    int loopTimes = 2;
    bool infinite = false;

    /// Total iterations, or -1 for infinite
    int totalIterations() const {
        if (!enabled) return 1;
        return infinite ? -1 : loopTimes;
    }

    bool isTimeBoxed() const { return enabled && mode == LoopMode::ByBars; }
};

enum class ExportFormat { Mp4, Avi, Mov, PngSequence };

const char* exportFormatName(ExportFormat format);
bool parseExportFormat(const std::string& text, ExportFormat& out);

struct ExportSettings {
    int fps = 30;
    int width = 1920;
    int height = 1080;
    ExportFormat format = ExportFormat::Mp4;
    bool transparentBackground = false;
};

/// Parse "1920x1080". Returns false when malformed or non-positive.
bool parseResolution(const std::string& text, int& width, int& height);

struct AspectRatio {
    int w = 16;
    int h = 9;

    double ratio() const { return static_cast<double>(w) / h; }
};

/// Parse "16:9". Returns false when malformed.
bool parseAspectRatio(const std::string& text, AspectRatio& out);

struct DisplaySettings {
    std::string fontFamily = "DejaVu Sans";
    int fontSize = 72;              // Points at 1080 lines
    Rgb foreground{255, 255, 255};
    Rgb background{0, 0, 0};
    AspectRatio aspect;
};

/// Immutable snapshot of everything a playback or export run needs.
/// Captured once at the start of a run; later edits don't reach it.
struct SessionSettings {
    TimingSettings timing;
    LoopSettings loop;
    ExportSettings exportSettings;
    DisplaySettings display;
    int startIndex = 1;             // 1-based
    bool countIn = false;
    bool metronomeEnabled = true;
    float clickVolume = 0.5f;
};

/// Reject settings that can't enter the core. Checks the word list too when
/// requireWords is set (play/export need at least one word).
Status validateSession(const SessionSettings& settings, const WordSequence& words,
                       bool requireWords);

/// Extra checks that only apply to exporting
Status validateExport(const ExportSettings& exportSettings);

} // namespace wordpulse
