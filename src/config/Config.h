#pragma once

#include "core/Settings.h"
#include "core/Status.h"
#include "core/WordSequence.h"

#include <string>

namespace wordpulse {

struct Config {
    // [timing]
    int bpm = 120;
    int timeSigNum = 4;
    int timeSigDen = 4;
    std::string wordNote = "1/4";
    std::string fadeInNote = "1/16";
    std::string fadeOutNote = "1/16";
    std::string gapNote = "none";
    bool gapNegative = false;

    // [loop]
    bool loopEnabled = false;
    std::string loopMode = "words";       // "words" or "bars"
    int loopBars = 4;
    int loopTimes = 2;
    bool loopInfinite = false;
    int startIndex = 1;

    // [display]
    std::string fontFamily = "DejaVu Sans";
    int fontSize = 72;
    std::string foreground = "#ffffff";
    std::string background = "#000000";
    std::string aspect = "16:9";

    // [export]
    int fps = 30;
    std::string resolution = "1920x1080";
    std::string format = "mp4";           // mp4, avi, mov, png_sequence
    bool transparent = false;
    std::string outputPath = "wordpulse_export";

    // [metronome]
    bool clickEnabled = true;
    float clickVolume = 0.5f;
    bool countIn = false;
    std::string audioBackend;             // "" = auto, "jack", "alsa"

    // [tui]
    int tuiRefreshMs = 33;

    // CLI-only fields
    std::string configPath;               // --config override
    std::string textFile;
    std::string inlineWords;
    std::string exportPath;               // Set = headless export
    bool showHelp = false;

    /// Load config from a TOML file; an empty path means configFilePath().
    /// Missing file or missing fields silently use defaults; invalid values
    /// warn on stderr and keep the default.
    static Config load(const std::string& path = {});

    /// Returns the path to the config file.
    static std::string configFilePath();

    /// Value of --config in argv, or empty
    static std::string findConfigArg(int argc, char* argv[]);

    /// Parse CLI arguments, mutating this config in-place.
    /// Returns true if the program should continue, false if it should exit.
    /// Sets exitCode to the exit code when returning false.
    bool parseArgs(int argc, char* argv[], int& exitCode);

    /// Words from --words, else --text. An unreadable file is a resource error.
    Status loadWords(WordSequence& out) const;

    /// Build the immutable session snapshot; the start index is clamped to
    /// the word list. Malformed tokens are configuration errors.
    Status toSession(const WordSequence& words, SessionSettings& out) const;

    static void printUsage(const char* argv0);
};

} // namespace wordpulse
