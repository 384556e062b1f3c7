#include "config/Config.h"
#include "core/Blend.h"
#include "core/TimeModel.h"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstdio>
#include <filesystem>
#include <string>

namespace wordpulse {

namespace {

void readInt(const toml::table& tbl, const char* section, const char* key,
             int lo, int hi, int& field) {
    if (auto v = tbl[section][key].value<int64_t>()) {
        if (*v >= lo && *v <= hi) {
            field = static_cast<int>(*v);
        } else {
            fprintf(stderr, "Warning: invalid %s.%s %lld, using default %d\n",
                    section, key, static_cast<long long>(*v), field);
        }
    }
}

void readBool(const toml::table& tbl, const char* section, const char* key, bool& field) {
    if (auto v = tbl[section][key].value<bool>()) {
        field = *v;
    }
}

void readNote(const toml::table& tbl, const char* section, const char* key,
              bool allowNone, std::string& field) {
    if (auto v = tbl[section][key].value<std::string>()) {
        auto note = parseNoteValue(*v);
        if (note && (allowNone || !note->isNone())) {
            field = note->token;
        } else {
            fprintf(stderr, "Warning: invalid %s.%s '%s', using default '%s'\n",
                    section, key, v->c_str(), field.c_str());
        }
    }
}

bool isLoopMode(const std::string& s) {
    return s == "words" || s == "bars";
}

bool parseInt(const char* text, int& out) {
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0') return false;
    if (errno == ERANGE || v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

constexpr int kMinBpm = 20;
constexpr int kMaxBpm = 300;

// Positive tempos outside the supported range are pulled to the nearest end
int clampBpm(int bpm) {
    if (bpm <= 0) return bpm;
    int clamped = std::clamp(bpm, kMinBpm, kMaxBpm);
    if (clamped != bpm) {
        fprintf(stderr, "Warning: bpm %d outside %d..%d, using %d\n",
                bpm, kMinBpm, kMaxBpm, clamped);
    }
    return clamped;
}

} // namespace

std::string Config::configFilePath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/wordpulse/config.toml";
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/wordpulse/config.toml";
    }
    return {};
}

std::string Config::findConfigArg(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") return argv[i + 1];
    }
    return {};
}

Config Config::load(const std::string& overridePath) {
    Config cfg;

    std::string path = overridePath.empty() ? configFilePath() : overridePath;
    cfg.configPath = overridePath;
    if (path.empty() || !std::filesystem::exists(path)) {
        if (!overridePath.empty())
            fprintf(stderr, "Warning: config file %s not found, using defaults\n", path.c_str());
        return cfg;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        fprintf(stderr, "Warning: failed to parse %s: %s\n",
                path.c_str(), err.what());
        return cfg;
    }

    // [timing]
    if (auto v = tbl["timing"]["bpm"].value<int64_t>()) {
        if (*v > 0) {
            cfg.bpm = clampBpm(static_cast<int>(std::min<int64_t>(*v, INT_MAX)));
        } else {
            fprintf(stderr, "Warning: invalid timing.bpm %lld, using default %d\n",
                    static_cast<long long>(*v), cfg.bpm);
        }
    }
    if (auto v = tbl["timing"]["time_signature"].value<std::string>()) {
        int num = 0, den = 0;
        if (std::sscanf(v->c_str(), "%d/%d", &num, &den) == 2 && num >= 1 && num <= 16 &&
            (den == 2 || den == 4 || den == 8 || den == 16)) {
            cfg.timeSigNum = num;
            cfg.timeSigDen = den;
        } else {
            fprintf(stderr, "Warning: invalid timing.time_signature '%s', using default %d/%d\n",
                    v->c_str(), cfg.timeSigNum, cfg.timeSigDen);
        }
    }
    readNote(tbl, "timing", "word", false, cfg.wordNote);
    readNote(tbl, "timing", "fade_in", true, cfg.fadeInNote);
    readNote(tbl, "timing", "fade_out", true, cfg.fadeOutNote);
    readNote(tbl, "timing", "gap", true, cfg.gapNote);
    readBool(tbl, "timing", "negative_gap", cfg.gapNegative);

    // [loop]
    readBool(tbl, "loop", "enabled", cfg.loopEnabled);
    if (auto v = tbl["loop"]["mode"].value<std::string>()) {
        if (isLoopMode(*v)) {
            cfg.loopMode = *v;
        } else {
            fprintf(stderr, "Warning: invalid loop.mode '%s', using default '%s'\n",
                    v->c_str(), cfg.loopMode.c_str());
        }
    }
    readInt(tbl, "loop", "bars", 1, 64, cfg.loopBars);
    readInt(tbl, "loop", "times", 1, 100, cfg.loopTimes);
    readBool(tbl, "loop", "infinite", cfg.loopInfinite);
    readInt(tbl, "loop", "start_index", 1, 1000000, cfg.startIndex);

    // [display]
    if (auto v = tbl["display"]["font"].value<std::string>()) {
        cfg.fontFamily = *v;
    }
    readInt(tbl, "display", "font_size", 8, 400, cfg.fontSize);
    if (auto v = tbl["display"]["foreground"].value<std::string>()) {
        if (parseRgb(*v)) {
            cfg.foreground = *v;
        } else {
            fprintf(stderr, "Warning: invalid display.foreground '%s', using default '%s'\n",
                    v->c_str(), cfg.foreground.c_str());
        }
    }
    if (auto v = tbl["display"]["background"].value<std::string>()) {
        if (parseRgb(*v)) {
            cfg.background = *v;
        } else {
            fprintf(stderr, "Warning: invalid display.background '%s', using default '%s'\n",
                    v->c_str(), cfg.background.c_str());
        }
    }
    if (auto v = tbl["display"]["aspect"].value<std::string>()) {
        AspectRatio ar;
        if (parseAspectRatio(*v, ar)) {
            cfg.aspect = *v;
        } else {
            fprintf(stderr, "Warning: invalid display.aspect '%s', using default '%s'\n",
                    v->c_str(), cfg.aspect.c_str());
        }
    }

    // [export]
    readInt(tbl, "export", "fps", 1, 240, cfg.fps);
    if (auto v = tbl["export"]["resolution"].value<std::string>()) {
        int w = 0, h = 0;
        if (parseResolution(*v, w, h)) {
            cfg.resolution = *v;
        } else {
            fprintf(stderr, "Warning: invalid export.resolution '%s', using default '%s'\n",
                    v->c_str(), cfg.resolution.c_str());
        }
    }
    if (auto v = tbl["export"]["format"].value<std::string>()) {
        ExportFormat f;
        if (parseExportFormat(*v, f)) {
            cfg.format = *v;
        } else {
            fprintf(stderr, "Warning: invalid export.format '%s', using default '%s'\n",
                    v->c_str(), cfg.format.c_str());
        }
    }
    readBool(tbl, "export", "transparent", cfg.transparent);
    if (auto v = tbl["export"]["path"].value<std::string>()) {
        if (!v->empty()) cfg.outputPath = *v;
    }

    // [metronome]
    readBool(tbl, "metronome", "click_enabled", cfg.clickEnabled);
    if (auto v = tbl["metronome"]["click_volume"].value<double>()) {
        if (*v >= 0.0 && *v <= 1.0) {
            cfg.clickVolume = static_cast<float>(*v);
        } else {
            fprintf(stderr, "Warning: invalid metronome.click_volume %.2f, using default %.2f\n",
                    *v, static_cast<double>(cfg.clickVolume));
        }
    }
    readBool(tbl, "metronome", "count_in", cfg.countIn);
    if (auto v = tbl["metronome"]["backend"].value<std::string>()) {
        if (*v == "jack" || *v == "alsa" || v->empty()) {
            cfg.audioBackend = *v;
        } else {
            fprintf(stderr, "Warning: invalid metronome.backend '%s', using auto\n", v->c_str());
        }
    }

    // [tui]
    readInt(tbl, "tui", "refresh_ms", 10, 1000, cfg.tuiRefreshMs);

    return cfg;
}

bool Config::parseArgs(int argc, char* argv[], int& exitCode) {
    auto value = [&](int& i, const char* what) -> const char* {
        if (i + 1 < argc) return argv[++i];
        fprintf(stderr, "%s requires %s argument\n", argv[i], what);
        exitCode = 1;
        return nullptr;
    };
    auto number = [&](int& i, int& field) -> bool {
        const char* flag = argv[i];
        const char* v = value(i, "a number");
        if (!v) return false;
        if (!parseInt(v, field)) {
            fprintf(stderr, "%s: '%s' is not a number\n", flag, v);
            exitCode = 1;
            return false;
        }
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        const char* v = nullptr;

        if (arg == "--config") {
            if (!(v = value(i, "a file"))) return false;
            configPath = v;
        } else if (arg == "--text") {
            if (!(v = value(i, "a file"))) return false;
            textFile = v;
        } else if (arg == "--words") {
            if (!(v = value(i, "a text"))) return false;
            inlineWords = v;
        } else if (arg == "--export") {
            if (!(v = value(i, "an output path"))) return false;
            exportPath = v;
            outputPath = v;
        } else if (arg == "--format") {
            if (!(v = value(i, "a format"))) return false;
            format = v;
        } else if (arg == "--fps") {
            if (!number(i, fps)) return false;
        } else if (arg == "--resolution") {
            if (!(v = value(i, "WxH"))) return false;
            resolution = v;
        } else if (arg == "--transparent") {
            transparent = true;
        } else if (arg == "--bpm") {
            if (!number(i, bpm)) return false;
        } else if (arg == "--time-sig") {
            if (!(v = value(i, "N/D"))) return false;
            if (std::sscanf(v, "%d/%d", &timeSigNum, &timeSigDen) != 2) {
                fprintf(stderr, "--time-sig: '%s' is not N/D\n", v);
                exitCode = 1;
                return false;
            }
        } else if (arg == "--word") {
            if (!(v = value(i, "a note value"))) return false;
            wordNote = v;
        } else if (arg == "--fade-in") {
            if (!(v = value(i, "a note value"))) return false;
            fadeInNote = v;
        } else if (arg == "--fade-out") {
            if (!(v = value(i, "a note value"))) return false;
            fadeOutNote = v;
        } else if (arg == "--gap") {
            if (!(v = value(i, "a note value"))) return false;
            gapNote = v;
        } else if (arg == "--negative-gap") {
            gapNegative = true;
        } else if (arg == "--loop") {
            if (!(v = value(i, "words|bars"))) return false;
            if (!isLoopMode(v)) {
                fprintf(stderr, "--loop: expected 'words' or 'bars', got '%s'\n", v);
                exitCode = 1;
                return false;
            }
            loopEnabled = true;
            loopMode = v;
        } else if (arg == "--loop-bars") {
            if (!number(i, loopBars)) return false;
        } else if (arg == "--loop-times") {
            if (!number(i, loopTimes)) return false;
        } else if (arg == "--infinite") {
            loopInfinite = true;
        } else if (arg == "--start") {
            if (!number(i, startIndex)) return false;
        } else if (arg == "--count-in") {
            countIn = true;
        } else if (arg == "--no-click") {
            clickEnabled = false;
        } else if (arg == "--volume") {
            if (!(v = value(i, "a volume"))) return false;
            clickVolume = static_cast<float>(std::atof(v));
        } else if (arg == "--font") {
            if (!(v = value(i, "a font family"))) return false;
            fontFamily = v;
        } else if (arg == "--font-size") {
            if (!number(i, fontSize)) return false;
        } else if (arg == "--fg") {
            if (!(v = value(i, "a colour"))) return false;
            foreground = v;
        } else if (arg == "--bg") {
            if (!(v = value(i, "a colour"))) return false;
            background = v;
        } else if (arg == "--aspect") {
            if (!(v = value(i, "W:H"))) return false;
            aspect = v;
        } else if (arg == "--jack") {
            audioBackend = "jack";
        } else if (arg == "--alsa") {
            audioBackend = "alsa";
        } else if (arg == "--help" || arg == "-h") {
            showHelp = true;
            exitCode = 0;
            return false;
        } else if (arg[0] != '-' && textFile.empty()) {
            textFile = arg;
        } else {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            exitCode = 1;
            return false;
        }
    }
    return true;
}

Status Config::loadWords(WordSequence& out) const {
    if (!inlineWords.empty()) {
        out = WordSequence::fromText(inlineWords);
        return Status::success();
    }
    if (textFile.empty()) {
        out = WordSequence();
        return Status::success();
    }
    auto loaded = WordSequence::loadFile(textFile);
    if (!loaded) return Status::resource("cannot read text file '" + textFile + "'");
    out = std::move(*loaded);
    return Status::success();
}

Status Config::toSession(const WordSequence& words, SessionSettings& out) const {
    SessionSettings s;

    auto note = [](const std::string& token, const char* what, NoteValue& field) -> Status {
        auto parsed = parseNoteValue(token);
        if (!parsed) return Status::configuration(std::string("unknown ") + what +
                                                  " note value '" + token + "'");
        field = *parsed;
        return Status::success();
    };

    s.timing.bpm = clampBpm(bpm);
    s.timing.timeSigNum = timeSigNum;
    s.timing.timeSigDen = timeSigDen;
    Status st = note(wordNote, "word", s.timing.wordNote);
    if (st.ok()) st = note(fadeInNote, "fade-in", s.timing.fadeInNote);
    if (st.ok()) st = note(fadeOutNote, "fade-out", s.timing.fadeOutNote);
    if (st.ok()) st = note(gapNote, "gap", s.timing.gapNote);
    if (!st.ok()) return st;
    s.timing.gapIsNegative = gapNegative;

    if (!isLoopMode(loopMode))
        return Status::configuration("loop mode must be 'words' or 'bars'");
    s.loop.enabled = loopEnabled;
    s.loop.mode = loopMode == "bars" ? LoopMode::ByBars : LoopMode::AllWords;
    s.loop.loopBars = loopBars;
    s.loop.loopTimes = loopTimes;
    s.loop.infinite = loopInfinite;

    s.display.fontFamily = fontFamily;
    s.display.fontSize = fontSize;
    auto fg = parseRgb(foreground);
    if (!fg) return Status::configuration("malformed foreground colour '" + foreground + "'");
    auto bg = parseRgb(background);
    if (!bg) return Status::configuration("malformed background colour '" + background + "'");
    s.display.foreground = *fg;
    s.display.background = *bg;
    if (!parseAspectRatio(aspect, s.display.aspect))
        return Status::configuration("malformed aspect ratio '" + aspect + "'");

    s.exportSettings.fps = fps;
    if (!parseResolution(resolution, s.exportSettings.width, s.exportSettings.height))
        return Status::configuration("malformed resolution '" + resolution + "'");
    if (!parseExportFormat(format, s.exportSettings.format))
        return Status::configuration("unknown export format '" + format + "'");
    s.exportSettings.transparentBackground = transparent;

    s.startIndex = words.clampStartIndex(startIndex);
    s.countIn = countIn;
    s.metronomeEnabled = clickEnabled;
    s.clickVolume = std::min(1.0f, std::max(0.0f, clickVolume));

    Status valid = validateSession(s, words, false);
    if (!valid.ok()) return valid;

    out = s;
    return Status::success();
}

void Config::printUsage(const char* argv0) {
    fprintf(stderr,
        "Usage: %s [options] [TEXT_FILE]\n"
        "\n"
        "Input:\n"
        "  --text FILE          Words from a UTF-8 text file\n"
        "  --words \"...\"        Words given inline\n"
        "  --config FILE        Config file (default: %s)\n"
        "\n"
        "Timing:\n"
        "  --bpm N              Tempo, 20..300 (default 120)\n"
        "  --time-sig N/D       Time signature (default 4/4)\n"
        "  --word NOTE          Word duration (default 1/4)\n"
        "  --fade-in NOTE       Fade-in (default 1/16, 'none' to disable)\n"
        "  --fade-out NOTE      Fade-out (default 1/16)\n"
        "  --gap NOTE           Blank gap between words (default none)\n"
        "  --negative-gap       Cross-fade words instead of gapping\n"
        "  NOTE is one of 1/32 1/16 1/8 1/4 1/2 1 2 4 8 16 none\n"
        "\n"
        "Looping:\n"
        "  --loop words|bars    Loop the word list or a fixed number of bars\n"
        "  --loop-bars N        Bars per loop in bars mode (default 4)\n"
        "  --loop-times N       Repetitions (default 2)\n"
        "  --infinite           Loop until stopped (exports once)\n"
        "  --start N            First word, 1-based\n"
        "\n"
        "Metronome:\n"
        "  --count-in           One bar of clicks before the first word\n"
        "  --no-click           Silence the click\n"
        "  --volume V           Click volume 0..1 (default 0.5)\n"
        "  --jack, --alsa       Audio backend (default: auto)\n"
        "\n"
        "Display:\n"
        "  --font NAME          Font family\n"
        "  --font-size N        Points at 1080 lines (default 72)\n"
        "  --fg COLOUR          Foreground, #rrggbb or r,g,b\n"
        "  --bg COLOUR          Background\n"
        "  --aspect W:H         16:9, 4:3, 1:1, 9:16 or 21:9\n"
        "\n"
        "Export (headless when --export is given):\n"
        "  --export PATH        Render to PATH and exit\n"
        "  --format F           mp4, avi, mov or png_sequence\n"
        "  --fps N              Frames per second (default 30)\n"
        "  --resolution WxH     Frame size (default 1920x1080)\n"
        "  --transparent        Transparent background (mov, avi, png_sequence)\n"
        "\n"
        "  -h, --help           Show this help\n",
        argv0, configFilePath().c_str());
}

} // namespace wordpulse
