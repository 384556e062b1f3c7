#include "core/Settings.h"
#include "core/WordSequence.h"

#include <cstdlib>

namespace wordpulse {

ResolvedTiming resolveTiming(const TimingSettings& timing) {
    ResolvedTiming r;
    double bpm = static_cast<double>(timing.bpm);
    r.word = noteToSeconds(timing.wordNote, bpm);
    r.fadeIn = noteToSeconds(timing.fadeInNote, bpm);
    r.fadeOut = noteToSeconds(timing.fadeOutNote, bpm);
    r.gap = noteToSeconds(timing.gapNote, bpm);
    if (timing.gapIsNegative) r.gap = -r.gap;
    r.beat = secondsPerBeat(bpm);
    r.bar = barSeconds(timing.timeSigNum, bpm);
    r.beatsPerBar = timing.timeSigNum;
    return r;
}

const char* exportFormatName(ExportFormat format) {
    switch (format) {
        case ExportFormat::Mp4:         return "mp4";
        case ExportFormat::Avi:         return "avi";
        case ExportFormat::Mov:         return "mov";
        case ExportFormat::PngSequence: return "png_sequence";
    }
    return "mp4";
}

bool parseExportFormat(const std::string& text, ExportFormat& out) {
    if (text == "mp4") { out = ExportFormat::Mp4; return true; }
    if (text == "avi") { out = ExportFormat::Avi; return true; }
    if (text == "mov") { out = ExportFormat::Mov; return true; }
    if (text == "png_sequence" || text == "png" || text == "image-sequence") {
        out = ExportFormat::PngSequence;
        return true;
    }
    return false;
}

namespace {

bool parsePositivePair(const std::string& text, char sep, int& a, int& b) {
    auto pos = text.find(sep);
    if (pos == std::string::npos || pos == 0 || pos + 1 >= text.size()) return false;
    std::string first = text.substr(0, pos);
    std::string second = text.substr(pos + 1);
    char* end = nullptr;
    long x = std::strtol(first.c_str(), &end, 10);
    if (*end != '\0') return false;
    long y = std::strtol(second.c_str(), &end, 10);
    if (*end != '\0') return false;
    if (x <= 0 || y <= 0 || x > 16384 || y > 16384) return false;
    a = static_cast<int>(x);
    b = static_cast<int>(y);
    return true;
}

} // namespace

bool parseResolution(const std::string& text, int& width, int& height) {
    return parsePositivePair(text, 'x', width, height);
}

bool parseAspectRatio(const std::string& text, AspectRatio& out) {
    return parsePositivePair(text, ':', out.w, out.h);
}

Status validateSession(const SessionSettings& s, const WordSequence& words,
                       bool requireWords) {
    const auto& t = s.timing;
    if (t.bpm <= 0) {
        return Status::configuration("bpm must be positive (got " + std::to_string(t.bpm) + ")");
    }
    if (t.bpm < 20 || t.bpm > 300) {
        return Status::configuration("bpm " + std::to_string(t.bpm) + " outside 20..300");
    }
    if (t.timeSigNum < 1 || t.timeSigNum > 16) {
        return Status::configuration("time signature numerator must be 1..16");
    }
    if (t.timeSigDen != 2 && t.timeSigDen != 4 && t.timeSigDen != 8 && t.timeSigDen != 16) {
        return Status::configuration("time signature denominator must be 2, 4, 8 or 16");
    }
    if (t.wordNote.isNone()) {
        return Status::configuration("word note value can't be 'none'");
    }
    if (s.loop.loopBars < 1) {
        return Status::configuration("loop bars must be at least 1");
    }
    if (s.loop.loopTimes < 1) {
        return Status::configuration("loop times must be at least 1");
    }
    if (requireWords && words.empty()) {
        return Status::configuration("word list is empty");
    }
    if (!words.empty() && (s.startIndex < 1 || s.startIndex > words.size())) {
        return Status::configuration("start index " + std::to_string(s.startIndex) +
                                     " outside 1.." + std::to_string(words.size()));
    }
    return Status::success();
}

Status validateExport(const ExportSettings& e) {
    if (e.fps < 1 || e.fps > 240) {
        return Status::configuration("export fps must be 1..240");
    }
    if (e.width <= 0 || e.height <= 0) {
        return Status::configuration("export resolution must be positive");
    }
    // yuv420p needs even dimensions
    if (e.format != ExportFormat::PngSequence && !e.transparentBackground &&
        (e.width % 2 != 0 || e.height % 2 != 0)) {
        return Status::configuration("video resolution must have even width and height");
    }
    if (e.transparentBackground && e.format == ExportFormat::Mp4) {
        return Status::configuration("transparent export needs mov, avi or png_sequence");
    }
    return Status::success();
}

} // namespace wordpulse
