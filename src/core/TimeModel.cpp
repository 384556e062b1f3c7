#include "core/TimeModel.h"

#include <array>
#include <utility>

namespace wordpulse {

namespace {

// Quarter-note multiples for each supported token
const std::array<std::pair<const char*, double>, 10> kNoteFactors = {{
    {"1/32", 0.125},
    {"1/16", 0.25},
    {"1/8",  0.5},
    {"1/4",  1.0},
    {"1/2",  2.0},
    {"1",    4.0},
    {"2",    8.0},
    {"4",    16.0},
    {"8",    32.0},
    {"16",   64.0},
}};

} // namespace

std::optional<NoteValue> parseNoteValue(const std::string& token) {
    if (token == "none" || token == "0" || token.empty()) {
        return NoteValue::none();
    }
    for (const auto& [name, factor] : kNoteFactors) {
        if (token == name) {
            return NoteValue{token, factor};
        }
    }
    return std::nullopt;
}

const std::vector<std::string>& noteTokens() {
    static const std::vector<std::string> tokens = [] {
        std::vector<std::string> out;
        for (const auto& entry : kNoteFactors) out.emplace_back(entry.first);
        return out;
    }();
    return tokens;
}

double secondsPerBeat(double bpm) {
    return 60.0 / bpm;
}

double noteToSeconds(const NoteValue& note, double bpm) {
    if (note.isNone()) return 0.0;
    return note.quarterNotes * 60.0 / bpm;
}

double noteToSeconds(const std::string& token, double bpm) {
    auto note = parseNoteValue(token);
    if (!note) return 0.0;
    return noteToSeconds(*note, bpm);
}

double barSeconds(int timeSigNum, double bpm) {
    return timeSigNum * 60.0 / bpm;
}

} // namespace wordpulse
