#pragma once

#include <optional>
#include <string>
#include <vector>

namespace wordpulse {

/// A musical duration token such as "1/4", expressed in quarter notes.
/// "none" (or "0") is a zero-length value used for absent fades and gaps.
struct NoteValue {
    std::string token = "none";
    double quarterNotes = 0.0;

    bool isNone() const { return quarterNotes <= 0.0; }

    static NoteValue none() { return {}; }
};

/// Parse a note token. Returns nullopt for unknown tokens.
std::optional<NoteValue> parseNoteValue(const std::string& token);

/// All non-none tokens, shortest first ("1/32" ... "16")
const std::vector<std::string>& noteTokens();

/// Seconds for one beat (a quarter note) at the given tempo
double secondsPerBeat(double bpm);

/// Duration of a note value at the given tempo. "none" is always 0.
double noteToSeconds(const NoteValue& note, double bpm);

/// Convenience overload for raw tokens. Unknown tokens yield 0; callers
/// validate tokens at the configuration boundary before getting here.
double noteToSeconds(const std::string& token, double bpm);

/// Duration of one bar: timeSigNum beats
double barSeconds(int timeSigNum, double bpm);

} // namespace wordpulse
