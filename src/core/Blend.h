#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace wordpulse {

/// 8-bit RGB colour
struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
};

/// Colour of a word drawn at the given opacity over the background.
/// Per channel: round(fg * opacity + bg * (1 - opacity)), opacity clamped to [0, 1].
/// Every renderer (terminal preview, raster export) goes through this.
Rgb blend(Rgb foreground, Rgb background, double opacity);

/// Alpha byte used for a glyph on a transparent background
uint8_t alphaFor(double opacity);

/// Parse "#RRGGBB", "RRGGBB" or "r,g,b". Returns nullopt when malformed.
std::optional<Rgb> parseRgb(const std::string& text);

/// "#rrggbb"
std::string toHex(Rgb colour);

} // namespace wordpulse
