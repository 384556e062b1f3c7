#include "core/Blend.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace wordpulse {

namespace {

uint8_t mixChannel(uint8_t fg, uint8_t bg, double opacity) {
    double v = std::round(fg * opacity + bg * (1.0 - opacity));
    return static_cast<uint8_t>(std::clamp(v, 0.0, 255.0));
}

bool parseByte(const std::string& s, uint8_t& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (*end != '\0' || v < 0 || v > 255) return false;
    out = static_cast<uint8_t>(v);
    return true;
}

} // namespace

Rgb blend(Rgb foreground, Rgb background, double opacity) {
    double op = std::clamp(opacity, 0.0, 1.0);
    return {mixChannel(foreground.r, background.r, op),
            mixChannel(foreground.g, background.g, op),
            mixChannel(foreground.b, background.b, op)};
}

uint8_t alphaFor(double opacity) {
    double op = std::clamp(opacity, 0.0, 1.0);
    return static_cast<uint8_t>(std::round(255.0 * op));
}

std::optional<Rgb> parseRgb(const std::string& text) {
    if (text.find(',') != std::string::npos) {
        std::istringstream in(text);
        std::string part;
        uint8_t ch[3];
        int n = 0;
        while (std::getline(in, part, ',')) {
            if (n >= 3) return std::nullopt;
            // Tolerate spaces around components
            part.erase(0, part.find_first_not_of(' '));
            part.erase(part.find_last_not_of(' ') + 1);
            if (!parseByte(part, ch[n])) return std::nullopt;
            ++n;
        }
        if (n != 3) return std::nullopt;
        return Rgb{ch[0], ch[1], ch[2]};
    }

    std::string hex = (!text.empty() && text[0] == '#') ? text.substr(1) : text;
    if (hex.size() != 6) return std::nullopt;
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    auto channel = [&hex](size_t pos) {
        return static_cast<uint8_t>(std::strtol(hex.substr(pos, 2).c_str(), nullptr, 16));
    };
    return Rgb{channel(0), channel(2), channel(4)};
}

std::string toHex(Rgb colour) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", colour.r, colour.g, colour.b);
    return buf;
}

} // namespace wordpulse
