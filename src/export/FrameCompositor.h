#pragma once

#include "core/PlaybackTimeline.h"
#include "core/Settings.h"
#include "core/WordSequence.h"

#include <juce_graphics/juce_graphics.h>

namespace wordpulse {

/// Rasterises a DisplayState into a width x height image.
///
/// Opaque output is RGB filled with the background colour and words drawn
/// in blend(fg, bg, opacity). Transparent output is ARGB with a clear
/// background and words in the foreground colour at alphaFor(opacity).
/// The outgoing word of a cross-dissolve is drawn first.
class FrameCompositor {
public:
    FrameCompositor(const SessionSettings& settings, const WordSequence& words);

    juce::Image render(const DisplayState& display) const;

    int width() const { return width_; }
    int height() const { return height_; }
    bool transparent() const { return transparent_; }

    /// Font height after scaling to the output height
    float fontHeight() const { return font_.getHeight(); }

private:
    void drawWord(juce::Graphics& g, int wordIndex, double opacity) const;

    WordSequence words_;
    int width_;
    int height_;
    bool transparent_;
    Rgb foreground_;
    Rgb background_;
    juce::Font font_;
};

} // namespace wordpulse
