#include "export/FrameCompositor.h"
#include "core/Blend.h"

#include <algorithm>

namespace wordpulse {

namespace {

constexpr float kReferenceHeight = 1080.0f;

juce::Font makeFont(const DisplaySettings& display, int height) {
    float size = static_cast<float>(display.fontSize) * static_cast<float>(height) / kReferenceHeight;
    return juce::Font(juce::FontOptions(juce::String(display.fontFamily),
                                        std::max(1.0f, size), juce::Font::bold));
}

} // namespace

FrameCompositor::FrameCompositor(const SessionSettings& settings, const WordSequence& words)
    : words_(words)
    , width_(settings.exportSettings.width)
    , height_(settings.exportSettings.height)
    , transparent_(settings.exportSettings.transparentBackground)
    , foreground_(settings.display.foreground)
    , background_(settings.display.background)
    , font_(makeFont(settings.display, settings.exportSettings.height))
{
}

juce::Image FrameCompositor::render(const DisplayState& display) const {
    // Software image: identical pixels for identical input on every run
    juce::Image image(transparent_ ? juce::Image::ARGB : juce::Image::RGB,
                      width_, height_, true, juce::SoftwareImageType());
    {
        juce::Graphics g(image);

        if (!transparent_)
            g.fillAll(juce::Colour(background_.r, background_.g, background_.b));

        g.setFont(font_);
        if (display.previousWordIndex >= 0)
            drawWord(g, display.previousWordIndex, display.previousOpacity);
        if (display.wordIndex >= 0)
            drawWord(g, display.wordIndex, display.opacity);
    }
    return image;
}

void FrameCompositor::drawWord(juce::Graphics& g, int wordIndex, double opacity) const {
    if (opacity <= 0.0 || wordIndex >= words_.size()) return;

    if (transparent_) {
        g.setColour(juce::Colour(foreground_.r, foreground_.g, foreground_.b,
                                 alphaFor(opacity)));
    } else {
        Rgb c = blend(foreground_, background_, opacity);
        g.setColour(juce::Colour(c.r, c.g, c.b));
    }

    g.drawText(juce::String::fromUTF8(words_.at(wordIndex).c_str()),
               juce::Rectangle<int>(0, 0, width_, height_),
               juce::Justification::centred, false);
}

} // namespace wordpulse
