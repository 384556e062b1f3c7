#pragma once

#include "core/Settings.h"
#include "core/Status.h"

#include <juce_graphics/juce_graphics.h>

#include <memory>
#include <string>

namespace wordpulse {

/// Destination for rendered frames.
/// Call order: open(), write() per frame, then close() on success or
/// abort() on failure/cancel. abort() releases everything the sink holds.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual Status open() = 0;
    virtual Status write(const juce::Image& frame) = 0;
    virtual Status close() = 0;
    virtual void abort() = 0;

    /// Output location, for messages
    virtual std::string path() const = 0;
};

/// Video file or numbered PNG directory, chosen from the export format.
/// The path gets the format's extension when it has none (except PNG dirs).
std::unique_ptr<FrameSink> makeFrameSink(const ExportSettings& exportSettings,
                                         const std::string& path);

} // namespace wordpulse
