#pragma once

#include "export/FrameSink.h"

#include <cstdint>

namespace wordpulse {

/// Writes frame_000000.png, frame_000001.png, ... into a directory,
/// creating the directory when it doesn't exist.
class ImageSequenceSink : public FrameSink {
public:
    explicit ImageSequenceSink(std::string directory);

    Status open() override;
    Status write(const juce::Image& frame) override;
    Status close() override;
    void abort() override;

    std::string path() const override { return directory_; }

    int64_t framesWritten() const { return frameCount_; }

private:
    std::string directory_;
    juce::File dir_;
    int64_t frameCount_ = 0;
    bool open_ = false;
};

} // namespace wordpulse
