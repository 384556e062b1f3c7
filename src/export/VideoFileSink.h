#pragma once

#include "export/FrameSink.h"

#include <cstdint>
#include <vector>

struct AVCodecContext;
struct AVFormatContext;
struct AVFrame;
struct AVPacket;
struct AVStream;
struct SwsContext;

namespace wordpulse {

/// FFmpeg video encoder.
///
/// mp4/mov: MPEG-4 Part 2 (mp4v), yuv420p. avi: MPEG-4 Part 2 tagged XVID.
/// With a transparent background (mov/avi only) frames go through the PNG
/// codec as rgba so the alpha channel survives.
class VideoFileSink : public FrameSink {
public:
    VideoFileSink(const ExportSettings& exportSettings, std::string path);
    ~VideoFileSink() override;

    VideoFileSink(const VideoFileSink&) = delete;
    VideoFileSink& operator=(const VideoFileSink&) = delete;

    Status open() override;
    Status write(const juce::Image& frame) override;
    Status close() override;

    /// Release the encoder and delete the partial file
    void abort() override;

    std::string path() const override { return path_; }

    int64_t framesWritten() const { return frameCount_; }

private:
    Status drainPackets();
    void release();
    void removePartialFile();
    Status ffmpegError(const char* what, int err) const;

    ExportSettings settings_;
    std::string path_;
    bool alpha_;

    AVFormatContext* format_ = nullptr;
    AVCodecContext* encoder_ = nullptr;
    AVStream* stream_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* packet_ = nullptr;
    SwsContext* sws_ = nullptr;

    std::vector<uint8_t> packed_;   // Straight (non-premultiplied) RGB24 or RGBA
    int64_t frameCount_ = 0;
    bool open_ = false;
};

} // namespace wordpulse
