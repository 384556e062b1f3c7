#include "export/VideoFileSink.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace wordpulse {

namespace {

const char* muxerName(ExportFormat format) {
    switch (format) {
        case ExportFormat::Mp4: return "mp4";
        case ExportFormat::Avi: return "avi";
        case ExportFormat::Mov: return "mov";
        case ExportFormat::PngSequence: break;
    }
    return nullptr;
}

} // namespace

VideoFileSink::VideoFileSink(const ExportSettings& exportSettings, std::string path)
    : settings_(exportSettings)
    , path_(std::move(path))
    , alpha_(exportSettings.transparentBackground)
{
}

VideoFileSink::~VideoFileSink() {
    if (open_) abort();
    release();
}

Status VideoFileSink::ffmpegError(const char* what, int err) const {
    char buf[256];
    av_strerror(err, buf, sizeof(buf));
    return Status::resource(std::string(what) + " (" + path_ + "): " + buf);
}

Status VideoFileSink::open() {
    const char* muxer = muxerName(settings_.format);
    if (!muxer) return Status::configuration("not a video format");
    if (alpha_ && settings_.format == ExportFormat::Mp4)
        return Status::configuration("transparent background needs mov, avi or png_sequence");

    int err = avformat_alloc_output_context2(&format_, nullptr, muxer, path_.c_str());
    if (err < 0 || !format_) return ffmpegError("cannot create output context", err);

    const AVCodecID codecId = alpha_ ? AV_CODEC_ID_PNG : AV_CODEC_ID_MPEG4;
    const AVCodec* codec = avcodec_find_encoder(codecId);
    if (!codec) {
        release();
        return Status::resource(std::string("encoder unavailable: ") + avcodec_get_name(codecId));
    }

    stream_ = avformat_new_stream(format_, nullptr);
    encoder_ = avcodec_alloc_context3(codec);
    if (!stream_ || !encoder_) {
        release();
        return Status::resource("out of memory allocating encoder");
    }

    encoder_->width = settings_.width;
    encoder_->height = settings_.height;
    encoder_->pix_fmt = alpha_ ? AV_PIX_FMT_RGBA : AV_PIX_FMT_YUV420P;
    encoder_->time_base = AVRational{1, settings_.fps};
    encoder_->framerate = AVRational{settings_.fps, 1};
    encoder_->gop_size = settings_.fps;
    if (!alpha_) {
        encoder_->bit_rate = static_cast<int64_t>(settings_.width) * settings_.height *
                             settings_.fps / 6;
        if (settings_.format == ExportFormat::Avi)
            encoder_->codec_tag = MKTAG('X', 'V', 'I', 'D');
    }
    if (format_->oformat->flags & AVFMT_GLOBALHEADER)
        encoder_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    err = avcodec_open2(encoder_, codec, nullptr);
    if (err < 0) {
        release();
        return ffmpegError("cannot open encoder", err);
    }

    avcodec_parameters_from_context(stream_->codecpar, encoder_);
    stream_->time_base = encoder_->time_base;

    frame_ = av_frame_alloc();
    packet_ = av_packet_alloc();
    if (!frame_ || !packet_) {
        release();
        return Status::resource("out of memory allocating frame");
    }
    frame_->format = encoder_->pix_fmt;
    frame_->width = encoder_->width;
    frame_->height = encoder_->height;
    err = av_frame_get_buffer(frame_, 0);
    if (err < 0) {
        release();
        return ffmpegError("cannot allocate frame buffer", err);
    }

    if (!alpha_) {
        sws_ = sws_getContext(settings_.width, settings_.height, AV_PIX_FMT_RGB24,
                              settings_.width, settings_.height, AV_PIX_FMT_YUV420P,
                              SWS_BILINEAR, nullptr, nullptr, nullptr);
        if (!sws_) {
            release();
            return Status::resource("cannot create colour converter");
        }
    }
    packed_.assign(static_cast<size_t>(settings_.width) * settings_.height * (alpha_ ? 4 : 3), 0);

    if (!(format_->oformat->flags & AVFMT_NOFILE)) {
        err = avio_open(&format_->pb, path_.c_str(), AVIO_FLAG_WRITE);
        if (err < 0) {
            release();
            return ffmpegError("cannot open output file", err);
        }
    }

    err = avformat_write_header(format_, nullptr);
    if (err < 0) {
        release();
        removePartialFile();
        return ffmpegError("cannot write header", err);
    }

    frameCount_ = 0;
    open_ = true;
    return Status::success();
}

Status VideoFileSink::write(const juce::Image& image) {
    if (!open_) return Status::resource("video file not open");
    if (image.getWidth() != settings_.width || image.getHeight() != settings_.height)
        return Status::resource("frame size does not match the video size");

    // JUCE stores premultiplied BGRA/BGR; read back straight colour
    const int channels = alpha_ ? 4 : 3;
    const juce::Image::BitmapData bitmap(image, juce::Image::BitmapData::readOnly);
    for (int y = 0; y < settings_.height; ++y) {
        uint8_t* row = packed_.data() + static_cast<size_t>(y) * settings_.width * channels;
        for (int x = 0; x < settings_.width; ++x) {
            const juce::Colour c = bitmap.getPixelColour(x, y);
            uint8_t* px = row + static_cast<size_t>(x) * channels;
            px[0] = c.getRed();
            px[1] = c.getGreen();
            px[2] = c.getBlue();
            if (alpha_) px[3] = c.getAlpha();
        }
    }

    int err = av_frame_make_writable(frame_);
    if (err < 0) return ffmpegError("frame not writable", err);

    if (alpha_) {
        const size_t rowBytes = static_cast<size_t>(settings_.width) * 4;
        for (int y = 0; y < settings_.height; ++y)
            std::memcpy(frame_->data[0] + static_cast<size_t>(y) * frame_->linesize[0],
                        packed_.data() + static_cast<size_t>(y) * rowBytes, rowBytes);
    } else {
        const uint8_t* src[1] = {packed_.data()};
        const int srcStride[1] = {settings_.width * 3};
        sws_scale(sws_, src, srcStride, 0, settings_.height, frame_->data, frame_->linesize);
    }

    frame_->pts = frameCount_;
    err = avcodec_send_frame(encoder_, frame_);
    if (err < 0) return ffmpegError("encoding failed", err);

    ++frameCount_;
    return drainPackets();
}

Status VideoFileSink::drainPackets() {
    for (;;) {
        int err = avcodec_receive_packet(encoder_, packet_);
        if (err == AVERROR(EAGAIN) || err == AVERROR_EOF) return Status::success();
        if (err < 0) return ffmpegError("encoding failed", err);

        av_packet_rescale_ts(packet_, encoder_->time_base, stream_->time_base);
        packet_->stream_index = stream_->index;
        err = av_interleaved_write_frame(format_, packet_);
        av_packet_unref(packet_);
        if (err < 0) return ffmpegError("write failed", err);
    }
}

Status VideoFileSink::close() {
    if (!open_) return Status::success();

    int err = avcodec_send_frame(encoder_, nullptr);
    if (err < 0) {
        Status s = ffmpegError("flushing encoder failed", err);
        abort();
        return s;
    }
    Status drained = drainPackets();
    if (!drained.ok()) {
        abort();
        return drained;
    }

    err = av_write_trailer(format_);
    open_ = false;
    release();
    if (err < 0) return ffmpegError("cannot finalise file", err);
    return Status::success();
}

void VideoFileSink::abort() {
    bool hadFile = open_;
    open_ = false;
    release();
    if (hadFile) removePartialFile();
}

void VideoFileSink::removePartialFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec)
        fprintf(stderr, "VideoFileSink: could not remove partial file %s: %s\n",
                path_.c_str(), ec.message().c_str());
}

void VideoFileSink::release() {
    if (sws_) { sws_freeContext(sws_); sws_ = nullptr; }
    if (packet_) { av_packet_free(&packet_); }
    if (frame_) { av_frame_free(&frame_); }
    if (encoder_) { avcodec_free_context(&encoder_); }
    if (format_) {
        if (format_->pb && !(format_->oformat->flags & AVFMT_NOFILE))
            avio_closep(&format_->pb);
        avformat_free_context(format_);
        format_ = nullptr;
    }
    stream_ = nullptr;
}

} // namespace wordpulse
