#include "export/ImageSequenceSink.h"

namespace wordpulse {

ImageSequenceSink::ImageSequenceSink(std::string directory)
    : directory_(std::move(directory))
{
    dir_ = juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(directory_));
}

Status ImageSequenceSink::open() {
    if (dir_.existsAsFile())
        return Status::resource("'" + directory_ + "' exists and is not a directory");
    if (!dir_.isDirectory()) {
        juce::Result r = dir_.createDirectory();
        if (r.failed())
            return Status::resource("cannot create '" + directory_ + "': " +
                                    r.getErrorMessage().toStdString());
    }
    frameCount_ = 0;
    open_ = true;
    return Status::success();
}

Status ImageSequenceSink::write(const juce::Image& frame) {
    if (!open_) return Status::resource("image sequence not open");

    juce::File file = dir_.getChildFile(
        juce::String::formatted("frame_%06lld", static_cast<long long>(frameCount_)) + ".png");
    file.deleteFile();

    juce::FileOutputStream stream(file);
    if (!stream.openedOk())
        return Status::resource("cannot write " + file.getFullPathName().toStdString());

    juce::PNGImageFormat png;
    if (!png.writeImageToStream(frame, stream))
        return Status::resource("PNG encoding failed for " + file.getFileName().toStdString());

    stream.flush();
    ++frameCount_;
    return Status::success();
}

Status ImageSequenceSink::close() {
    open_ = false;
    return Status::success();
}

void ImageSequenceSink::abort() {
    // Frames already written stay on disk
    open_ = false;
}

} // namespace wordpulse
