#include "export/FrameSink.h"
#include "export/ImageSequenceSink.h"
#include "export/VideoFileSink.h"

namespace wordpulse {

namespace {

std::string withExtension(const std::string& path, ExportFormat format) {
    juce::File file(juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path)));
    if (file.getFileExtension().isNotEmpty()) return path;
    switch (format) {
        case ExportFormat::Mp4: return path + ".mp4";
        case ExportFormat::Avi: return path + ".avi";
        case ExportFormat::Mov: return path + ".mov";
        case ExportFormat::PngSequence: break;
    }
    return path;
}

} // namespace

std::unique_ptr<FrameSink> makeFrameSink(const ExportSettings& exportSettings,
                                         const std::string& path) {
    if (exportSettings.format == ExportFormat::PngSequence)
        return std::make_unique<ImageSequenceSink>(path);
    return std::make_unique<VideoFileSink>(exportSettings,
                                           withExtension(path, exportSettings.format));
}

} // namespace wordpulse
