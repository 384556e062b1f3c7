#include "export/FrameExporter.h"
#include "export/FrameCompositor.h"
#include "export/FrameSequencer.h"

#include <cstdio>
#include <exception>

namespace wordpulse {

FrameExporter::~FrameExporter() {
    cancel();
    joinWorker();
}

ExportResult FrameExporter::run(const SessionSettings& settings, const WordSequence& words,
                                FrameSink& sink) {
    ExportResult result;
    result.path = sink.path();

    auto fail = [&](Status status) {
        result.status = std::move(status);
        ExportEvent ev;
        ev.type = result.status.kind == ErrorKind::Interrupted ? ExportEventType::Cancelled
                                                               : ExportEventType::Failed;
        ev.status = result.status;
        ev.framesWritten = result.framesWritten;
        ev.text = result.status.describe();
        publish(ev);
        std::lock_guard<std::mutex> lock(resultMutex_);
        lastResult_ = result;
        return result;
    };

    Status valid = validateSession(settings, words, true);
    if (valid.ok()) valid = validateExport(settings.exportSettings);
    if (!valid.ok()) return fail(valid);

    FrameSequencer sequencer(settings, words.size());
    FrameCompositor compositor(settings, words);
    const int64_t total = sequencer.estimateTotalFrames();
    const int iterations = sequencer.iterations();
    const int passLength = sequencer.timeline().passLength();
    const int firstWord = sequencer.timeline().firstWord();

    Status opened = sink.open();
    if (!opened.ok()) return fail(opened);

    ExportEvent started;
    started.type = ExportEventType::Started;
    started.totalFrames = total;
    started.text = "Exporting " + result.path;
    publish(started);

    try {
        FrameDescriptor frame;
        int lastPercent = -1;
        int lastWord = firstWord;

        while (sequencer.next(frame)) {
            if (cancel_.load(std::memory_order_acquire)) {
                sink.abort();
                return fail(Status::interrupted("export cancelled after " +
                                                std::to_string(result.framesWritten) + " frames"));
            }

            Status written = sink.write(compositor.render(frame.display));
            if (!written.ok()) {
                sink.abort();
                written.message += " (" + std::to_string(result.framesWritten) + " frames written)";
                return fail(written);
            }
            ++result.framesWritten;

            if (frame.wordIndex >= 0) lastWord = frame.wordIndex;
            int percent = total > 0 ? static_cast<int>(result.framesWritten * 100 / total) : 100;
            if (percent != lastPercent) {
                lastPercent = percent;
                ExportEvent ev;
                ev.type = ExportEventType::Progress;
                ev.percent = percent;
                ev.framesWritten = result.framesWritten;
                ev.totalFrames = total;
                ev.text = "Loop " + std::to_string(frame.loopIteration + 1) + "/" +
                          std::to_string(iterations) + " - Word " +
                          std::to_string(lastWord - firstWord + 1) + "/" +
                          std::to_string(passLength);
                publish(ev);
            }
        }

        Status closed = sink.close();
        if (!closed.ok()) return fail(closed);
    } catch (const std::exception& e) {
        sink.abort();
        return fail(Status::resource(std::string(e.what()) + " (" +
                                     std::to_string(result.framesWritten) + " frames written)"));
    }

    result.durationSeconds = static_cast<double>(result.framesWritten) / settings.exportSettings.fps;

    ExportEvent done;
    done.type = ExportEventType::Completed;
    done.percent = 100;
    done.framesWritten = result.framesWritten;
    done.totalFrames = total;
    done.durationSeconds = result.durationSeconds;
    done.text = "Exported " + result.path;
    publish(done);

    std::lock_guard<std::mutex> lock(resultMutex_);
    lastResult_ = result;
    return result;
}

Status FrameExporter::start(const SessionSettings& settings, const WordSequence& words,
                            const std::string& path) {
    if (isRunning()) return Status::configuration("an export is already running");

    Status valid = validateSession(settings, words, true);
    if (valid.ok()) valid = validateExport(settings.exportSettings);
    if (!valid.ok()) return valid;
    if (path.empty()) return Status::configuration("no export path given");

    joinWorker();
    sink_ = makeFrameSink(settings.exportSettings, path);
    cancel_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this, settings, words]() {
        // Failures arrive as Failed events
        run(settings, words, *sink_);
        running_.store(false, std::memory_order_release);
    });
    return Status::success();
}

void FrameExporter::wait() {
    joinWorker();
}

ExportResult FrameExporter::lastResult() const {
    std::lock_guard<std::mutex> lock(resultMutex_);
    return lastResult_;
}

void FrameExporter::publish(const ExportEvent& ev) {
    if (!events_.push(ev) && ev.type != ExportEventType::Progress)
        fprintf(stderr, "FrameExporter: event queue full, dropped %s\n", ev.text.c_str());
}

void FrameExporter::joinWorker() {
    if (worker_.joinable()) worker_.join();
}

} // namespace wordpulse
