#pragma once

#include "core/PlaybackEvent.h"
#include "core/Settings.h"
#include "core/EventQueue.h"
#include "core/Status.h"
#include "core/WordSequence.h"
#include "export/FrameSink.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace wordpulse {

enum class ExportEventType {
    Started,
    Progress,       // percent, text = "Loop l/t - Word i/n"
    Completed,      // framesWritten, durationSeconds
    Failed,         // status, framesWritten
    Cancelled
};

struct ExportEvent {
    ExportEventType type = ExportEventType::Progress;
    int percent = 0;
    std::string text;
    int64_t framesWritten = 0;
    int64_t totalFrames = 0;
    double durationSeconds = 0.0;
    Status status;
};

struct ExportResult {
    Status status;
    int64_t framesWritten = 0;
    double durationSeconds = 0.0;
    std::string path;
};

/// Offline renderer: FrameSequencer -> FrameCompositor -> FrameSink.
///
/// run() renders synchronously on the calling thread; start() does the same
/// on a background thread and reports through pollEvent(). Only the
/// immutable settings snapshot is shared with live playback. cancel() is
/// checked between frames; a cancelled or failed run aborts the sink.
class FrameExporter {
public:
    FrameExporter() = default;
    ~FrameExporter();

    FrameExporter(const FrameExporter&) = delete;
    FrameExporter& operator=(const FrameExporter&) = delete;

    ExportResult run(const SessionSettings& settings, const WordSequence& words,
                     FrameSink& sink);

    /// Validate, create the sink for path and render in the background.
    /// Configuration errors are returned immediately.
    Status start(const SessionSettings& settings, const WordSequence& words,
                 const std::string& path);

    void cancel() { cancel_.store(true, std::memory_order_release); }

    /// Block until a background export has finished
    void wait();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }

    /// Drain one event (controlling thread only)
    bool pollEvent(ExportEvent& ev) { return events_.pop(ev); }

    /// Result of the last finished run
    ExportResult lastResult() const;

private:
    void publish(const ExportEvent& ev);
    void joinWorker();

    std::thread worker_;
    std::unique_ptr<FrameSink> sink_;
    std::atomic<bool> cancel_{false};
    std::atomic<bool> running_{false};

    mutable std::mutex resultMutex_;
    ExportResult lastResult_;

    EventQueue<ExportEvent, 512> events_;
};

} // namespace wordpulse
