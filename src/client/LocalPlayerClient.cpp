#include "client/LocalPlayerClient.h"
#include "core/PlaybackTimeline.h"

#include <algorithm>
#include <cstdio>

namespace wordpulse {

LocalPlayerClient::LocalPlayerClient(LiveScheduler& scheduler, FrameExporter& exporter,
                                     MetronomeClick* click, SessionSettings settings,
                                     WordSequence words, std::string exportPath)
    : scheduler_(scheduler)
    , exporter_(exporter)
    , click_(click)
    , settings_(std::move(settings))
    , words_(std::move(words))
    , exportPath_(std::move(exportPath))
{
    snap_.clickEnabled = settings_.metronomeEnabled;
    snap_.wordTotal = words_.size();
    snap_.loopTotal = settings_.loop.totalIterations();
    if (click_) {
        click_->setEnabled(settings_.metronomeEnabled);
        click_->setVolume(settings_.clickVolume);
    }
    refreshEstimate();
    if (!words_.empty()) scheduler_.seek(settings_.startIndex - 1, words_);
}

void LocalPlayerClient::play() {
    Status s = scheduler_.play(settings_, words_);
    if (!s.ok()) message("Cannot play: " + s.describe());
}

void LocalPlayerClient::pause() {
    scheduler_.pause();
}

void LocalPlayerClient::togglePlay() {
    TransportState s = scheduler_.state();
    if (s == TransportState::Playing || s == TransportState::CountIn)
        pause();
    else
        play();
}

void LocalPlayerClient::stop() {
    scheduler_.stop();
    snap_.loopIteration = 0;
    if (!words_.empty()) scheduler_.seek(settings_.startIndex - 1, words_);
}

void LocalPlayerClient::restart() {
    Status s = scheduler_.restart();
    if (!s.ok()) message("Cannot restart: " + s.describe());
}

void LocalPlayerClient::seek(int wordIndex) {
    if (scheduler_.isActive()) {
        message("Seek is available while stopped");
        return;
    }
    int index = std::clamp(wordIndex, 0, std::max(0, words_.size() - 1));
    settings_.startIndex = index + 1;
    scheduler_.seek(index, words_);
    refreshEstimate();
}

void LocalPlayerClient::setBpm(int bpm) {
    bpm = std::clamp(bpm, 20, 300);
    if (bpm == settings_.timing.bpm) return;
    settings_.timing.bpm = bpm;
    refreshEstimate();
    if (scheduler_.isActive())
        message("BPM " + std::to_string(bpm) + " applies from the next play");
}

void LocalPlayerClient::setClickEnabled(bool on) {
    settings_.metronomeEnabled = on;
    snap_.clickEnabled = on;
    if (click_) click_->setEnabled(on);
}

void LocalPlayerClient::setLoopEnabled(bool on) {
    settings_.loop.enabled = on;
    refreshEstimate();
    message(std::string("Loop ") + (on ? "on" : "off"));
}

void LocalPlayerClient::setCountIn(bool on) {
    settings_.countIn = on;
    message(std::string("Count-in ") + (on ? "on" : "off"));
}

void LocalPlayerClient::startExport() {
    Status s = exporter_.start(settings_, words_, exportPath_);
    if (!s.ok()) {
        message("Cannot export: " + s.describe());
        return;
    }
    snap_.exportState.running = true;
    snap_.exportState.percent = 0;
    snap_.exportState.status = "Starting";
}

void LocalPlayerClient::cancelExport() {
    if (exporter_.isRunning()) exporter_.cancel();
}

void LocalPlayerClient::poll() {
    snap_.messages.clear();

    PlaybackEvent pev;
    while (scheduler_.pollEvent(pev)) applyPlaybackEvent(pev);

    ExportEvent eev;
    while (exporter_.pollEvent(eev)) applyExportEvent(eev);

    // The state atomic is authoritative even if StateChanged events were dropped
    PlaybackSnapshot ps = scheduler_.snapshot();
    snap_.state = ps.state;
    if (ps.state != TransportState::Idle) snap_.elapsed = ps.elapsed;
    snap_.droppedEvents = scheduler_.droppedEvents();
    snap_.exportState.running = exporter_.isRunning();

    snap_.messages.insert(snap_.messages.end(),
                          pendingMessages_.begin(), pendingMessages_.end());
    pendingMessages_.clear();
}

void LocalPlayerClient::applyPlaybackEvent(const PlaybackEvent& ev) {
    switch (ev.type) {
        case PlaybackEventType::Display:
            snap_.display = ev.display;
            break;
        case PlaybackEventType::WordProgress:
            snap_.wordIndex = ev.wordIndex;
            snap_.wordCurrent = ev.current;
            snap_.wordTotal = ev.total;
            break;
        case PlaybackEventType::BeatTick:
            snap_.bar = ev.tick.bar;
            snap_.beat = ev.tick.beat;
            snap_.elapsed = ev.elapsed;
            ++snap_.beatSerial;
            break;
        case PlaybackEventType::LoopStatus:
            snap_.loopIteration = ev.loopIteration;
            snap_.loopTotal = ev.loopTotal;
            break;
        case PlaybackEventType::StateChanged:
            snap_.state = ev.state;
            if (ev.state == TransportState::Idle) {
                snap_.bar = 0;
                snap_.beat = 0;
                snap_.elapsed = 0.0;
            }
            break;
        case PlaybackEventType::Completed:
            message("Playback complete");
            break;
        case PlaybackEventType::Message:
            message(ev.text);
            break;
    }
}

void LocalPlayerClient::applyExportEvent(const ExportEvent& ev) {
    ExportSnapshot& ex = snap_.exportState;
    switch (ev.type) {
        case ExportEventType::Started:
            ex.running = true;
            ex.percent = 0;
            ex.totalFrames = ev.totalFrames;
            message(ev.text);
            break;
        case ExportEventType::Progress:
            ex.percent = ev.percent;
            ex.status = ev.text;
            ex.framesWritten = ev.framesWritten;
            ex.totalFrames = ev.totalFrames;
            break;
        case ExportEventType::Completed: {
            ex.running = false;
            ex.percent = 100;
            ex.status = "Complete";
            ex.framesWritten = ev.framesWritten;
            char buf[128];
            snprintf(buf, sizeof(buf), "%lld frames, %.1fs",
                     static_cast<long long>(ev.framesWritten), ev.durationSeconds);
            message(ev.text + ": " + buf);
            break;
        }
        case ExportEventType::Failed:
            ex.running = false;
            ex.status = "Error";
            message("Export failed: " + ev.status.describe());
            break;
        case ExportEventType::Cancelled:
            ex.running = false;
            ex.status = "Cancelled";
            message("Export cancelled");
            break;
    }
}

void LocalPlayerClient::refreshEstimate() {
    PlaybackTimeline timeline(resolveTiming(settings_.timing), words_.size(),
                              settings_.startIndex);
    SessionEstimate est = estimateSession(timeline, settings_.loop);
    snap_.passSeconds = est.passSeconds;
    snap_.totalSeconds = est.totalSeconds;
    if (!scheduler_.isActive()) snap_.loopTotal = settings_.loop.totalIterations();
}

void LocalPlayerClient::message(std::string text) {
    pendingMessages_.push_back(std::move(text));
}

} // namespace wordpulse
