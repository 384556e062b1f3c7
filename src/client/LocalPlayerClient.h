#pragma once

#include "client/PlayerClient.h"
#include "core/LiveScheduler.h"
#include "core/MetronomeClick.h"
#include "export/FrameExporter.h"

#include <string>
#include <vector>

namespace wordpulse {

/// In-process PlayerClient that wraps the live scheduler and the exporter.
/// Settings edits are held here and snapshotted into each new run.
class LocalPlayerClient : public PlayerClient {
public:
    /// @param click Audible metronome, or nullptr when there is no audio
    LocalPlayerClient(LiveScheduler& scheduler, FrameExporter& exporter,
                      MetronomeClick* click, SessionSettings settings,
                      WordSequence words, std::string exportPath);

    // Transport
    void play() override;
    void pause() override;
    void togglePlay() override;
    void stop() override;
    void restart() override;
    void seek(int wordIndex) override;

    // Settings
    void setBpm(int bpm) override;
    void setClickEnabled(bool on) override;
    void setLoopEnabled(bool on) override;
    void setCountIn(bool on) override;

    // Export
    void startExport() override;
    void cancelExport() override;

    // State
    const SessionSettings& settings() const override { return settings_; }
    const WordSequence& words() const override { return words_; }
    const PlayerSnapshot& snapshot() const override { return snap_; }
    void poll() override;

private:
    void applyPlaybackEvent(const PlaybackEvent& ev);
    void applyExportEvent(const ExportEvent& ev);
    void refreshEstimate();
    void message(std::string text);

    LiveScheduler& scheduler_;
    FrameExporter& exporter_;
    MetronomeClick* click_;
    SessionSettings settings_;
    WordSequence words_;
    std::string exportPath_;
    PlayerSnapshot snap_;

    // Messages from commands, moved into the snapshot by poll()
    std::vector<std::string> pendingMessages_;
};

} // namespace wordpulse
