#include "config/Config.h"
#include "core/LiveScheduler.h"
#include "core/MetronomeClick.h"
#include "client/LocalPlayerClient.h"
#include "export/FrameExporter.h"
#include "tui/Tui.h"

#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_core/juce_core.h>

#include <chrono>
#include <thread>
#include <csignal>
#include <atomic>
#include <cstdio>
#include <memory>

static std::atomic<bool> g_running{true};

static void signalHandler(int) {
    g_running = false;
}

/// Feeds the metronome click to every output channel
class AudioCallback : public juce::AudioIODeviceCallback {
public:
    explicit AudioCallback(wordpulse::MetronomeClick& click) : click_(click) {}

    void audioDeviceIOCallbackWithContext(
            const float* const*,
            int,
            float* const* outputChannelData,
            int numOutputChannels,
            int numSamples,
            const juce::AudioIODeviceCallbackContext&) override {
        for (int i = 0; i < numSamples; ++i) {
            float s = click_.nextSample();
            for (int ch = 0; ch < numOutputChannels; ++ch) {
                if (outputChannelData[ch]) outputChannelData[ch][i] = s;
            }
        }
    }

    void audioDeviceAboutToStart(juce::AudioIODevice* device) override {
        click_.setSampleRate(device->getCurrentSampleRate());
    }

    void audioDeviceStopped() override {}

private:
    wordpulse::MetronomeClick& click_;
};

static int exitCodeFor(const wordpulse::Status& status) {
    switch (status.kind) {
        case wordpulse::ErrorKind::None:          return 0;
        case wordpulse::ErrorKind::Configuration: return 1;
        case wordpulse::ErrorKind::Resource:      return 2;
        case wordpulse::ErrorKind::Interrupted:   return 130;
    }
    return 1;
}

/// Render to a file and exit; progress on stderr
static int runExport(const wordpulse::SessionSettings& settings,
                     const wordpulse::WordSequence& words,
                     const std::string& path) {
    wordpulse::FrameExporter exporter;
    wordpulse::Status started = exporter.start(settings, words, path);
    if (!started.ok()) {
        fprintf(stderr, "Export: %s\n", started.describe().c_str());
        return exitCodeFor(started);
    }

    bool cancelled = false;
    while (exporter.isRunning()) {
        if (!g_running && !cancelled) {
            exporter.cancel();
            cancelled = true;
        }
        wordpulse::ExportEvent ev;
        while (exporter.pollEvent(ev)) {
            if (ev.type == wordpulse::ExportEventType::Progress)
                fprintf(stderr, "\r%3d%%  %s    ", ev.percent, ev.text.c_str());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    exporter.wait();

    wordpulse::ExportEvent ev;
    while (exporter.pollEvent(ev)) {
        if (ev.type == wordpulse::ExportEventType::Progress)
            fprintf(stderr, "\r%3d%%  %s    ", ev.percent, ev.text.c_str());
    }
    fprintf(stderr, "\n");

    wordpulse::ExportResult result = exporter.lastResult();
    if (!result.status.ok()) {
        fprintf(stderr, "Export: %s\n", result.status.describe().c_str());
        return exitCodeFor(result.status);
    }
    fprintf(stderr, "Exported: %s\nFrames: %lld\nDuration: %.1fs\n",
            result.path.c_str(), static_cast<long long>(result.framesWritten),
            result.durationSeconds);
    return 0;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Load config file, then apply CLI overrides
    auto cfg = wordpulse::Config::load(wordpulse::Config::findConfigArg(argc, argv));
    int exitCode = 0;
    if (!cfg.parseArgs(argc, argv, exitCode)) {
        if (cfg.showHelp) {
            wordpulse::Config::printUsage(argv[0]);
        }
        return exitCode;
    }

    wordpulse::WordSequence words;
    wordpulse::Status loaded = cfg.loadWords(words);
    if (!loaded.ok()) {
        fprintf(stderr, "%s\n", loaded.describe().c_str());
        return exitCodeFor(loaded);
    }

    wordpulse::SessionSettings settings;
    wordpulse::Status valid = cfg.toSession(words, settings);
    if (!valid.ok()) {
        fprintf(stderr, "%s\n", valid.describe().c_str());
        return exitCodeFor(valid);
    }

    // Fonts and devices need the JUCE runtime in both modes
    juce::ScopedJuceInitialiser_GUI juceInit;

    // --- Headless export ---
    if (!cfg.exportPath.empty()) {
        return runExport(settings, words, cfg.exportPath);
    }

    // --- Interactive: audio click (optional) + TUI ---
    wordpulse::MetronomeClick click;
    AudioCallback audioCallback(click);
    juce::AudioDeviceManager deviceManager;
    bool audioActive = false;
    std::string audioStatus;

    // Set preferred audio backend if specified
    if (!cfg.audioBackend.empty()) {
        juce::String preferredBackend(cfg.audioBackend);
        for (auto* deviceType : deviceManager.getAvailableDeviceTypes()) {
            if (deviceType->getTypeName().containsIgnoreCase(preferredBackend)) {
                deviceManager.setCurrentAudioDeviceType(deviceType->getTypeName(), true);
                break;
            }
        }
    }

    auto error = deviceManager.initialise(0, 2, nullptr, true);
    if (error.isNotEmpty() || !deviceManager.getCurrentAudioDevice()) {
        audioStatus = "Audio unavailable, click disabled: " +
                      (error.isNotEmpty() ? error.toStdString() : std::string("no device"));
    } else {
        auto* device = deviceManager.getCurrentAudioDevice();
        click.setSampleRate(device->getCurrentSampleRate());
        deviceManager.addAudioCallback(&audioCallback);
        audioActive = true;
        char buf[160];
        snprintf(buf, sizeof(buf), "Audio: %s  %.0f Hz",
                 device->getName().toRawUTF8(), device->getCurrentSampleRate());
        audioStatus = buf;
    }

    wordpulse::LiveScheduler scheduler;
    if (audioActive) {
        scheduler.setTickSink([&click](const wordpulse::BeatTick& tick) {
            click.trigger(tick.accent);
        });
    }
    wordpulse::FrameExporter exporter;

    wordpulse::LocalPlayerClient client(scheduler, exporter, audioActive ? &click : nullptr,
                                        settings, words, cfg.outputPath);
    wordpulse::Tui tui(client);

    if (!tui.init()) {
        fprintf(stderr, "Failed to initialize TUI\n");
        if (audioActive) deviceManager.removeAudioCallback(&audioCallback);
        return 1;
    }

    tui.addMessage("Wordpulse started");
    tui.addMessage(audioStatus);
    if (words.empty()) {
        tui.addMessage("No words loaded: use --text FILE or --words \"...\"");
    } else {
        tui.addMessage(std::to_string(words.size()) + " words loaded");
    }
    tui.addMessage("Press SPACE to play, 'q' to quit");

    // Main loop: TUI at ~30fps
    while (g_running) {
        auto frameStart = std::chrono::steady_clock::now();

        if (!tui.update()) {
            break;
        }

        auto frameEnd = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            frameEnd - frameStart);
        auto sleepTime = std::chrono::milliseconds(cfg.tuiRefreshMs) - elapsed;
        if (sleepTime.count() > 0) {
            std::this_thread::sleep_for(sleepTime);
        }
    }

    // Cleanup: stop the driver before the click it feeds goes away
    scheduler.stop();
    exporter.cancel();
    exporter.wait();
    if (audioActive) deviceManager.removeAudioCallback(&audioCallback);
    tui.shutdown();

    return 0;
}
