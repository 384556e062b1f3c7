#pragma once

#include <atomic>
#include <cmath>

namespace wordpulse {

/// Synthesizes the metronome click: a decaying sine, 800 Hz for 20 ms on
/// ordinary beats and 1200 Hz for 30 ms on the downbeat.
///
/// trigger() is called from the playback driver thread, nextSample() from
/// the audio callback; the hand-off is a single atomic request slot.
class MetronomeClick {
public:
    explicit MetronomeClick(double sampleRate = 44100.0)
        : sampleRate_(sampleRate) {}

    /// Request a click. Picked up by the audio thread on its next sample.
    void trigger(bool accent) {
        if (!enabled_.load(std::memory_order_relaxed)) return;
        request_.store(accent ? kAccentRequest : kBeatRequest, std::memory_order_release);
    }

    /// Return the next sample of the click (0.0f when inactive). Audio thread only.
    float nextSample() {
        int req = request_.exchange(kNoRequest, std::memory_order_acquire);
        if (req != kNoRequest) start(req == kAccentRequest);

        if (!active_) return 0.0f;

        double t = static_cast<double>(sampleIndex_) / sampleRate_;
        if (t >= duration_) {
            active_ = false;
            return 0.0f;
        }

        // Exponential decay envelope, e^(-100 t)
        float envelope = std::exp(static_cast<float>(-t * kDecayPerSecond));
        float sample = std::sin(static_cast<float>(2.0 * M_PI * freq_ * t)) * envelope;

        ++sampleIndex_;
        return sample * volume_.load(std::memory_order_relaxed);
    }

    void setEnabled(bool on) { enabled_.store(on, std::memory_order_relaxed); }
    bool isEnabled() const { return enabled_.load(std::memory_order_relaxed); }

    void setVolume(float v) { volume_.store(v, std::memory_order_relaxed); }
    float volume() const { return volume_.load(std::memory_order_relaxed); }

    /// Only while the audio device is stopped
    void setSampleRate(double sr) { sampleRate_ = sr; }

private:
    void start(bool accent) {
        sampleIndex_ = 0;
        active_ = true;
        freq_ = accent ? 1200.0 : 800.0;
        duration_ = accent ? 0.03 : 0.02;
    }

    static constexpr int kNoRequest = 0;
    static constexpr int kBeatRequest = 1;
    static constexpr int kAccentRequest = 2;
    static constexpr double kDecayPerSecond = 100.0;

    double sampleRate_;
    std::atomic<bool> enabled_{true};
    std::atomic<float> volume_{0.5f};
    std::atomic<int> request_{kNoRequest};

    // Audio-thread click state
    bool active_ = false;
    double freq_ = 800.0;
    double duration_ = 0.02;
    int sampleIndex_ = 0;
};

} // namespace wordpulse
