#include "core/LiveScheduler.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace wordpulse {

LiveScheduler::LiveScheduler() = default;

LiveScheduler::~LiveScheduler() {
    stop();
}

Status LiveScheduler::play(const SessionSettings& settings, const WordSequence& words) {
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        TransportState s = state_.load(std::memory_order_acquire);
        if (s == TransportState::CountIn || s == TransportState::Playing)
            return Status::success();
        if (s != TransportState::Paused) {
            Status v = validateSession(settings, words, true);
            if (!v.ok()) return v;

            // A completed driver has already returned; reclaim its thread
            joinDriver();

            settings_ = settings;
            words_ = words;
            timing_ = resolveTiming(settings.timing);
            hasSnapshot_ = true;

            int first = words_.clampStartIndex(settings_.startIndex) - 1;
            currentWordIndex_.store(first, std::memory_order_relaxed);
            loopIteration_.store(0, std::memory_order_relaxed);
            elapsed_.store(0.0, std::memory_order_relaxed);

            TransportState initial = settings_.countIn ? TransportState::CountIn
                                                       : TransportState::Playing;
            state_.store(initial, std::memory_order_release);
            publishState(initial);

            thread_ = std::thread(&LiveScheduler::run, this);
            return Status::success();
        }
    }
    resume();
    return Status::success();
}

void LiveScheduler::pause() {
    TransportState expected = state_.load(std::memory_order_acquire);
    while (expected == TransportState::Playing || expected == TransportState::CountIn) {
        TransportState from = expected;
        if (state_.compare_exchange_weak(expected, TransportState::Paused,
                                         std::memory_order_acq_rel)) {
            pausedFrom_.store(from, std::memory_order_release);
            return;
        }
    }
}

void LiveScheduler::resume() {
    TransportState expected = TransportState::Paused;
    state_.compare_exchange_strong(expected, pausedFrom_.load(std::memory_order_acquire),
                                   std::memory_order_acq_rel);
}

void LiveScheduler::stop() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    bool wasIdle = state_.load(std::memory_order_acquire) == TransportState::Idle;
    if (wasIdle && !thread_.joinable()) return;

    state_.store(TransportState::Idle, std::memory_order_release);
    joinDriver();

    int first = hasSnapshot_ ? words_.clampStartIndex(settings_.startIndex) - 1 : -1;
    currentWordIndex_.store(first, std::memory_order_relaxed);
    loopIteration_.store(0, std::memory_order_relaxed);
    elapsed_.store(0.0, std::memory_order_relaxed);

    if (!wasIdle) publishState(TransportState::Idle);
}

Status LiveScheduler::restart() {
    if (!hasSnapshot_)
        return Status::configuration("nothing to restart");
    stop();
    SessionSettings settings = settings_;
    WordSequence words = words_;
    return play(settings, words);
}

void LiveScheduler::seek(int wordIndex, const WordSequence& words) {
    if (isActive() || words.empty()) return;

    std::lock_guard<std::mutex> lock(controlMutex_);
    joinDriver();

    int index = std::clamp(wordIndex, 0, words.size() - 1);
    currentWordIndex_.store(index, std::memory_order_relaxed);

    PlaybackEvent ev;
    ev.type = PlaybackEventType::Display;
    ev.display.wordIndex = index;
    ev.display.opacity = 1.0;
    publish(ev);

    PlaybackEvent progress;
    progress.type = PlaybackEventType::WordProgress;
    progress.wordIndex = index;
    progress.current = index + 1;
    progress.total = words.size();
    publish(progress);
}

bool LiveScheduler::isActive() const {
    TransportState s = state();
    return s == TransportState::CountIn || s == TransportState::Playing ||
           s == TransportState::Paused;
}

PlaybackSnapshot LiveScheduler::snapshot() const {
    PlaybackSnapshot snap;
    snap.state = state();
    snap.currentWordIndex = currentWordIndex_.load(std::memory_order_relaxed);
    snap.loopIteration = loopIteration_.load(std::memory_order_relaxed);
    snap.elapsed = elapsed_.load(std::memory_order_relaxed);
    return snap;
}

// --- Driver thread ---

void LiveScheduler::run() {
    MetronomeClock metronome(static_cast<double>(settings_.timing.bpm),
                             settings_.timing.timeSigNum);
    metronome.onTick([this](const BeatTick& tick) {
        PlaybackEvent ev;
        ev.type = PlaybackEventType::BeatTick;
        ev.tick = tick;
        ev.elapsed = tickElapsed_;
        publish(ev);
        if (settings_.metronomeEnabled && tickSink_) tickSink_(tick);
    });

    clock_.start();

    if (settings_.countIn) {
        if (!runCountIn(metronome)) return;
        TransportState expected = TransportState::CountIn;
        if (state_.compare_exchange_strong(expected, TransportState::Playing,
                                           std::memory_order_acq_rel)) {
            publishState(TransportState::Playing);
        } else if (expected == TransportState::Paused) {
            pausedFrom_.store(TransportState::Playing, std::memory_order_release);
        } else {
            return;
        }
    }

    PlaybackTimeline timeline(timing_, words_.size(), settings_.startIndex);
    const double timeBox = passTimeBox(timing_, settings_.loop);
    const int loopTotal = settings_.loop.totalIterations();

    double origin = clock_.elapsed();
    int iteration = 0;
    for (;;) {
        loopIteration_.store(iteration, std::memory_order_relaxed);

        PlaybackEvent status;
        status.type = PlaybackEventType::LoopStatus;
        status.loopIteration = iteration;
        status.loopTotal = loopTotal;
        publish(status);

        if (!runPass(timeline, timeBox, metronome, origin)) return;

        if (!settings_.loop.enabled) break;
        ++iteration;
        if (!settings_.loop.infinite && iteration >= settings_.loop.loopTimes) break;
    }

    finishRun();
}

bool LiveScheduler::runCountIn(MetronomeClock& metronome) {
    const int beats = metronome.beatsPerBar();
    const double spb = metronome.secondsPerBeat();
    const double origin = clock_.elapsed();

    for (int b = 0; b < beats; ++b) {
        if (!waitWhilePaused()) return false;

        BeatTick tick;
        tick.beatIndex = b - beats;
        tick.beat = b;
        tick.bar = -1;
        tick.accent = (b == 0);
        tick.time = metronome.countInTime(b);

        PlaybackEvent ev;
        ev.type = PlaybackEventType::BeatTick;
        ev.tick = tick;
        ev.elapsed = tick.time;
        elapsed_.store(tick.time, std::memory_order_relaxed);
        publish(ev);
        if (settings_.metronomeEnabled && tickSink_) tickSink_(tick);

        const double target = origin + (b + 1) * spb;
        while (clock_.elapsed() < target) {
            if (!waitWhilePaused()) return false;
            std::this_thread::sleep_for(kPollInterval);
        }
    }
    return true;
}

bool LiveScheduler::runPass(const PlaybackTimeline& timeline, double timeBox,
                            MetronomeClock& metronome, double& origin) {
    metronome.reset();

    PassCursor cursor(timeline, timeBox);
    TimedSegment ts;
    int lastWord = -1;

    while (cursor.next(ts)) {
        if (!waitWhilePaused()) return false;

        int word = ts.segment.wordIndex;
        if (word >= 0 && word != lastWord) {
            lastWord = word;
            currentWordIndex_.store(word, std::memory_order_relaxed);

            PlaybackEvent ev;
            ev.type = PlaybackEventType::WordProgress;
            ev.wordIndex = word;
            ev.current = word - timeline.firstWord() + 1;
            ev.total = timeline.passLength();
            publish(ev);
        }

        if (!driveSegment(ts, origin, metronome)) return false;
    }

    // Next pass starts on the nominal boundary, not on whenever we noticed it
    origin += cursor.position();
    return true;
}

bool LiveScheduler::driveSegment(const TimedSegment& ts, double origin,
                                 MetronomeClock& metronome) {
    const Segment& seg = ts.segment;
    int lastStep = -1;

    for (;;) {
        if (!waitWhilePaused()) return false;

        const double now = clock_.elapsed() - origin;
        elapsed_.store(now, std::memory_order_relaxed);
        tickElapsed_ = now;
        metronome.advanceTo(now);

        const double local = now - ts.start;
        const bool done = local >= ts.duration;

        int step = 0;
        if (seg.isFade() && seg.duration > 0.0) {
            double shown = std::min(std::max(local, 0.0), ts.duration);
            step = static_cast<int>(std::floor(shown / seg.duration * kFadeSteps));
            step = std::clamp(step, 0, kFadeSteps);
        } else if (seg.isFade()) {
            step = kFadeSteps;
        }

        if (step != lastStep) {
            lastStep = step;
            PlaybackEvent ev;
            ev.type = PlaybackEventType::Display;
            ev.display = displayAt(seg, static_cast<double>(step) / kFadeSteps);
            ev.wordIndex = seg.wordIndex;
            publish(ev);
        }

        if (done) return true;
        std::this_thread::sleep_for(kPollInterval);
    }
}

bool LiveScheduler::waitWhilePaused() {
    for (;;) {
        TransportState s = state_.load(std::memory_order_acquire);
        if (s == TransportState::Idle) return false;
        if (s != TransportState::Paused) {
            if (clock_.isPaused()) {
                clock_.resume();
                publishState(s);
            }
            return true;
        }
        if (!clock_.isPaused()) {
            clock_.pause();
            publishState(TransportState::Paused);
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

void LiveScheduler::finishRun() {
    for (;;) {
        TransportState expected = state_.load(std::memory_order_acquire);
        if (expected != TransportState::Playing && expected != TransportState::CountIn) {
            // Paused on the last frame: hold until resumed or stopped
            if (!waitWhilePaused()) return;
            continue;
        }
        if (state_.compare_exchange_strong(expected, TransportState::Completed,
                                           std::memory_order_acq_rel)) {
            PlaybackEvent ev;
            ev.type = PlaybackEventType::Completed;
            ev.state = TransportState::Completed;
            ev.loopIteration = loopIteration_.load(std::memory_order_relaxed);
            ev.loopTotal = settings_.loop.totalIterations();
            publish(ev);
            publishState(TransportState::Completed);
            return;
        }
    }
}

// --- Helpers ---

void LiveScheduler::publish(const PlaybackEvent& ev) {
    if (!events_.push(ev) && events_.dropped() == 1)
        fprintf(stderr, "LiveScheduler: event queue full, dropping events\n");
}

void LiveScheduler::publishState(TransportState s) {
    PlaybackEvent ev;
    ev.type = PlaybackEventType::StateChanged;
    ev.state = s;
    publish(ev);
}

void LiveScheduler::joinDriver() {
    if (thread_.joinable()) thread_.join();
}

} // namespace wordpulse
