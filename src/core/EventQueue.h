#pragma once

#include <atomic>
#include <array>
#include <cstddef>
#include <cstdint>

namespace wordpulse {

/// Lock-free hand-off of PlaybackEvents (LiveScheduler) and ExportEvents
/// (FrameExporter) from a worker thread to the thread that drives the UI.
///
/// One producer, one consumer, fixed capacity. A push into a full queue
/// never blocks the worker: the event is discarded and counted, so the
/// consumer can report how much it missed.
template <typename Event, size_t Capacity>
class EventQueue {
    static_assert(Capacity > 0, "Capacity must be > 0");

public:
    /// Worker thread only. Returns false (and counts a drop) when full.
    bool push(const Event& ev) {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t next = advance(head);
        if (next == tail_.load(std::memory_order_acquire)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        buf_[head] = ev;
        head_.store(next, std::memory_order_release);
        return true;
    }

    /// UI thread only. Returns false when nothing is waiting.
    bool pop(Event& ev) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire))
            return false;
        ev = buf_[tail];
        tail_.store(advance(tail), std::memory_order_release);
        return true;
    }

    /// Events discarded because the consumer fell behind (any thread)
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    static constexpr size_t capacity() { return Capacity; }

private:
    static size_t advance(size_t i) { return (i + 1) % (Capacity + 1); }

    std::array<Event, Capacity + 1> buf_{};  // Spare slot tells full from empty
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace wordpulse
