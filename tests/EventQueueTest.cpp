#include <gtest/gtest.h>

#include "core/EventQueue.h"
#include "core/PlaybackEvent.h"

#include <thread>

namespace wordpulse {
namespace {

TEST(EventQueueTest, DeliversInOrder) {
    EventQueue<PlaybackEvent, 8> queue;
    for (int i = 0; i < 5; ++i) {
        PlaybackEvent ev;
        ev.type = PlaybackEventType::WordProgress;
        ev.current = i + 1;
        ASSERT_TRUE(queue.push(ev));
    }
    PlaybackEvent out;
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(queue.pop(out));
        EXPECT_EQ(out.current, i + 1);
    }
    EXPECT_FALSE(queue.pop(out));
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.dropped(), 0u);
}

TEST(EventQueueTest, FullQueueCountsDrops) {
    EventQueue<PlaybackEvent, 4> queue;
    PlaybackEvent ev;
    for (int i = 0; i < 4; ++i) ASSERT_TRUE(queue.push(ev));
    EXPECT_FALSE(queue.push(ev));
    EXPECT_FALSE(queue.push(ev));
    EXPECT_EQ(queue.dropped(), 2u);

    // Room again once the consumer catches up; the count stays
    ASSERT_TRUE(queue.pop(ev));
    EXPECT_TRUE(queue.push(ev));
    EXPECT_EQ(queue.dropped(), 2u);
}

TEST(EventQueueTest, CrossThreadHandOff) {
    EventQueue<PlaybackEvent, 64> queue;
    constexpr int kEvents = 10000;

    std::thread producer([&] {
        for (int i = 0; i < kEvents; ++i) {
            PlaybackEvent ev;
            ev.current = i;
            while (!queue.push(ev)) std::this_thread::yield();
        }
    });

    int received = 0;
    int outOfOrder = 0;
    PlaybackEvent ev;
    while (received < kEvents) {
        if (queue.pop(ev)) {
            if (ev.current != received) ++outOfOrder;
            ++received;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();
    EXPECT_EQ(outOfOrder, 0);
    EXPECT_TRUE(queue.empty());
}

} // namespace
} // namespace wordpulse
