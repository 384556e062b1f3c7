#include <gtest/gtest.h>

#include "client/LocalPlayerClient.h"

#include <algorithm>
#include <string>
#include <vector>

namespace wordpulse {
namespace {

bool hasMessage(const PlayerSnapshot& snap, const std::string& text) {
    return std::find(snap.messages.begin(), snap.messages.end(), text) != snap.messages.end();
}

class LocalPlayerClientTest : public ::testing::Test {
protected:
    LocalPlayerClientTest()
        : client_(scheduler_, exporter_, nullptr, SessionSettings(),
                  WordSequence::fromText("one two three four five"), "unused.mp4") {}

    void TearDown() override { client_.stop(); }

    LiveScheduler scheduler_;
    FrameExporter exporter_;
    LocalPlayerClient client_;
};

TEST_F(LocalPlayerClientTest, SeekWhileStoppedMovesTheStart) {
    client_.seek(3);
    client_.poll();
    EXPECT_EQ(client_.settings().startIndex, 4);
    EXPECT_EQ(client_.snapshot().wordIndex, 3);
    EXPECT_EQ(client_.snapshot().wordCurrent, 4);
}

TEST_F(LocalPlayerClientTest, SeekClampsToTheWordList) {
    client_.seek(99);
    EXPECT_EQ(client_.settings().startIndex, 5);
    client_.seek(-4);
    EXPECT_EQ(client_.settings().startIndex, 1);
}

TEST_F(LocalPlayerClientTest, SeekWhilePlayingIsRefusedWithAMessage) {
    // Five quarter notes at 120 bpm: still playing when the seek arrives
    client_.play();
    ASSERT_TRUE(scheduler_.isActive());
    client_.poll();

    client_.seek(3);
    client_.poll();
    EXPECT_EQ(client_.settings().startIndex, 1);
    EXPECT_TRUE(hasMessage(client_.snapshot(), "Seek is available while stopped"));
}

TEST_F(LocalPlayerClientTest, SettingEditsReportThemselves) {
    client_.setLoopEnabled(true);
    client_.poll();
    EXPECT_TRUE(hasMessage(client_.snapshot(), "Loop on"));
    EXPECT_TRUE(client_.settings().loop.enabled);

    client_.setBpm(1000);
    EXPECT_EQ(client_.settings().timing.bpm, 300);
}

} // namespace
} // namespace wordpulse
