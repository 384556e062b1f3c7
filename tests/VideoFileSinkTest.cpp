#include <gtest/gtest.h>

#include "export/VideoFileSink.h"

#include <juce_graphics/juce_graphics.h>

#include <filesystem>
#include <memory>
#include <string>

namespace wordpulse {
namespace {

class VideoFileSinkTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        juce_ = std::make_unique<juce::ScopedJuceInitialiser_GUI>();
    }

    static void TearDownTestSuite() {
        juce_.reset();
    }

    void SetUp() override {
        path_ = ::testing::TempDir() + "wordpulse_sink_test.mp4";
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    static ExportSettings smallVideo() {
        ExportSettings e;
        e.fps = 10;
        e.width = 64;
        e.height = 36;
        e.format = ExportFormat::Mp4;
        return e;
    }

    static juce::Image blackFrame() {
        return juce::Image(juce::Image::RGB, 64, 36, true);
    }

    static std::unique_ptr<juce::ScopedJuceInitialiser_GUI> juce_;
    std::string path_;
};

std::unique_ptr<juce::ScopedJuceInitialiser_GUI> VideoFileSinkTest::juce_;

TEST_F(VideoFileSinkTest, CloseKeepsTheFile) {
    VideoFileSink sink(smallVideo(), path_);
    ASSERT_TRUE(sink.open().ok());
    for (int i = 0; i < 5; ++i) ASSERT_TRUE(sink.write(blackFrame()).ok());
    ASSERT_TRUE(sink.close().ok());
    EXPECT_EQ(sink.framesWritten(), 5);
    EXPECT_TRUE(std::filesystem::exists(path_));
}

TEST_F(VideoFileSinkTest, AbortRemovesThePartialFile) {
    VideoFileSink sink(smallVideo(), path_);
    ASSERT_TRUE(sink.open().ok());
    ASSERT_TRUE(std::filesystem::exists(path_));
    ASSERT_TRUE(sink.write(blackFrame()).ok());
    sink.abort();
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(VideoFileSinkTest, DestroyingAnOpenSinkRemovesTheFile) {
    {
        VideoFileSink sink(smallVideo(), path_);
        ASSERT_TRUE(sink.open().ok());
    }
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(VideoFileSinkTest, FailedOpenLeavesNothingBehind) {
    const std::string missing = ::testing::TempDir() + "wordpulse_no_such_dir/out.mp4";
    VideoFileSink sink(smallVideo(), missing);
    Status st = sink.open();
    EXPECT_EQ(st.kind, ErrorKind::Resource);
    EXPECT_FALSE(std::filesystem::exists(missing));
    sink.abort();
}

TEST_F(VideoFileSinkTest, TransparentMp4IsAConfigurationError) {
    ExportSettings e = smallVideo();
    e.transparentBackground = true;
    VideoFileSink sink(e, path_);
    EXPECT_EQ(sink.open().kind, ErrorKind::Configuration);
    EXPECT_FALSE(std::filesystem::exists(path_));
}

} // namespace
} // namespace wordpulse
