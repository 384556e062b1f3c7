#include <gtest/gtest.h>

#include "export/FrameCompositor.h"
#include "export/FrameExporter.h"
#include "export/ImageSequenceSink.h"

#include <juce_graphics/juce_graphics.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace wordpulse {
namespace {

/// Keeps every frame as encoded PNG bytes
class MemorySink : public FrameSink {
public:
    Status open() override {
        opened = true;
        return Status::success();
    }

    Status write(const juce::Image& frame) override {
        if (failAfter >= 0 && static_cast<int>(frames.size()) >= failAfter)
            return Status::resource("disk full");
        juce::MemoryOutputStream out;
        juce::PNGImageFormat png;
        if (!png.writeImageToStream(frame, out))
            return Status::resource("PNG encoding failed");
        frames.push_back(out.getMemoryBlock());
        lastImage = frame.createCopy();
        if (onWrite) onWrite();
        return Status::success();
    }

    Status close() override {
        closed = true;
        return Status::success();
    }

    void abort() override { aborted = true; }

    std::string path() const override { return "memory"; }

    std::vector<juce::MemoryBlock> frames;
    juce::Image lastImage;
    std::function<void()> onWrite;
    int failAfter = -1;
    bool opened = false;
    bool closed = false;
    bool aborted = false;
};

class FrameExporterTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        juce_ = std::make_unique<juce::ScopedJuceInitialiser_GUI>();
    }

    static void TearDownTestSuite() {
        juce_.reset();
    }

    static SessionSettings smallSession() {
        SessionSettings s;
        s.exportSettings.width = 64;
        s.exportSettings.height = 36;
        s.exportSettings.fps = 10;
        s.display.background = {10, 20, 30};
        return s;
    }

    static std::vector<ExportEvent> drain(FrameExporter& exporter) {
        std::vector<ExportEvent> events;
        ExportEvent ev;
        while (exporter.pollEvent(ev)) events.push_back(ev);
        return events;
    }

    static std::unique_ptr<juce::ScopedJuceInitialiser_GUI> juce_;
};

std::unique_ptr<juce::ScopedJuceInitialiser_GUI> FrameExporterTest::juce_;

TEST_F(FrameExporterTest, WritesEveryFrame) {
    FrameExporter exporter;
    MemorySink sink;
    auto words = WordSequence::fromText("one two three");

    ExportResult result = exporter.run(smallSession(), words, sink);
    ASSERT_TRUE(result.status.ok()) << result.status.describe();
    // 3 quarter notes at 120 bpm, 10 fps
    EXPECT_EQ(result.framesWritten, 15);
    EXPECT_EQ(sink.frames.size(), 15u);
    EXPECT_DOUBLE_EQ(result.durationSeconds, 1.5);
    EXPECT_TRUE(sink.opened);
    EXPECT_TRUE(sink.closed);
    EXPECT_FALSE(sink.aborted);

    auto events = drain(exporter);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().type, ExportEventType::Started);
    EXPECT_EQ(events.front().totalFrames, 15);
    EXPECT_EQ(events.back().type, ExportEventType::Completed);
    EXPECT_EQ(events.back().percent, 100);

    int lastPercent = -1;
    for (const auto& ev : events) {
        if (ev.type != ExportEventType::Progress) continue;
        EXPECT_GT(ev.percent, lastPercent);
        lastPercent = ev.percent;
        EXPECT_EQ(ev.text.rfind("Loop 1/1 - Word ", 0), 0u) << ev.text;
    }
    EXPECT_EQ(lastPercent, 100);
}

TEST_F(FrameExporterTest, OutputIsByteIdenticalAcrossRuns) {
    SessionSettings s = smallSession();
    s.timing.gapNote = *parseNoteValue("1/16");
    s.timing.gapIsNegative = true;
    auto words = WordSequence::fromText("same every time");

    FrameExporter a;
    FrameExporter b;
    MemorySink first;
    MemorySink second;
    ASSERT_TRUE(a.run(s, words, first).status.ok());
    ASSERT_TRUE(b.run(s, words, second).status.ok());

    ASSERT_EQ(first.frames.size(), second.frames.size());
    for (size_t i = 0; i < first.frames.size(); ++i) {
        EXPECT_TRUE(first.frames[i] == second.frames[i]) << "frame " << i;
    }
}

TEST_F(FrameExporterTest, OpaqueBlankFrameIsBackground) {
    SessionSettings s = smallSession();
    auto words = WordSequence::fromText("word");
    FrameCompositor compositor(s, words);

    juce::Image blank = compositor.render(DisplayState{});
    EXPECT_FALSE(blank.hasAlphaChannel());
    for (int y = 0; y < blank.getHeight(); y += 5) {
        for (int x = 0; x < blank.getWidth(); x += 5) {
            juce::Colour c = blank.getPixelAt(x, y);
            ASSERT_EQ(c.getRed(), 10);
            ASSERT_EQ(c.getGreen(), 20);
            ASSERT_EQ(c.getBlue(), 30);
        }
    }
}

TEST_F(FrameExporterTest, TransparentCornersAreClear) {
    SessionSettings s = smallSession();
    s.exportSettings.format = ExportFormat::PngSequence;
    s.exportSettings.transparentBackground = true;
    auto words = WordSequence::fromText("glass");

    FrameExporter exporter;
    MemorySink sink;
    ASSERT_TRUE(exporter.run(s, words, sink).status.ok());
    ASSERT_TRUE(sink.lastImage.isValid());
    EXPECT_TRUE(sink.lastImage.hasAlphaChannel());
    EXPECT_EQ(sink.lastImage.getPixelAt(0, 0).getAlpha(), 0);
    EXPECT_EQ(sink.lastImage.getPixelAt(63, 35).getAlpha(), 0);
}

TEST_F(FrameExporterTest, ScalesFontToOutputHeight) {
    SessionSettings s = smallSession();
    s.display.fontSize = 108;
    s.exportSettings.height = 540;
    FrameCompositor compositor(s, WordSequence::fromText("x"));
    EXPECT_NEAR(compositor.fontHeight(), 54.0f, 0.5f);
}

TEST_F(FrameExporterTest, CancelAbortsTheSink) {
    FrameExporter exporter;
    MemorySink sink;
    sink.onWrite = [&] {
        if (sink.frames.size() == 3) exporter.cancel();
    };
    auto words = WordSequence::fromText("a b c d e f");

    ExportResult result = exporter.run(smallSession(), words, sink);
    EXPECT_EQ(result.status.kind, ErrorKind::Interrupted);
    EXPECT_EQ(result.framesWritten, 3);
    EXPECT_TRUE(sink.aborted);
    EXPECT_FALSE(sink.closed);

    auto events = drain(exporter);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, ExportEventType::Cancelled);
}

TEST_F(FrameExporterTest, WriteFailureIsResourceError) {
    FrameExporter exporter;
    MemorySink sink;
    sink.failAfter = 4;

    ExportResult result = exporter.run(smallSession(), WordSequence::fromText("a b"), sink);
    EXPECT_EQ(result.status.kind, ErrorKind::Resource);
    EXPECT_EQ(result.framesWritten, 4);
    EXPECT_NE(result.status.message.find("4 frames"), std::string::npos)
        << result.status.message;
    EXPECT_TRUE(sink.aborted);
    EXPECT_EQ(exporter.lastResult().status.kind, ErrorKind::Resource);
}

TEST_F(FrameExporterTest, RejectsInvalidSettingsBeforeOpening) {
    FrameExporter exporter;
    MemorySink sink;
    SessionSettings s = smallSession();
    s.exportSettings.transparentBackground = true;  // mp4 can't carry alpha

    ExportResult result = exporter.run(s, WordSequence::fromText("a"), sink);
    EXPECT_EQ(result.status.kind, ErrorKind::Configuration);
    EXPECT_FALSE(sink.opened);

    EXPECT_EQ(exporter.start(smallSession(), WordSequence{}, "out").kind,
              ErrorKind::Configuration);
    EXPECT_FALSE(exporter.isRunning());
}

TEST_F(FrameExporterTest, BackgroundExportWritesPngSequence) {
    juce::File dir = juce::File::createTempFile("wordpulse_frames");
    SessionSettings s = smallSession();
    s.exportSettings.format = ExportFormat::PngSequence;

    FrameExporter exporter;
    ASSERT_TRUE(exporter.start(s, WordSequence::fromText("a b"),
                               dir.getFullPathName().toStdString()).ok());
    exporter.wait();
    EXPECT_FALSE(exporter.isRunning());

    ExportResult result = exporter.lastResult();
    ASSERT_TRUE(result.status.ok()) << result.status.describe();
    EXPECT_EQ(result.framesWritten, 10);
    EXPECT_TRUE(dir.getChildFile("frame_000000.png").existsAsFile());
    EXPECT_TRUE(dir.getChildFile("frame_000009.png").existsAsFile());
    EXPECT_FALSE(dir.getChildFile("frame_000010.png").exists());
    dir.deleteRecursively();
}

TEST_F(FrameExporterTest, ImageSequenceRefusesAFilePath) {
    juce::File file = juce::File::createTempFile("wordpulse_not_a_dir");
    ASSERT_TRUE(file.create().wasOk());

    ImageSequenceSink sink(file.getFullPathName().toStdString());
    EXPECT_EQ(sink.open().kind, ErrorKind::Resource);
    file.deleteFile();
}

} // namespace
} // namespace wordpulse
