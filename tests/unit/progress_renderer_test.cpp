#include <gtest/gtest.h>
#include "cli/progress_renderer.h"
#include <sstream>

using namespace ardl;
using namespace ardl::cli;

namespace {
ProgressSample sample(uint64_t downloaded, uint64_t total, TransferStatus status) {
    ProgressSample s;
    s.artifact_id = "a";
    s.downloaded_bytes = downloaded;
    s.total_bytes = total;
    s.status = status;
    return s;
}
}  // namespace

TEST(ProgressRendererTest, UpdateRendersBarAndBytes) {
    std::ostringstream out;
    ProgressRenderer renderer(1000, out);
    renderer.setPhase("pulling a");
    renderer.update(500, 100.0);

    const std::string text = out.str();
    EXPECT_NE(text.find("pulling a"), std::string::npos);
    EXPECT_NE(text.find(" 50%"), std::string::npos);
    EXPECT_NE(text.find("500 B/1000 B"), std::string::npos);
    EXPECT_NE(text.find("100.0 B/s"), std::string::npos);
    EXPECT_NE(text.find("ETA 5s"), std::string::npos);
    EXPECT_FALSE(renderer.finished());
}

TEST(ProgressRendererTest, CompleteIsTerminal) {
    std::ostringstream out;
    ProgressRenderer renderer(1000, out);
    renderer.complete();
    EXPECT_TRUE(renderer.finished());
    EXPECT_NE(out.str().find("complete"), std::string::npos);

    const auto before = out.str();
    renderer.update(10, 1.0);
    renderer.fail("late");
    EXPECT_EQ(out.str(), before);
}

TEST(ProgressRendererTest, FailPrintsMessage) {
    std::ostringstream out;
    ProgressRenderer renderer(1000, out);
    renderer.fail("connection reset");
    EXPECT_TRUE(renderer.finished());
    EXPECT_NE(out.str().find("failed: connection reset"), std::string::npos);
}

TEST(ProgressRendererTest, OnSampleDispatchesByStatus) {
    std::ostringstream out;
    ProgressRenderer renderer(0, out);

    renderer.onSample(sample(250, 1000, TransferStatus::Downloading));
    EXPECT_NE(out.str().find(" 25%"), std::string::npos);
    EXPECT_FALSE(renderer.finished());

    auto err = sample(250, 1000, TransferStatus::Error);
    err.error = "checksum mismatch";
    renderer.onSample(err);
    EXPECT_TRUE(renderer.finished());
    EXPECT_NE(out.str().find("failed: checksum mismatch"), std::string::npos);
}

TEST(ProgressRendererTest, CompleteSampleFinishes) {
    std::ostringstream out;
    ProgressRenderer renderer(0, out);
    renderer.onSample(sample(2048, 2048, TransferStatus::Complete));
    EXPECT_TRUE(renderer.finished());
    EXPECT_NE(out.str().find("complete 2.0 KB"), std::string::npos);
}

TEST(ProgressRendererTest, FormatBytes) {
    EXPECT_EQ(ProgressRenderer::formatBytes(512), "512 B");
    EXPECT_EQ(ProgressRenderer::formatBytes(1024), "1.0 KB");
    EXPECT_EQ(ProgressRenderer::formatBytes(1024 * 1024), "1.0 MB");
    EXPECT_EQ(ProgressRenderer::formatBytes(1024ULL * 1024 * 1024 * 5), "5.0 GB");
}

TEST(ProgressRendererTest, FormatSpeed) {
    EXPECT_EQ(ProgressRenderer::formatSpeed(512), "512.0 B/s");
    EXPECT_EQ(ProgressRenderer::formatSpeed(1024.0 * 1024.0), "1.0 MB/s");
}

TEST(ProgressRendererTest, FormatDuration) {
    EXPECT_EQ(ProgressRenderer::formatDuration(30.0), "30s");
    EXPECT_EQ(ProgressRenderer::formatDuration(90.0), "1m 30s");
    EXPECT_EQ(ProgressRenderer::formatDuration(3700.0), "1h 1m");
}

TEST(ProgressRendererTest, FormatProgressBar) {
    EXPECT_EQ(ProgressRenderer::formatProgressBar(0, 0), "");
    EXPECT_EQ(ProgressRenderer::formatProgressBar(50, 100, 10), " 50% [=====>    ]");
    EXPECT_EQ(ProgressRenderer::formatProgressBar(100, 100, 10), "100% [==========]");
    // Overshoot is clamped.
    EXPECT_EQ(ProgressRenderer::formatProgressBar(150, 100, 10), "100% [==========]");
}
