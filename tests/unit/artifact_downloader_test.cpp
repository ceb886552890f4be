#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

#include "artifacts/artifact_downloader.h"
#include "test_support.h"

using namespace ardl;
using ardl::test::FakeTransport;
using ardl::test::TempDir;
using ardl::test::readFile;
using ardl::test::writeFile;
namespace fs = std::filesystem;

namespace {

ArtifactDescriptor make_descriptor(uint64_t size) {
    ArtifactDescriptor d;
    d.id = "blob";
    d.name = "Blob";
    d.file_name = "blob.bin";
    d.url = "http://fake.local/blob.bin";
    d.size_bytes = size;
    return d;
}

// Clock that advances by `step` on every read.
SteadyClock stepping_clock(std::chrono::milliseconds step) {
    auto now = std::make_shared<std::chrono::steady_clock::time_point>();
    return [now, step]() {
        auto current = *now;
        *now += step;
        return current;
    };
}

SteadyClock frozen_clock() {
    return [] { return std::chrono::steady_clock::time_point{}; };
}

}  // namespace

TEST(ArtifactDownloaderTest, RequiresTransport) {
    EXPECT_THROW(ArtifactDownloader(nullptr), std::invalid_argument);
}

TEST(ArtifactDownloaderTest, WritesBodyToStagingFile) {
    TempDir tmp;
    auto transport = std::make_shared<FakeTransport>(std::string(1000, 'x'));
    ArtifactDownloader downloader(transport, DownloadOptions{}, frozen_clock());

    const auto staging = tmp.path / "blob.bin.tmp";
    auto result = downloader.download(make_descriptor(1000), staging);

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.bytes_written, 1000u);
    EXPECT_EQ(readFile(staging), std::string(1000, 'x'));
    EXPECT_EQ(transport->calls.load(), 1);
    EXPECT_EQ(transport->last_url, "http://fake.local/blob.bin");
}

TEST(ArtifactDownloaderTest, SmallWriteBufferKeepsContentIntact) {
    TempDir tmp;
    std::string body;
    for (int i = 0; i < 777; ++i) body.push_back(static_cast<char>('a' + i % 26));
    auto transport = std::make_shared<FakeTransport>(body);
    transport->chunk = 100;

    DownloadOptions options;
    options.chunk_size = 64;
    ArtifactDownloader downloader(transport, options, frozen_clock());

    const auto staging = tmp.path / "blob.bin.tmp";
    auto result = downloader.download(make_descriptor(body.size()), staging);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(readFile(staging), body);
}

TEST(ArtifactDownloaderTest, TruncatesLeftoverStagingFile) {
    TempDir tmp;
    const auto staging = tmp.path / "blob.bin.tmp";
    writeFile(staging, std::string(5000, 'o'));

    auto transport = std::make_shared<FakeTransport>("fresh");
    ArtifactDownloader downloader(transport, DownloadOptions{}, frozen_clock());
    ASSERT_TRUE(downloader.download(make_descriptor(5), staging).ok);
    EXPECT_EQ(readFile(staging), "fresh");
}

TEST(ArtifactDownloaderTest, ProgressIsThrottledByInterval) {
    TempDir tmp;
    auto transport = std::make_shared<FakeTransport>(std::string(1000, 'x'));
    transport->chunk = 100;

    DownloadOptions options;
    options.progress_interval = std::chrono::milliseconds(1000);
    ArtifactDownloader downloader(transport, options, stepping_clock(std::chrono::milliseconds(250)));

    std::vector<ProgressSample> samples;
    auto result = downloader.download(make_descriptor(1000), tmp.path / "blob.bin.tmp",
                                      [&](const ProgressSample& s) { samples.push_back(s); });

    ASSERT_TRUE(result.ok);
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_EQ(samples[0].downloaded_bytes, 400u);
    EXPECT_EQ(samples[1].downloaded_bytes, 800u);
    EXPECT_EQ(samples[2].downloaded_bytes, 1000u);

    // First sample has no baseline.
    EXPECT_DOUBLE_EQ(samples[0].speed_bps, 0.0);
    EXPECT_NEAR(samples[1].speed_bps, 400.0, 1e-6);
    EXPECT_NEAR(samples[2].speed_bps, 400.0, 1e-6);

    EXPECT_DOUBLE_EQ(samples[0].percentage, 40.0);
    EXPECT_DOUBLE_EQ(samples[2].percentage, 100.0);
    for (const auto& s : samples) {
        EXPECT_EQ(s.status, TransferStatus::Downloading);
        EXPECT_EQ(s.total_bytes, 1000u);
        EXPECT_EQ(s.artifact_id, "blob");
    }
}

TEST(ArtifactDownloaderTest, FinalChunkAlwaysReported) {
    TempDir tmp;
    auto transport = std::make_shared<FakeTransport>(std::string(1000, 'x'));
    ArtifactDownloader downloader(transport, DownloadOptions{}, frozen_clock());

    std::vector<ProgressSample> samples;
    ASSERT_TRUE(downloader.download(make_descriptor(1000), tmp.path / "blob.bin.tmp",
                                    [&](const ProgressSample& s) { samples.push_back(s); }).ok);

    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].downloaded_bytes, 1000u);
    EXPECT_DOUBLE_EQ(samples[0].percentage, 100.0);
}

TEST(ArtifactDownloaderTest, PercentageIsZeroWhenSizeUnknown) {
    TempDir tmp;
    auto transport = std::make_shared<FakeTransport>(std::string(300, 'x'));
    ArtifactDownloader downloader(transport, DownloadOptions{}, stepping_clock(std::chrono::seconds(2)));

    std::vector<ProgressSample> samples;
    ASSERT_TRUE(downloader.download(make_descriptor(0), tmp.path / "blob.bin.tmp",
                                    [&](const ProgressSample& s) { samples.push_back(s); }).ok);

    ASSERT_FALSE(samples.empty());
    for (const auto& s : samples) {
        EXPECT_DOUBLE_EQ(s.percentage, 0.0);
    }
}

TEST(ArtifactDownloaderTest, TransportFailureRemovesStagingAndReportsOnce) {
    TempDir tmp;
    auto transport = std::make_shared<FakeTransport>(std::string(1000, 'x'));
    transport->fail_after = 400;
    ArtifactDownloader downloader(transport, DownloadOptions{}, frozen_clock());

    const auto staging = tmp.path / "blob.bin.tmp";
    std::vector<ProgressSample> samples;
    auto result = downloader.download(make_descriptor(1000), staging,
                                      [&](const ProgressSample& s) { samples.push_back(s); });

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.bytes_written, 400u);
    EXPECT_NE(result.error.find("connection reset"), std::string::npos);
    EXPECT_FALSE(fs::exists(staging));

    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].status, TransferStatus::Error);
    EXPECT_EQ(samples[0].downloaded_bytes, 400u);
    ASSERT_TRUE(samples[0].error.has_value());
}

TEST(ArtifactDownloaderTest, HttpErrorStatusFails) {
    TempDir tmp;
    auto transport = std::make_shared<FakeTransport>("not found");
    transport->status = 404;
    ArtifactDownloader downloader(transport, DownloadOptions{}, frozen_clock());

    const auto staging = tmp.path / "blob.bin.tmp";
    auto result = downloader.download(make_descriptor(10), staging);

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("404"), std::string::npos);
    EXPECT_FALSE(fs::exists(staging));
}

TEST(ArtifactDownloaderTest, ThrowingCallbackDoesNotAbortTransfer) {
    TempDir tmp;
    auto transport = std::make_shared<FakeTransport>(std::string(1000, 'x'));
    ArtifactDownloader downloader(transport, DownloadOptions{}, stepping_clock(std::chrono::seconds(5)));

    int calls = 0;
    auto result = downloader.download(make_descriptor(1000), tmp.path / "blob.bin.tmp",
                                      [&](const ProgressSample&) {
                                          ++calls;
                                          throw std::runtime_error("observer failure");
                                      });

    EXPECT_TRUE(result.ok);
    EXPECT_GT(calls, 1);
}

TEST(ArtifactDownloaderTest, CreatesMissingStagingDirectory) {
    TempDir tmp;
    auto transport = std::make_shared<FakeTransport>("abc");
    ArtifactDownloader downloader(transport, DownloadOptions{}, frozen_clock());

    const auto staging = tmp.path / "nested" / "store" / "blob.bin.tmp";
    ASSERT_TRUE(downloader.download(make_descriptor(3), staging).ok);
    EXPECT_EQ(readFile(staging), "abc");
}
