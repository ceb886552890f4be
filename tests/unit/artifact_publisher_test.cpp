#include <gtest/gtest.h>
#include <filesystem>

#include "artifacts/artifact_publisher.h"
#include "test_support.h"

using namespace ardl;
using ardl::test::TempDir;
using ardl::test::readFile;
using ardl::test::writeFile;
namespace fs = std::filesystem;

TEST(ArtifactPublisherTest, RenamesStagingToFinal) {
    TempDir tmp;
    const auto staging = tmp.path / "model.gguf.tmp";
    const auto final_path = tmp.path / "model.gguf";
    writeFile(staging, "weights");

    ArtifactPublisher publisher;
    auto result = publisher.publish(staging, final_path);

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_FALSE(fs::exists(staging));
    EXPECT_EQ(readFile(final_path), "weights");
}

TEST(ArtifactPublisherTest, ReplacesExistingFinalFile) {
    TempDir tmp;
    const auto staging = tmp.path / "model.gguf.tmp";
    const auto final_path = tmp.path / "model.gguf";
    writeFile(final_path, "old");
    writeFile(staging, "new");

    ArtifactPublisher publisher;
    ASSERT_TRUE(publisher.publish(staging, final_path).ok);
    EXPECT_EQ(readFile(final_path), "new");
}

TEST(ArtifactPublisherTest, MissingStagingFileFails) {
    TempDir tmp;
    ArtifactPublisher publisher;
    auto result = publisher.publish(tmp.path / "absent.tmp", tmp.path / "absent");

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(fs::exists(tmp.path / "absent"));
}

TEST(ArtifactPublisherTest, MissingTargetDirectoryFails) {
    TempDir tmp;
    const auto staging = tmp.path / "model.gguf.tmp";
    writeFile(staging, "weights");

    ArtifactPublisher publisher;
    auto result = publisher.publish(staging, tmp.path / "no" / "such" / "dir" / "model.gguf");

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(fs::exists(staging));
}
