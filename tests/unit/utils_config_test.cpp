#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <filesystem>

#include "utils/config.h"
#include "test_support.h"

using namespace ardl;
using ardl::test::EnvGuard;
using ardl::test::TempDir;
namespace fs = std::filesystem;

namespace {
const std::vector<std::string> kConfigEnv = {
    "HOME", "ARDL_CONFIG", "ARDL_STORE_DIR", "ARDL_CATALOG", "ARDL_AUDIT_LOG",
    "ARDL_TIMEOUT_SEC", "ARDL_CHUNK_SIZE", "ARDL_PROGRESS_INTERVAL_MS", "HF_TOKEN"};
}  // namespace

TEST(UtilsConfigTest, DefaultsLiveUnderArdlDir) {
    EnvGuard guard(kConfigEnv);
    TempDir home("cfg-home");
    setenv("HOME", home.path.string().c_str(), 1);

    auto [cfg, log] = loadStoreConfigWithLog();

    EXPECT_EQ(cfg.store_dir, (home.path / ".ardl" / "artifacts").string());
    EXPECT_EQ(cfg.audit_log_path, (home.path / ".ardl" / "audit.jsonl").string());
    EXPECT_TRUE(cfg.catalog_path.empty());
    EXPECT_EQ(cfg.transfer_timeout, std::chrono::seconds(600));
    EXPECT_EQ(cfg.chunk_size, 64u * 1024u);
    EXPECT_EQ(cfg.progress_interval, std::chrono::milliseconds(1000));
    EXPECT_TRUE(cfg.hf_token.empty());
    EXPECT_NE(log.find("sources=default"), std::string::npos);
}

TEST(UtilsConfigTest, LoadsConfigFile) {
    EnvGuard guard(kConfigEnv);
    TempDir tmp("cfg-file");
    setenv("HOME", tmp.path.string().c_str(), 1);

    const auto path = tmp.path / "ardl.json";
    std::ofstream(path) << R"({
        "store_dir": "/data/artifacts",
        "catalog": "/etc/ardl/catalog.json",
        "audit_log": "/var/log/ardl/audit.jsonl",
        "timeout_sec": 30,
        "chunk_size": 4096,
        "progress_interval_ms": 250
    })";
    setenv("ARDL_CONFIG", path.string().c_str(), 1);

    auto [cfg, log] = loadStoreConfigWithLog();

    EXPECT_EQ(cfg.store_dir, "/data/artifacts");
    EXPECT_EQ(cfg.catalog_path, "/etc/ardl/catalog.json");
    EXPECT_EQ(cfg.audit_log_path, "/var/log/ardl/audit.jsonl");
    EXPECT_EQ(cfg.transfer_timeout, std::chrono::seconds(30));
    EXPECT_EQ(cfg.chunk_size, 4096u);
    EXPECT_EQ(cfg.progress_interval, std::chrono::milliseconds(250));
    EXPECT_NE(log.find("file="), std::string::npos);
    EXPECT_NE(log.find("sources=file"), std::string::npos);
}

TEST(UtilsConfigTest, DefaultConfigPathIsArdlDir) {
    EnvGuard guard(kConfigEnv);
    TempDir home("cfg-home");
    setenv("HOME", home.path.string().c_str(), 1);
    fs::create_directories(home.path / ".ardl");
    std::ofstream(home.path / ".ardl" / "config.json") << R"({"store_dir": "/from/default/file"})";

    auto [cfg, log] = loadStoreConfigWithLog();
    EXPECT_EQ(cfg.store_dir, "/from/default/file");
    EXPECT_NE(log.find(".ardl/config.json"), std::string::npos);
}

TEST(UtilsConfigTest, EnvOverridesFile) {
    EnvGuard guard(kConfigEnv);
    TempDir tmp("cfg-env");
    setenv("HOME", tmp.path.string().c_str(), 1);

    const auto path = tmp.path / "ardl.json";
    std::ofstream(path) << R"({"store_dir": "/file/store", "timeout_sec": 30})";
    setenv("ARDL_CONFIG", path.string().c_str(), 1);
    setenv("ARDL_STORE_DIR", "/env/store", 1);
    setenv("ARDL_TIMEOUT_SEC", "90", 1);
    setenv("ARDL_CHUNK_SIZE", "1024", 1);
    setenv("ARDL_PROGRESS_INTERVAL_MS", "50", 1);
    setenv("HF_TOKEN", "hf_secret", 1);

    auto [cfg, log] = loadStoreConfigWithLog();

    EXPECT_EQ(cfg.store_dir, "/env/store");
    EXPECT_EQ(cfg.transfer_timeout, std::chrono::seconds(90));
    EXPECT_EQ(cfg.chunk_size, 1024u);
    EXPECT_EQ(cfg.progress_interval, std::chrono::milliseconds(50));
    EXPECT_EQ(cfg.hf_token, "hf_secret");
    EXPECT_NE(log.find("sources=env,file"), std::string::npos);
    // Tokens are never echoed into the log line.
    EXPECT_EQ(log.find("hf_secret"), std::string::npos);
}

TEST(UtilsConfigTest, InvalidNumericEnvIsIgnored) {
    EnvGuard guard(kConfigEnv);
    TempDir home("cfg-bad");
    setenv("HOME", home.path.string().c_str(), 1);
    setenv("ARDL_TIMEOUT_SEC", "soon", 1);
    setenv("ARDL_CHUNK_SIZE", "-5", 1);
    setenv("ARDL_PROGRESS_INTERVAL_MS", "0", 1);

    auto cfg = loadStoreConfig();
    EXPECT_EQ(cfg.transfer_timeout, std::chrono::seconds(600));
    EXPECT_EQ(cfg.chunk_size, 64u * 1024u);
    EXPECT_EQ(cfg.progress_interval, std::chrono::milliseconds(1000));
}

TEST(UtilsConfigTest, OversizedChunkIsIgnored) {
    EnvGuard guard(kConfigEnv);
    TempDir home("cfg-chunk");
    setenv("HOME", home.path.string().c_str(), 1);
    setenv("ARDL_CHUNK_SIZE", "1073741824", 1);

    EXPECT_EQ(loadStoreConfig().chunk_size, 64u * 1024u);
}

TEST(UtilsConfigTest, OutOfRangeFileValuesAreIgnored) {
    EnvGuard guard(kConfigEnv);
    TempDir tmp("cfg-range");
    setenv("HOME", tmp.path.string().c_str(), 1);

    const auto path = tmp.path / "ardl.json";
    std::ofstream(path) << R"({
        "timeout_sec": 18446744073709551615,
        "chunk_size": 1073741824,
        "progress_interval_ms": 0
    })";
    setenv("ARDL_CONFIG", path.string().c_str(), 1);

    auto cfg = loadStoreConfig();
    EXPECT_EQ(cfg.transfer_timeout, std::chrono::seconds(600));
    EXPECT_EQ(cfg.chunk_size, 64u * 1024u);
    EXPECT_EQ(cfg.progress_interval, std::chrono::milliseconds(1000));
}

TEST(UtilsConfigTest, HugeTimeoutEnvIsIgnored) {
    EnvGuard guard(kConfigEnv);
    TempDir home("cfg-timeout");
    setenv("HOME", home.path.string().c_str(), 1);
    setenv("ARDL_TIMEOUT_SEC", "9223372036854775807", 1);

    auto cfg = loadStoreConfig();
    EXPECT_EQ(cfg.transfer_timeout, std::chrono::seconds(600));
    // The accepted value still converts to milliseconds without overflow.
    EXPECT_GT(std::chrono::duration_cast<std::chrono::milliseconds>(cfg.transfer_timeout).count(), 0);

    setenv("ARDL_TIMEOUT_SEC", "86400", 1);
    EXPECT_EQ(loadStoreConfig().transfer_timeout, std::chrono::seconds(86400));
}

TEST(UtilsConfigTest, MalformedConfigFileFallsBackToDefaults) {
    EnvGuard guard(kConfigEnv);
    TempDir tmp("cfg-broken");
    setenv("HOME", tmp.path.string().c_str(), 1);

    const auto path = tmp.path / "broken.json";
    std::ofstream(path) << "{ this is not json";
    setenv("ARDL_CONFIG", path.string().c_str(), 1);

    auto [cfg, log] = loadStoreConfigWithLog();
    EXPECT_EQ(cfg.store_dir, (tmp.path / ".ardl" / "artifacts").string());
    EXPECT_NE(log.find("sources=default"), std::string::npos);
}
