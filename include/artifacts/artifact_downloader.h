#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "artifacts/artifact_descriptor.h"
#include "artifacts/transfer_types.h"
#include "net/http_transport.h"

namespace ardl {

struct DownloadOptions {
    size_t chunk_size{64 * 1024};                        // write buffer size
    std::chrono::milliseconds progress_interval{1000};   // minimum gap between samples
};

struct DownloadResult {
    bool ok{false};
    uint64_t bytes_written{0};
    std::string error;
};

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

class ArtifactDownloader {
public:
    // Throws std::invalid_argument when transport is null.
    explicit ArtifactDownloader(std::shared_ptr<HttpTransport> transport,
                                DownloadOptions options = {},
                                SteadyClock clock = nullptr);

    // Stream descriptor.url into staging_path (truncated first; transfers
    // always restart from byte zero). Progress samples are throttled to one
    // per progress_interval plus one on the final chunk.
    // Network and I/O failures do not throw: the staging file is removed, one
    // Error sample is emitted, and ok == false is returned.
    DownloadResult download(const ArtifactDescriptor& descriptor,
                            const std::filesystem::path& staging_path,
                            const ProgressCallback& cb = nullptr) const;

    const DownloadOptions& options() const { return options_; }

private:
    std::shared_ptr<HttpTransport> transport_;
    DownloadOptions options_;
    SteadyClock clock_;
};

}  // namespace ardl
