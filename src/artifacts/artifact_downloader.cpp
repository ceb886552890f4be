#include "artifacts/artifact_downloader.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ardl {

namespace {

double percentOf(uint64_t downloaded, uint64_t total) {
    if (total == 0) return 0.0;
    return std::min(100.0, static_cast<double>(downloaded) * 100.0 / static_cast<double>(total));
}

void notify(const ProgressCallback& cb, const ProgressSample& sample) {
    if (!cb) return;
    try {
        cb(sample);
    } catch (const std::exception& e) {
        spdlog::warn("ArtifactDownloader: progress callback threw for {}: {}", sample.artifact_id, e.what());
    }
}

}  // namespace

ArtifactDownloader::ArtifactDownloader(std::shared_ptr<HttpTransport> transport,
                                       DownloadOptions options,
                                       SteadyClock clock)
    : transport_(std::move(transport)), options_(options), clock_(std::move(clock)) {
    if (!transport_) {
        throw std::invalid_argument("ArtifactDownloader requires a transport");
    }
    if (options_.chunk_size == 0) {
        options_.chunk_size = 64 * 1024;
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

DownloadResult ArtifactDownloader::download(const ArtifactDescriptor& descriptor,
                                            const fs::path& staging_path,
                                            const ProgressCallback& cb) const {
    DownloadResult result;
    const uint64_t total = descriptor.size_bytes;
    uint64_t downloaded = 0;

    auto last_sample_time = clock_();
    uint64_t last_sample_bytes = 0;
    bool has_baseline = false;
    bool final_sample_sent = false;

    auto make_sample = [&](TransferStatus status) {
        ProgressSample sample;
        sample.artifact_id = descriptor.id;
        sample.downloaded_bytes = downloaded;
        sample.total_bytes = total;
        sample.percentage = percentOf(downloaded, total);
        sample.status = status;
        return sample;
    };

    auto emit_progress = [&](std::chrono::steady_clock::time_point now) {
        ProgressSample sample = make_sample(TransferStatus::Downloading);
        if (has_baseline) {
            const double elapsed = std::chrono::duration<double>(now - last_sample_time).count();
            if (elapsed > 0.0) {
                sample.speed_bps = static_cast<double>(downloaded - last_sample_bytes) / elapsed;
            }
        }
        has_baseline = true;
        last_sample_time = now;
        last_sample_bytes = downloaded;
        spdlog::debug("ArtifactDownloader: {} {}/{} bytes ({:.1f}%)",
                      descriptor.id, downloaded, total, sample.percentage);
        notify(cb, sample);
    };

    std::ofstream ofs;
    std::vector<char> buffer;
    std::string io_error;

    auto flush = [&]() {
        if (buffer.empty()) return true;
        ofs.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (!ofs) {
            io_error = "write to " + staging_path.string() + " failed";
            return false;
        }
        buffer.clear();
        return true;
    };

    auto fail = [&](const std::string& message) {
        if (ofs.is_open()) ofs.close();
        std::error_code ec;
        fs::remove(staging_path, ec);
        result.ok = false;
        result.bytes_written = downloaded;
        result.error = message.empty() ? "download failed" : message;
        spdlog::error("ArtifactDownloader: {} failed after {} bytes: {}", descriptor.id, downloaded, result.error);
        ProgressSample sample = make_sample(TransferStatus::Error);
        sample.error = result.error;
        notify(cb, sample);
        return result;
    };

    try {
        fs::create_directories(staging_path.parent_path());
        ofs.open(staging_path, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            return fail("cannot open staging file " + staging_path.string());
        }
        buffer.reserve(options_.chunk_size);

        spdlog::info("ArtifactDownloader: GET {} -> {}", descriptor.url, staging_path.string());
        transport_->streamGet(
            descriptor.url,
            [&](const HttpResponseHead& head) {
                if (head.content_length && total > 0 && *head.content_length != total) {
                    spdlog::warn("ArtifactDownloader: {} declares {} bytes, server sends {}",
                                 descriptor.id, total, *head.content_length);
                }
                return true;
            },
            [&](const char* data, size_t length) {
                size_t offset = 0;
                while (offset < length) {
                    const size_t room = options_.chunk_size - buffer.size();
                    const size_t take = std::min(room, length - offset);
                    buffer.insert(buffer.end(), data + offset, data + offset + take);
                    offset += take;
                    if (buffer.size() >= options_.chunk_size && !flush()) {
                        return false;
                    }
                }
                downloaded += length;

                const auto now = clock_();
                const bool final_chunk = total > 0 && downloaded >= total && !final_sample_sent;
                if (final_chunk || now - last_sample_time >= options_.progress_interval) {
                    if (final_chunk) final_sample_sent = true;
                    emit_progress(now);
                }
                return true;
            });

        if (!flush()) {
            return fail(io_error);
        }
        ofs.close();
        if (ofs.fail()) {
            return fail("closing staging file " + staging_path.string() + " failed");
        }
    } catch (const TransportError& e) {
        return fail(io_error.empty() ? e.what() : io_error);
    } catch (const std::exception& e) {
        return fail(e.what());
    }

    result.ok = true;
    result.bytes_written = downloaded;
    spdlog::info("ArtifactDownloader: {} streamed {} bytes", descriptor.id, downloaded);
    return result;
}

}  // namespace ardl
