#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

#include "artifacts/transfer_types.h"

namespace ardl {
namespace cli {

/// Single-line progress renderer for artifact downloads
class ProgressRenderer {
public:
    /// @param total_bytes Total bytes to download (0 if unknown)
    /// @param out Stream to render into
    explicit ProgressRenderer(uint64_t total_bytes = 0, std::ostream& out = std::cout);

    /// Update progress
    /// @param downloaded_bytes Bytes downloaded so far
    /// @param speed_bps Current download speed in bytes/second
    void update(uint64_t downloaded_bytes, double speed_bps);

    /// Mark as completed
    void complete();

    /// Mark as failed
    /// @param error_message Error message to display
    void fail(const std::string& error_message);

    /// Dispatch a progress sample to update/complete/fail
    void onSample(const ProgressSample& sample);

    /// Set the current phase/step name (e.g., "pulling qwen3-8b-q4")
    void setPhase(const std::string& phase);

    bool finished() const { return completed_ || failed_; }

    /// Get progress bar string
    /// @return Progress bar string (e.g., " 45% [=========>          ]")
    static std::string formatProgressBar(uint64_t downloaded_bytes, uint64_t total_bytes, int width = 20);

    /// Format bytes as human-readable string (e.g., "6.4 GB", "128 B")
    static std::string formatBytes(uint64_t bytes);

    /// Format speed as human-readable string (e.g., "45.2 MB/s")
    static std::string formatSpeed(double bps);

    /// Format duration as human-readable string (e.g., "2m 30s", "45s")
    static std::string formatDuration(double seconds);

private:
    uint64_t total_bytes_;
    uint64_t downloaded_bytes_{0};
    std::string phase_;
    std::chrono::steady_clock::time_point start_time_;
    bool completed_{false};
    bool failed_{false};
    size_t last_length_{0};
    std::ostream& out_;

    /// Clear current line and print new content
    void clearAndPrint(const std::string& content);
};

}  // namespace cli
}  // namespace ardl
