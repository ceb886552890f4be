#include "cli/progress_renderer.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ardl {
namespace cli {

ProgressRenderer::ProgressRenderer(uint64_t total_bytes, std::ostream& out)
    : total_bytes_(total_bytes)
    , start_time_(std::chrono::steady_clock::now())
    , out_(out)
{
}

void ProgressRenderer::update(uint64_t downloaded_bytes, double speed_bps) {
    if (completed_ || failed_) {
        return;
    }

    downloaded_bytes_ = downloaded_bytes;

    std::ostringstream oss;

    if (!phase_.empty()) {
        oss << phase_ << " ";
    }

    if (total_bytes_ > 0) {
        oss << formatProgressBar(downloaded_bytes_, total_bytes_);
        oss << " ";
    }

    oss << formatBytes(downloaded_bytes_);
    if (total_bytes_ > 0) {
        oss << "/" << formatBytes(total_bytes_);
    }

    if (speed_bps > 0) {
        oss << " " << formatSpeed(speed_bps);
    }

    // ETA (if total is known and speed > 0)
    if (total_bytes_ > 0 && speed_bps > 0 && downloaded_bytes_ < total_bytes_) {
        double remaining_bytes = static_cast<double>(total_bytes_ - downloaded_bytes_);
        oss << " ETA " << formatDuration(remaining_bytes / speed_bps);
    }

    clearAndPrint(oss.str());
}

void ProgressRenderer::complete() {
    if (completed_ || failed_) {
        return;
    }

    completed_ = true;

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);
    double seconds = duration.count() / 1000.0;

    std::ostringstream oss;
    if (!phase_.empty()) {
        oss << phase_ << " ";
    }
    oss << "complete";

    if (total_bytes_ > 0) {
        oss << " " << formatBytes(total_bytes_);
    }

    if (seconds > 0) {
        oss << " in " << formatDuration(seconds);
    }

    clearAndPrint(oss.str());
    out_ << std::endl;
}

void ProgressRenderer::fail(const std::string& error_message) {
    if (completed_ || failed_) {
        return;
    }

    failed_ = true;

    std::ostringstream oss;
    if (!phase_.empty()) {
        oss << phase_ << " ";
    }
    oss << "failed: " << error_message;

    clearAndPrint(oss.str());
    out_ << std::endl;
}

void ProgressRenderer::onSample(const ProgressSample& sample) {
    if (sample.total_bytes > 0) {
        total_bytes_ = sample.total_bytes;
    }
    switch (sample.status) {
        case TransferStatus::Complete:
            complete();
            break;
        case TransferStatus::Error:
            fail(sample.error.value_or("unknown error"));
            break;
        case TransferStatus::Downloading:
        case TransferStatus::Paused:
            update(sample.downloaded_bytes, sample.speed_bps);
            break;
    }
}

void ProgressRenderer::setPhase(const std::string& phase) {
    phase_ = phase;
}

std::string ProgressRenderer::formatProgressBar(uint64_t downloaded_bytes, uint64_t total_bytes, int width) {
    if (total_bytes == 0) {
        return "";
    }

    double progress = std::min(1.0, static_cast<double>(downloaded_bytes) / static_cast<double>(total_bytes));
    int filled = static_cast<int>(progress * width);

    std::ostringstream oss;
    int percent = static_cast<int>(progress * 100);
    oss << std::setw(3) << percent << "% [";

    for (int i = 0; i < width; ++i) {
        if (i < filled) {
            oss << "=";
        } else if (i == filled) {
            oss << ">";
        } else {
            oss << " ";
        }
    }

    oss << "]";
    return oss.str();
}

std::string ProgressRenderer::formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << static_cast<uint64_t>(size) << " " << units[unit_index];
    } else {
        oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    }

    return oss.str();
}

std::string ProgressRenderer::formatSpeed(double bps) {
    const char* units[] = {"B/s", "KB/s", "MB/s", "GB/s"};
    int unit_index = 0;
    double speed = bps;

    while (speed >= 1024.0 && unit_index < 3) {
        speed /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << speed << " " << units[unit_index];
    return oss.str();
}

std::string ProgressRenderer::formatDuration(double seconds) {
    std::ostringstream oss;

    if (seconds < 60) {
        oss << static_cast<int>(std::ceil(seconds)) << "s";
    } else if (seconds < 3600) {
        int minutes = static_cast<int>(seconds / 60);
        int secs = static_cast<int>(seconds) % 60;
        oss << minutes << "m " << secs << "s";
    } else {
        int hours = static_cast<int>(seconds / 3600);
        int minutes = (static_cast<int>(seconds) % 3600) / 60;
        oss << hours << "h " << minutes << "m";
    }

    return oss.str();
}

void ProgressRenderer::clearAndPrint(const std::string& content) {
    out_ << "\r" << content;

    // Pad with spaces to clear any remaining characters from previous output
    if (content.length() < last_length_) {
        out_ << std::string(last_length_ - content.length(), ' ');
        out_ << "\r" << content;
    }
    last_length_ = content.length();

    out_.flush();
}

}  // namespace cli
}  // namespace ardl
