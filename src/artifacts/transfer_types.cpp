#include "artifacts/transfer_types.h"

namespace ardl {

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Downloading:
            return "downloading";
        case TransferStatus::Complete:
            return "complete";
        case TransferStatus::Error:
            return "error";
        case TransferStatus::Paused:
            return "paused";
    }
    return "unknown";
}

const char* to_string(ArtifactStatus::State state) {
    switch (state) {
        case ArtifactStatus::State::Absent:
            return "absent";
        case ArtifactStatus::State::Downloading:
            return "downloading";
        case ArtifactStatus::State::Downloaded:
            return "downloaded";
    }
    return "unknown";
}

nlohmann::json toJson(const ProgressSample& sample) {
    nlohmann::json j = {
        {"artifactId", sample.artifact_id},
        {"downloadedBytes", sample.downloaded_bytes},
        {"totalBytes", sample.total_bytes},
        {"percentage", sample.percentage},
        {"speed", sample.speed_bps},
        {"status", to_string(sample.status)},
    };
    j["error"] = sample.error ? nlohmann::json(*sample.error) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json toJson(const IntegrityReport& report) {
    nlohmann::json j = {
        {"valid", report.valid},
        {"exists", report.exists},
    };
    if (report.exists) {
        j["size_match"] = report.size_match;
        j["expected_size"] = report.expected_size;
        j["actual_size"] = report.actual_size;
    }
    if (report.checksum_match) j["checksum_match"] = *report.checksum_match;
    if (report.computed_hash) j["calculated_hash"] = *report.computed_hash;
    if (report.expected_hash) j["expected_hash"] = *report.expected_hash;
    if (report.error) j["error"] = *report.error;
    return j;
}

}  // namespace ardl
