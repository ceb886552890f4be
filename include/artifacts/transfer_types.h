#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace ardl {

enum class TransferStatus {
    Downloading,
    Complete,
    Error,
    Paused,
};

const char* to_string(TransferStatus status);

struct ProgressSample {
    std::string artifact_id;
    uint64_t downloaded_bytes{0};
    uint64_t total_bytes{0};
    double percentage{0.0};
    double speed_bps{0.0};
    TransferStatus status{TransferStatus::Downloading};
    std::optional<std::string> error;
};

nlohmann::json toJson(const ProgressSample& sample);

using ProgressCallback = std::function<void(const ProgressSample& sample)>;

// Outcome of one startTransfer() invocation.
enum class TransferCode : int {
    kOk = 0,
    kAlreadyPresent = 1,
    kNotFound = 2,
    kAlreadyInFlight = 3,
    kTransferFailure = 4,
    kIntegrityFailure = 5,
    kPublishFailure = 6,
};

inline const char* to_string(TransferCode code) {
    switch (code) {
        case TransferCode::kOk:
            return "OK";
        case TransferCode::kAlreadyPresent:
            return "ALREADY_PRESENT";
        case TransferCode::kNotFound:
            return "NOT_FOUND";
        case TransferCode::kAlreadyInFlight:
            return "ALREADY_IN_FLIGHT";
        case TransferCode::kTransferFailure:
            return "TRANSFER_FAILURE";
        case TransferCode::kIntegrityFailure:
            return "INTEGRITY_FAILURE";
        case TransferCode::kPublishFailure:
            return "PUBLISH_FAILURE";
    }
    return "UNKNOWN";
}

struct TransferResult {
    TransferCode code{TransferCode::kOk};
    std::string error;

    // The artifact is available under its final name.
    bool ok() const { return code == TransferCode::kOk || code == TransferCode::kAlreadyPresent; }
};

struct IntegrityReport {
    bool valid{false};
    bool exists{false};
    bool size_match{false};
    uint64_t expected_size{0};
    uint64_t actual_size{0};
    // Only populated when the descriptor declares a checksum.
    std::optional<bool> checksum_match;
    std::optional<std::string> computed_hash;
    std::optional<std::string> expected_hash;
    std::optional<std::string> error;
};

nlohmann::json toJson(const IntegrityReport& report);

struct ArtifactStatus {
    enum class State {
        Absent,
        Downloading,
        Downloaded,
    };
    State state{State::Absent};
    std::optional<ProgressSample> progress;  // set while Downloading
};

const char* to_string(ArtifactStatus::State state);

}  // namespace ardl
