#include "artifacts/transfer_coordinator.h"

#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ardl {

class TransferCoordinator::InFlightGuard {
public:
    InFlightGuard(TransferCoordinator& owner, std::string artifact_id)
        : owner_(owner), artifact_id_(std::move(artifact_id)) {}
    ~InFlightGuard() { owner_.finish(artifact_id_); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    TransferCoordinator& owner_;
    std::string artifact_id_;
};

namespace {

ProgressSample completeSample(const std::string& artifact_id, uint64_t bytes) {
    ProgressSample sample;
    sample.artifact_id = artifact_id;
    sample.downloaded_bytes = bytes;
    sample.total_bytes = bytes;
    sample.percentage = 100.0;
    sample.status = TransferStatus::Complete;
    return sample;
}

void deliver(const ProgressCallback& cb, const ProgressSample& sample) {
    if (!cb) return;
    try {
        cb(sample);
    } catch (const std::exception& e) {
        spdlog::warn("TransferCoordinator: progress callback threw for {}: {}", sample.artifact_id, e.what());
    }
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("TransferCoordinator: could not remove {}: {}", path.string(), ec.message());
    }
}

}  // namespace

TransferCoordinator::TransferCoordinator(const ArtifactCatalog& catalog,
                                         ArtifactDownloader downloader,
                                         std::shared_ptr<AuditSink> audit_sink,
                                         IntegrityVerifier verifier,
                                         ArtifactPublisher publisher)
    : catalog_(catalog),
      downloader_(std::move(downloader)),
      audit_sink_(audit_sink ? std::move(audit_sink) : std::make_shared<NullAuditSink>()),
      verifier_(verifier),
      publisher_(publisher) {
    fs::create_directories(catalog_.storeDir());
    spdlog::info("TransferCoordinator initialized: store_dir={} artifacts={}",
                 catalog_.storeDir().string(), catalog_.list().size());
}

bool TransferCoordinator::tryBegin(const std::string& artifact_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::system_clock::now();
    InFlightMarker marker;
    marker.started_at = now;
    marker.last_progress_at = now;
    return in_flight_.emplace(artifact_id, marker).second;
}

void TransferCoordinator::finish(const std::string& artifact_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(artifact_id);
}

void TransferCoordinator::recordProgress(const ProgressSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(sample.artifact_id);
    if (it == in_flight_.end()) return;
    it->second.last_progress_at = std::chrono::system_clock::now();
    it->second.latest = sample;
}

void TransferCoordinator::emitAudit(const AuditEvent& event) {
    try {
        audit_sink_->record(event);
    } catch (const std::exception& e) {
        spdlog::warn("TransferCoordinator: audit sink rejected {} for {}: {}",
                     event.event_type, event.artifact_id, e.what());
    }
}

TransferResult TransferCoordinator::startTransfer(const std::string& artifact_id,
                                                  const ProgressCallback& cb,
                                                  const std::optional<std::string>& actor_id) {
    auto descriptor = catalog_.find(artifact_id);
    if (!descriptor) {
        spdlog::error("TransferCoordinator: artifact not found in catalog: {}", artifact_id);
        return {TransferCode::kNotFound, "artifact not found: " + artifact_id};
    }

    if (catalog_.isPresent(artifact_id)) {
        spdlog::info("TransferCoordinator: artifact already downloaded: {}", artifact_id);
        deliver(cb, completeSample(artifact_id, descriptor->size_bytes));
        return {TransferCode::kAlreadyPresent, ""};
    }

    if (!tryBegin(artifact_id)) {
        spdlog::warn("TransferCoordinator: download already in progress: {}", artifact_id);
        return {TransferCode::kAlreadyInFlight, "download already in progress: " + artifact_id};
    }
    InFlightGuard guard(*this, artifact_id);

    // A transfer that finished between the presence check and tryBegin
    // has already published the file.
    if (catalog_.isPresent(artifact_id)) {
        deliver(cb, completeSample(artifact_id, descriptor->size_bytes));
        return {TransferCode::kAlreadyPresent, ""};
    }

    return runPipeline(*descriptor, cb, actor_id);
}

TransferResult TransferCoordinator::runPipeline(const ArtifactDescriptor& descriptor,
                                                const ProgressCallback& cb,
                                                const std::optional<std::string>& actor_id) {
    const fs::path staging = catalog_.stagingPath(descriptor);
    const fs::path final_path = catalog_.finalPath(descriptor);
    const auto started = std::chrono::steady_clock::now();

    spdlog::info("TransferCoordinator: starting download {} from {}", descriptor.id, descriptor.url);
    {
        AuditEvent event;
        event.event_type = "artifact.download.started";
        event.artifact_id = descriptor.id;
        event.actor_id = actor_id;
        event.action = "download";
        event.details = {{"url", descriptor.url},
                         {"size", descriptor.size_bytes},
                         {"file_name", descriptor.file_name}};
        emitAudit(event);
    }

    bool terminal_sent = false;
    uint64_t last_bytes = 0;
    double last_percentage = 0.0;
    auto forward = [&](const ProgressSample& sample) {
        recordProgress(sample);
        last_bytes = std::max(last_bytes, sample.downloaded_bytes);
        last_percentage = std::max(last_percentage, sample.percentage);
        if (sample.status == TransferStatus::Complete || sample.status == TransferStatus::Error) {
            terminal_sent = true;
        }
        deliver(cb, sample);
    };

    auto fail = [&](TransferCode code, const std::string& error, uint64_t bytes, nlohmann::json details) {
        removeQuietly(staging);
        if (!terminal_sent) {
            ProgressSample sample;
            sample.artifact_id = descriptor.id;
            // Never report less progress than an earlier sample did.
            sample.downloaded_bytes = std::max(bytes, last_bytes);
            sample.total_bytes = descriptor.size_bytes;
            sample.percentage = last_percentage;
            sample.status = TransferStatus::Error;
            sample.error = error;
            forward(sample);
        }
        spdlog::error("TransferCoordinator: download failed: {} - {} ({})", descriptor.id, error, to_string(code));

        details["error"] = error;
        details["reason"] = to_string(code);
        AuditEvent event;
        event.event_type = "artifact.download.failed";
        event.artifact_id = descriptor.id;
        event.actor_id = actor_id;
        event.action = "download";
        event.success = false;
        event.error_message = error;
        event.details = std::move(details);
        emitAudit(event);
        return TransferResult{code, error};
    };

    try {
        DownloadResult download = downloader_.download(descriptor, staging, forward);
        if (!download.ok) {
            return fail(TransferCode::kTransferFailure, download.error, download.bytes_written,
                        nlohmann::json::object());
        }

        VerificationResult verification = verifier_.verify(staging, descriptor.sha256);
        if (verification.verdict == VerificationVerdict::Mismatch) {
            return fail(TransferCode::kIntegrityFailure, verification.error, download.bytes_written,
                        {{"expected_hash", *descriptor.sha256},
                         {"calculated_hash", verification.computed_hash}});
        }
        if (!verification.acceptable()) {
            return fail(TransferCode::kTransferFailure, verification.error, download.bytes_written,
                        nlohmann::json::object());
        }

        PublishResult publish = publisher_.publish(staging, final_path);
        if (!publish.ok) {
            return fail(TransferCode::kPublishFailure, publish.error, download.bytes_written,
                        nlohmann::json::object());
        }

        const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started)
                                    .count();
        spdlog::info("TransferCoordinator: download complete: {} -> {} ({} bytes, {} ms)",
                     descriptor.id, final_path.string(), download.bytes_written, elapsed_ms);

        AuditEvent event;
        event.event_type = "artifact.download.completed";
        event.artifact_id = descriptor.id;
        event.actor_id = actor_id;
        event.action = "download";
        event.details = {{"path", final_path.string()},
                         {"size", download.bytes_written},
                         {"checksum_verified", verification.verdict == VerificationVerdict::Match},
                         {"duration_ms", elapsed_ms}};
        emitAudit(event);

        forward(completeSample(descriptor.id, download.bytes_written));
        return {TransferCode::kOk, ""};
    } catch (const std::exception& e) {
        return fail(TransferCode::kTransferFailure, e.what(), last_bytes, nlohmann::json::object());
    }
}

std::future<TransferResult> TransferCoordinator::startTransferAsync(std::string artifact_id,
                                                                    ProgressCallback cb,
                                                                    std::optional<std::string> actor_id) {
    return std::async(std::launch::async,
                      [this, id = std::move(artifact_id), cb = std::move(cb), actor = std::move(actor_id)]() {
                          return startTransfer(id, cb, actor);
                      });
}

bool TransferCoordinator::deleteArtifact(const std::string& artifact_id,
                                         const std::optional<std::string>& actor_id) {
    auto descriptor = catalog_.find(artifact_id);
    if (!descriptor) {
        return false;
    }
    const fs::path path = catalog_.finalPath(*descriptor);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return false;
    }

    const bool removed = fs::remove(path, ec);
    AuditEvent event;
    event.artifact_id = artifact_id;
    event.actor_id = actor_id;
    event.action = "delete";
    event.details = {{"path", path.string()}};
    if (ec || !removed) {
        const std::string error = ec ? ec.message() : std::string("file vanished before removal");
        spdlog::error("TransferCoordinator: failed to delete {}: {}", artifact_id, error);
        event.event_type = "artifact.delete.failed";
        event.success = false;
        event.error_message = error;
        emitAudit(event);
        return false;
    }

    spdlog::info("TransferCoordinator: deleted {} from {}", artifact_id, path.string());
    event.event_type = "artifact.deleted";
    emitAudit(event);
    return true;
}

IntegrityReport TransferCoordinator::verify(const std::string& artifact_id) const {
    IntegrityReport report;
    auto descriptor = catalog_.find(artifact_id);
    if (!descriptor) {
        report.error = "artifact not found in catalog";
        return report;
    }
    report.expected_size = descriptor->size_bytes;

    const fs::path path = catalog_.finalPath(*descriptor);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        report.error = "artifact file not found";
        return report;
    }
    report.exists = true;

    const auto actual = fs::file_size(path, ec);
    if (ec) {
        report.error = ec.message();
        return report;
    }
    report.actual_size = actual;
    report.size_match = actual == descriptor->size_bytes;
    report.valid = report.size_match;

    if (descriptor->sha256) {
        report.expected_hash = *descriptor->sha256;
        VerificationResult verification = verifier_.verify(path, descriptor->sha256);
        if (verification.verdict == VerificationVerdict::Unreadable) {
            report.valid = false;
            report.error = verification.error;
            return report;
        }
        report.computed_hash = verification.computed_hash;
        report.checksum_match = verification.verdict == VerificationVerdict::Match;
        report.valid = report.size_match && *report.checksum_match;
    }
    return report;
}

std::optional<ArtifactStatus> TransferCoordinator::status(const std::string& artifact_id) const {
    if (!catalog_.find(artifact_id)) {
        return std::nullopt;
    }
    ArtifactStatus status;
    if (catalog_.isPresent(artifact_id)) {
        status.state = ArtifactStatus::State::Downloaded;
        return status;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(artifact_id);
    if (it != in_flight_.end()) {
        status.state = ArtifactStatus::State::Downloading;
        if (it->second.latest) {
            status.progress = it->second.latest;
        } else {
            ProgressSample sample;
            sample.artifact_id = artifact_id;
            sample.total_bytes = catalog_.find(artifact_id)->size_bytes;
            status.progress = sample;
        }
    }
    return status;
}

bool TransferCoordinator::isInFlight(const std::string& artifact_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(artifact_id) > 0;
}

std::vector<std::string> TransferCoordinator::inFlightIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(in_flight_.size());
    for (const auto& entry : in_flight_) {
        ids.push_back(entry.first);
    }
    return ids;
}

}  // namespace ardl
