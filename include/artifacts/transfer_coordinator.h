#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "artifacts/artifact_catalog.h"
#include "artifacts/artifact_downloader.h"
#include "artifacts/artifact_publisher.h"
#include "artifacts/audit_sink.h"
#include "artifacts/integrity_verifier.h"
#include "artifacts/transfer_types.h"

namespace ardl {

struct InFlightMarker {
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point last_progress_at{};
    std::optional<ProgressSample> latest;
};

// Drives download -> verify -> publish for one artifact at a time per id.
//
// At most one transfer per artifact id is in flight; a second request for
// the same id is rejected with kAlreadyInFlight instead of being queued.
// Every exit path removes the in-flight marker, delivers exactly one
// terminal progress sample (Complete or Error) and records one terminal
// audit event. Expected failures are returned as TransferResult codes and
// never escape as exceptions.
class TransferCoordinator {
public:
    // The catalog must outlive the coordinator. Creates the store directory;
    // throws std::filesystem::filesystem_error when it cannot be created.
    TransferCoordinator(const ArtifactCatalog& catalog,
                        ArtifactDownloader downloader,
                        std::shared_ptr<AuditSink> audit_sink = nullptr,
                        IntegrityVerifier verifier = IntegrityVerifier{},
                        ArtifactPublisher publisher = ArtifactPublisher{});

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    TransferResult startTransfer(const std::string& artifact_id,
                                 const ProgressCallback& cb = nullptr,
                                 const std::optional<std::string>& actor_id = std::nullopt);

    // Runs startTransfer on a worker thread. The coordinator must outlive
    // the returned future.
    std::future<TransferResult> startTransferAsync(std::string artifact_id,
                                                   ProgressCallback cb = nullptr,
                                                   std::optional<std::string> actor_id = std::nullopt);

    // Remove a published artifact. False when the id is unknown, the file is
    // absent, or removal fails. Deleting an id that is in flight is not
    // guarded against.
    bool deleteArtifact(const std::string& artifact_id,
                        const std::optional<std::string>& actor_id = std::nullopt);

    IntegrityReport verify(const std::string& artifact_id) const;

    // nullopt for ids the catalog does not know.
    std::optional<ArtifactStatus> status(const std::string& artifact_id) const;

    const std::vector<ArtifactDescriptor>& list() const { return catalog_.list(); }
    std::vector<ArtifactDescriptor> listPresent() const { return catalog_.listPresent(); }

    bool isInFlight(const std::string& artifact_id) const;
    std::vector<std::string> inFlightIds() const;

    const ArtifactCatalog& catalog() const { return catalog_; }

private:
    class InFlightGuard;

    bool tryBegin(const std::string& artifact_id);
    void finish(const std::string& artifact_id);
    void recordProgress(const ProgressSample& sample);
    void emitAudit(const AuditEvent& event);

    TransferResult runPipeline(const ArtifactDescriptor& descriptor,
                               const ProgressCallback& cb,
                               const std::optional<std::string>& actor_id);

    const ArtifactCatalog& catalog_;
    ArtifactDownloader downloader_;
    std::shared_ptr<AuditSink> audit_sink_;
    IntegrityVerifier verifier_;
    ArtifactPublisher publisher_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, InFlightMarker> in_flight_;
};

}  // namespace ardl
