// ardl verify command
// Recomputes size and SHA-256 of a downloaded artifact

#include "cli/commands.h"
#include "artifacts/transfer_coordinator.h"

namespace ardl {
namespace cli {
namespace commands {

int verify(const TransferCoordinator& coordinator, const ArtifactOptions& options,
           std::ostream& out, std::ostream& err) {
    IntegrityReport report = coordinator.verify(options.artifact_id);

    if (options.json) {
        out << toJson(report).dump(2) << std::endl;
        return report.valid ? 0 : 1;
    }

    if (!report.exists) {
        err << "Error: " << options.artifact_id << ": " << report.error.value_or("not downloaded") << std::endl;
        return 1;
    }

    out << "size:     " << (report.size_match ? "ok" : "MISMATCH")
        << " (" << report.actual_size << " of " << report.expected_size << " bytes)" << std::endl;
    if (report.checksum_match) {
        out << "sha256:   " << (*report.checksum_match ? "ok" : "MISMATCH") << std::endl;
        out << "expected: " << report.expected_hash.value_or("") << std::endl;
        out << "computed: " << report.computed_hash.value_or("") << std::endl;
    } else if (report.error) {
        out << "sha256:   " << *report.error << std::endl;
    } else {
        out << "sha256:   not declared (no integrity evidence available)" << std::endl;
    }
    out << (report.valid ? "valid" : "INVALID") << std::endl;
    return report.valid ? 0 : 1;
}

}  // namespace commands
}  // namespace cli
}  // namespace ardl
