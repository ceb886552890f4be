// ardl pull command
// Downloads an artifact from the catalog with a progress bar

#include "cli/commands.h"
#include "cli/progress_renderer.h"
#include "artifacts/transfer_coordinator.h"

namespace ardl {
namespace cli {
namespace commands {

int pull(TransferCoordinator& coordinator, const ArtifactOptions& options,
         std::ostream& out, std::ostream& err) {
    auto descriptor = coordinator.catalog().find(options.artifact_id);
    if (!descriptor) {
        err << "Error: artifact not found: " << options.artifact_id << std::endl;
        err << "Run 'ardl list' to see available artifacts" << std::endl;
        return 1;
    }

    ProgressRenderer renderer(descriptor->size_bytes, out);
    renderer.setPhase("pulling " + descriptor->id);

    std::optional<std::string> actor;
    if (!options.actor.empty()) {
        actor = options.actor;
    }

    auto result = coordinator.startTransfer(
        descriptor->id, [&](const ProgressSample& sample) { renderer.onSample(sample); }, actor);

    switch (result.code) {
        case TransferCode::kOk:
            out << "success" << std::endl;
            return 0;
        case TransferCode::kAlreadyPresent:
            out << descriptor->id << " is already downloaded" << std::endl;
            return 0;
        case TransferCode::kAlreadyInFlight:
            err << "Error: a download of " << descriptor->id << " is already in progress" << std::endl;
            return kExitInProgress;
        case TransferCode::kNotFound:
        case TransferCode::kTransferFailure:
        case TransferCode::kIntegrityFailure:
        case TransferCode::kPublishFailure:
            break;
    }
    err << "Error: " << to_string(result.code) << ": " << result.error << std::endl;
    return 1;
}

}  // namespace commands
}  // namespace cli
}  // namespace ardl
