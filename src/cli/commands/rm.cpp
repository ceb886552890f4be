// ardl rm command
// Removes a downloaded artifact (no confirmation)

#include "cli/commands.h"
#include "artifacts/transfer_coordinator.h"

namespace ardl {
namespace cli {
namespace commands {

int rm(TransferCoordinator& coordinator, const ArtifactOptions& options,
       std::ostream& out, std::ostream& err) {
    if (!coordinator.catalog().find(options.artifact_id)) {
        err << "Error: artifact not found: " << options.artifact_id << std::endl;
        return 1;
    }

    std::optional<std::string> actor;
    if (!options.actor.empty()) {
        actor = options.actor;
    }

    if (!coordinator.deleteArtifact(options.artifact_id, actor)) {
        err << "Error: " << options.artifact_id << " is not downloaded" << std::endl;
        return 1;
    }

    out << "deleted '" << options.artifact_id << "'" << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace ardl
