// ardl status command

#include "cli/commands.h"
#include "cli/progress_renderer.h"
#include "artifacts/transfer_coordinator.h"
#include <nlohmann/json.hpp>

namespace ardl {
namespace cli {
namespace commands {

int status(const TransferCoordinator& coordinator, const ArtifactOptions& options,
           std::ostream& out, std::ostream& err) {
    auto state = coordinator.status(options.artifact_id);
    if (!state) {
        err << "Error: artifact not found: " << options.artifact_id << std::endl;
        return 1;
    }

    if (options.json) {
        nlohmann::json j = {{"id", options.artifact_id}, {"status", to_string(state->state)}};
        if (state->progress) {
            j["progress"] = toJson(*state->progress);
        }
        if (auto path = coordinator.catalog().resolvedPath(options.artifact_id)) {
            j["path"] = path->string();
        }
        out << j.dump(2) << std::endl;
        return 0;
    }

    out << options.artifact_id << ": " << to_string(state->state);
    if (state->progress) {
        const auto& p = *state->progress;
        out << " " << ProgressRenderer::formatProgressBar(p.downloaded_bytes, p.total_bytes)
            << " " << ProgressRenderer::formatBytes(p.downloaded_bytes)
            << "/" << ProgressRenderer::formatBytes(p.total_bytes);
    }
    if (auto path = coordinator.catalog().resolvedPath(options.artifact_id)) {
        out << " (" << path->string() << ")";
    }
    out << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace ardl
