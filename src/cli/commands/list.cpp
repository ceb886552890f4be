// ardl list command
// Lists catalog artifacts and whether they are downloaded

#include "cli/commands.h"
#include "cli/progress_renderer.h"
#include "artifacts/transfer_coordinator.h"
#include <iomanip>
#include <nlohmann/json.hpp>

namespace ardl {
namespace cli {
namespace commands {

int list(const TransferCoordinator& coordinator, const ListOptions& options, std::ostream& out) {
    const auto artifacts = options.downloaded_only ? coordinator.listPresent() : coordinator.list();

    if (options.json) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& artifact : artifacts) {
            auto j = toJson(artifact);
            j["downloaded"] = coordinator.catalog().isPresent(artifact.id);
            arr.push_back(std::move(j));
        }
        out << arr.dump(2) << std::endl;
        return 0;
    }

    out << std::left
        << std::setw(20) << "ID"
        << std::setw(28) << "NAME"
        << std::setw(12) << "SIZE"
        << std::setw(12) << "STATUS"
        << std::endl;

    for (const auto& artifact : artifacts) {
        auto state = coordinator.status(artifact.id);
        std::string name = artifact.name;
        if (artifact.recommended) {
            name += " *";
        }
        out << std::left
            << std::setw(20) << artifact.id
            << std::setw(28) << name
            << std::setw(12) << ProgressRenderer::formatBytes(artifact.size_bytes)
            << std::setw(12) << (state ? to_string(state->state) : "unknown")
            << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace ardl
