#include "artifacts/artifact_publisher.h"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ardl {

PublishResult ArtifactPublisher::publish(const fs::path& staging_path, const fs::path& final_path) const {
    PublishResult result;
    std::error_code ec;
    fs::rename(staging_path, final_path, ec);
    if (ec) {
        result.error = "rename " + staging_path.string() + " -> " + final_path.string() + " failed: " + ec.message();
        spdlog::error("ArtifactPublisher: {}", result.error);
        return result;
    }
    result.ok = true;
    spdlog::info("ArtifactPublisher: published {}", final_path.string());
    return result;
}

}  // namespace ardl
