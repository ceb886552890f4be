#pragma once

#include <filesystem>
#include <string>

namespace ardl {

struct PublishResult {
    bool ok{false};
    std::string error;
};

// Makes a staged file visible under its final name with a single rename.
// Staging and final paths must share a volume for the rename to be atomic;
// readers of the final path see either nothing or the complete file.
class ArtifactPublisher {
public:
    PublishResult publish(const std::filesystem::path& staging_path,
                          const std::filesystem::path& final_path) const;
};

}  // namespace ardl
