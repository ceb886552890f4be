// ArtifactCatalog - immutable registry of downloadable artifacts
// Layout: <store_dir>/<file_name>, staging at <store_dir>/<file_name>.tmp
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "artifacts/artifact_descriptor.h"

namespace ardl {

class ArtifactCatalog {
public:
    static constexpr const char* kStagingSuffix = ".tmp";

    // Validates every descriptor; throws std::invalid_argument on an empty or
    // duplicate id, an empty or path-bearing file name, a duplicate file name,
    // an empty URL, or a checksum that is not 64 hex digits.
    ArtifactCatalog(std::string store_dir, std::vector<ArtifactDescriptor> descriptors);

    // Load descriptors from a JSON file ({"artifacts":[...]} or a bare array).
    // Throws std::invalid_argument on unreadable or malformed input.
    static ArtifactCatalog fromJsonFile(std::string store_dir, const std::filesystem::path& path);

    // Qwen 3 8B GGUF variants served from HuggingFace.
    static std::vector<ArtifactDescriptor> builtinDescriptors();

    const std::vector<ArtifactDescriptor>& list() const { return descriptors_; }

    std::optional<ArtifactDescriptor> find(const std::string& id) const;

    // True when a regular file exists at the final path. Unknown id -> false.
    bool isPresent(const std::string& id) const;

    // Final path if the artifact is present, otherwise nullopt.
    std::optional<std::filesystem::path> resolvedPath(const std::string& id) const;

    std::vector<ArtifactDescriptor> listPresent() const;

    std::filesystem::path finalPath(const ArtifactDescriptor& descriptor) const;
    std::filesystem::path stagingPath(const ArtifactDescriptor& descriptor) const;

    const std::filesystem::path& storeDir() const { return store_dir_; }

private:
    const ArtifactDescriptor* lookup(const std::string& id) const;

    std::filesystem::path store_dir_;
    std::vector<ArtifactDescriptor> descriptors_;
};

}  // namespace ardl
