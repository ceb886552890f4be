#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace ardl {

struct ArtifactDescriptor {
    std::string id;           // Unique key (e.g., "qwen3-8b-q4")
    std::string name;         // Display name
    std::string file_name;    // Final file name inside the store directory
    std::string url;          // Remote location
    uint64_t size_bytes{0};   // Expected size
    std::optional<std::string> sha256;  // Lowercase hex, when published upstream
    std::string description;
    bool recommended{false};
};

// {"id","name","fileName","url","size","sha256","description","recommended"}
nlohmann::json toJson(const ArtifactDescriptor& descriptor);

// Throws std::invalid_argument when a required field is missing or mistyped.
ArtifactDescriptor descriptorFromJson(const nlohmann::json& j);

}  // namespace ardl
