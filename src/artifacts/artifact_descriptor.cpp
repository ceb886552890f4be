#include "artifacts/artifact_descriptor.h"

#include <stdexcept>

#include "utils/json_utils.h"

namespace ardl {

nlohmann::json toJson(const ArtifactDescriptor& descriptor) {
    nlohmann::json j = {
        {"id", descriptor.id},
        {"name", descriptor.name},
        {"fileName", descriptor.file_name},
        {"url", descriptor.url},
        {"size", descriptor.size_bytes},
        {"description", descriptor.description},
        {"recommended", descriptor.recommended},
    };
    j["sha256"] = descriptor.sha256 ? nlohmann::json(*descriptor.sha256) : nlohmann::json(nullptr);
    return j;
}

ArtifactDescriptor descriptorFromJson(const nlohmann::json& j) {
    std::string missing;
    if (!has_required_keys(j, {"id", "fileName", "url", "size"}, &missing)) {
        throw std::invalid_argument("artifact entry is missing '" + missing + "'");
    }

    ArtifactDescriptor d;
    try {
        d.id = j.at("id").get<std::string>();
        d.file_name = j.at("fileName").get<std::string>();
        d.url = j.at("url").get<std::string>();
        if (!j.at("size").is_number_unsigned()) {
            throw std::invalid_argument("artifact '" + d.id + "': size must be a non-negative integer");
        }
        d.size_bytes = j.at("size").get<uint64_t>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument("artifact entry has a mistyped field: " + std::string(e.what()));
    }
    d.name = get_or<std::string>(j, "name", d.id);
    d.description = get_or<std::string>(j, "description", "");
    d.recommended = get_or<bool>(j, "recommended", false);
    if (j.contains("sha256") && !j.at("sha256").is_null()) {
        if (!j.at("sha256").is_string()) {
            throw std::invalid_argument("artifact '" + d.id + "': sha256 must be a string");
        }
        d.sha256 = j.at("sha256").get<std::string>();
    }
    return d;
}

}  // namespace ardl
