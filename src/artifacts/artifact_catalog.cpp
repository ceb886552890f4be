#include "artifacts/artifact_catalog.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <spdlog/spdlog.h>

#include "utils/json_utils.h"

namespace fs = std::filesystem;

namespace ardl {

namespace {

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isHexDigest(const std::string& value) {
    return value.size() == 64 &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isxdigit(c); });
}

bool isPlainFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

void validate(std::vector<ArtifactDescriptor>& descriptors) {
    std::unordered_set<std::string> ids;
    // Final and staging names share one namespace inside the store.
    std::unordered_set<std::string> reserved;
    for (auto& d : descriptors) {
        if (d.id.empty()) {
            throw std::invalid_argument("artifact id must not be empty");
        }
        if (!ids.insert(d.id).second) {
            throw std::invalid_argument("duplicate artifact id: " + d.id);
        }
        if (!isPlainFileName(d.file_name)) {
            throw std::invalid_argument("artifact '" + d.id + "': invalid file name '" + d.file_name + "'");
        }
        const std::string staging_name = d.file_name + ArtifactCatalog::kStagingSuffix;
        if (reserved.count(d.file_name) != 0) {
            throw std::invalid_argument("artifact '" + d.id + "': file name already used: " + d.file_name);
        }
        if (reserved.count(staging_name) != 0) {
            throw std::invalid_argument("artifact '" + d.id + "': staging name already used: " + staging_name);
        }
        reserved.insert(d.file_name);
        reserved.insert(staging_name);
        if (d.url.empty()) {
            throw std::invalid_argument("artifact '" + d.id + "': url must not be empty");
        }
        if (d.sha256) {
            *d.sha256 = toLowerAscii(*d.sha256);
            if (!isHexDigest(*d.sha256)) {
                throw std::invalid_argument("artifact '" + d.id + "': sha256 must be 64 hex digits");
            }
        }
        if (d.name.empty()) {
            d.name = d.id;
        }
    }
}

}  // namespace

ArtifactCatalog::ArtifactCatalog(std::string store_dir, std::vector<ArtifactDescriptor> descriptors)
    : store_dir_(std::move(store_dir)), descriptors_(std::move(descriptors)) {
    if (store_dir_.empty()) {
        throw std::invalid_argument("store directory must not be empty");
    }
    validate(descriptors_);
}

ArtifactCatalog ArtifactCatalog::fromJsonFile(std::string store_dir, const fs::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::invalid_argument("cannot open catalog file: " + path.string());
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();

    std::string error;
    auto parsed = parse_json(buffer.str(), &error);
    if (!parsed) {
        throw std::invalid_argument("malformed catalog file " + path.string() + ": " + error);
    }

    const nlohmann::json* entries = &(*parsed);
    if (parsed->is_object() && parsed->contains("artifacts")) {
        entries = &(*parsed)["artifacts"];
    }
    if (!entries->is_array()) {
        throw std::invalid_argument("catalog file " + path.string() + " must hold an array of artifacts");
    }

    std::vector<ArtifactDescriptor> descriptors;
    descriptors.reserve(entries->size());
    for (const auto& entry : *entries) {
        descriptors.push_back(descriptorFromJson(entry));
    }
    spdlog::info("Loaded {} artifact(s) from catalog {}", descriptors.size(), path.string());
    return ArtifactCatalog(std::move(store_dir), std::move(descriptors));
}

std::vector<ArtifactDescriptor> ArtifactCatalog::builtinDescriptors() {
    const std::string base = "https://huggingface.co/bartowski/Qwen_Qwen3-8B-GGUF/resolve/main/";
    std::vector<ArtifactDescriptor> out;

    ArtifactDescriptor q4;
    q4.id = "qwen3-8b-q4";
    q4.name = "Qwen 3 8B (Q4_K_M)";
    q4.file_name = "Qwen_Qwen3-8B-Q4_K_M.gguf";
    q4.url = base + q4.file_name;
    q4.size_bytes = 5030000000ULL;
    q4.description = "Balanced quality and memory use for 6 GB GPUs";
    q4.recommended = true;
    out.push_back(q4);

    ArtifactDescriptor q5;
    q5.id = "qwen3-8b-q5";
    q5.name = "Qwen 3 8B (Q5_K_M)";
    q5.file_name = "Qwen_Qwen3-8B-Q5_K_M.gguf";
    q5.url = base + q5.file_name;
    q5.size_bytes = 5850000000ULL;
    q5.description = "Higher quality, needs the full VRAM budget";
    out.push_back(q5);

    ArtifactDescriptor iq4;
    iq4.id = "qwen3-8b-iq4";
    iq4.name = "Qwen 3 8B (IQ4_XS)";
    iq4.file_name = "Qwen_Qwen3-8B-IQ4_XS.gguf";
    iq4.url = base + iq4.file_name;
    iq4.size_bytes = 4560000000ULL;
    iq4.description = "Smaller and faster, decent quality";
    out.push_back(iq4);

    return out;
}

const ArtifactDescriptor* ArtifactCatalog::lookup(const std::string& id) const {
    auto it = std::find_if(descriptors_.begin(), descriptors_.end(),
                           [&](const ArtifactDescriptor& d) { return d.id == id; });
    return it == descriptors_.end() ? nullptr : &(*it);
}

std::optional<ArtifactDescriptor> ArtifactCatalog::find(const std::string& id) const {
    if (const auto* d = lookup(id)) {
        return *d;
    }
    return std::nullopt;
}

bool ArtifactCatalog::isPresent(const std::string& id) const {
    const auto* d = lookup(id);
    if (!d) return false;
    std::error_code ec;
    return fs::is_regular_file(finalPath(*d), ec);
}

std::optional<fs::path> ArtifactCatalog::resolvedPath(const std::string& id) const {
    if (!isPresent(id)) return std::nullopt;
    return finalPath(*lookup(id));
}

std::vector<ArtifactDescriptor> ArtifactCatalog::listPresent() const {
    std::vector<ArtifactDescriptor> out;
    for (const auto& d : descriptors_) {
        if (isPresent(d.id)) {
            out.push_back(d);
        }
    }
    return out;
}

fs::path ArtifactCatalog::finalPath(const ArtifactDescriptor& descriptor) const {
    return store_dir_ / descriptor.file_name;
}

fs::path ArtifactCatalog::stagingPath(const ArtifactDescriptor& descriptor) const {
    return store_dir_ / (descriptor.file_name + kStagingSuffix);
}

}  // namespace ardl
