#include "utils/json_utils.h"

namespace ardl {

std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& ex) {
        if (error) *error = ex.what();
        return std::nullopt;
    }
}

bool has_required_keys(const nlohmann::json& j,
                       const std::vector<std::string>& keys,
                       std::string* missing_key) {
    if (!j.is_object()) {
        if (missing_key && !keys.empty()) *missing_key = keys.front();
        return keys.empty();
    }
    for (const auto& k : keys) {
        if (!j.contains(k) || j.at(k).is_null()) {
            if (missing_key) *missing_key = k;
            return false;
        }
    }
    return true;
}

}  // namespace ardl
