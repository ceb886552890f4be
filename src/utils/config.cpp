#include "utils/config.h"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ardl {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::filesystem::path dataDir() {
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (home.empty()) return std::filesystem::path(".ardl");
    return home / ".ardl";
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    try {
        ifs >> out;
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring malformed config file {}: {}", path.string(), e.what());
        return false;
    }
}

// Upper bounds keep the values usable as buffer sizes and millisecond durations.
constexpr long long kMaxTimeoutSec = 24 * 60 * 60;
constexpr long long kMaxChunkSize = 16 << 20;
constexpr long long kMaxProgressIntervalMs = 60 * 60 * 1000;

// Parses an integer in [1, max]; nullopt for garbage or out-of-range values.
std::optional<long long> parsePositive(const std::string& text, long long max) {
    try {
        size_t pos = 0;
        long long v = std::stoll(text, &pos);
        if (pos != text.size() || v <= 0 || v > max) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<long long> boundedPositive(const nlohmann::json& j, const char* key, long long max) {
    if (!j.contains(key) || !j[key].is_number_unsigned()) return std::nullopt;
    const auto v = j[key].get<uint64_t>();
    if (v == 0 || v > static_cast<uint64_t>(max)) {
        spdlog::warn("Ignoring config {}={} (expected 1..{})", key, v, max);
        return std::nullopt;
    }
    return static_cast<long long>(v);
}

}  // namespace

std::pair<StoreConfig, std::string> loadStoreConfigWithLog() {
    StoreConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    cfg.store_dir = (dataDir() / "artifacts").string();
    cfg.audit_log_path = (dataDir() / "audit.jsonl").string();

    auto apply_json = [&](const nlohmann::json& j) {
        if (!j.is_object()) return;
        if (j.contains("store_dir") && j["store_dir"].is_string()) {
            cfg.store_dir = j["store_dir"].get<std::string>();
        }
        if (j.contains("catalog") && j["catalog"].is_string()) {
            cfg.catalog_path = j["catalog"].get<std::string>();
        }
        if (j.contains("audit_log") && j["audit_log"].is_string()) {
            cfg.audit_log_path = j["audit_log"].get<std::string>();
        }
        if (auto v = boundedPositive(j, "timeout_sec", kMaxTimeoutSec)) {
            cfg.transfer_timeout = std::chrono::seconds(*v);
        }
        if (auto v = boundedPositive(j, "chunk_size", kMaxChunkSize)) {
            cfg.chunk_size = static_cast<size_t>(*v);
        }
        if (auto v = boundedPositive(j, "progress_interval_ms", kMaxProgressIntervalMs)) {
            cfg.progress_interval = std::chrono::milliseconds(*v);
        }
    };

    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("ARDL_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = dataDir() / "config.json";
    }

    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJson(cfg_path, j)) {
            apply_json(j);
            log << "file=" << cfg_path.string() << " ";
            used_file = true;
        }
    }

    if (auto v = getEnvValue("ARDL_STORE_DIR")) {
        cfg.store_dir = *v;
        log << "env:STORE_DIR=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("ARDL_CATALOG")) {
        cfg.catalog_path = *v;
        log << "env:CATALOG=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("ARDL_AUDIT_LOG")) {
        cfg.audit_log_path = *v;
        log << "env:AUDIT_LOG=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("ARDL_TIMEOUT_SEC")) {
        if (auto n = parsePositive(*v, kMaxTimeoutSec)) {
            cfg.transfer_timeout = std::chrono::seconds(*n);
            log << "env:TIMEOUT_SEC=" << *n << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("ARDL_CHUNK_SIZE")) {
        if (auto n = parsePositive(*v, kMaxChunkSize)) {
            cfg.chunk_size = static_cast<size_t>(*n);
            log << "env:CHUNK_SIZE=" << *n << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("ARDL_PROGRESS_INTERVAL_MS")) {
        if (auto n = parsePositive(*v, kMaxProgressIntervalMs)) {
            cfg.progress_interval = std::chrono::milliseconds(*n);
            log << "env:PROGRESS_INTERVAL_MS=" << *n << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("HF_TOKEN")) {
        cfg.hf_token = *v;
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

StoreConfig loadStoreConfig() {
    auto info = loadStoreConfigWithLog();
    return info.first;
}

}  // namespace ardl
