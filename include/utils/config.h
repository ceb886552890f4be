#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>

namespace ardl {

struct StoreConfig {
    std::string store_dir;       // final and staging files live here
    std::string catalog_path;    // optional JSON catalog; empty -> built-in catalog
    std::string audit_log_path;  // JSON-lines audit trail
    std::chrono::seconds transfer_timeout{600};
    size_t chunk_size{64 * 1024};
    std::chrono::milliseconds progress_interval{1000};
    std::string hf_token;
};

// Load configuration from the JSON file named by ARDL_CONFIG
// (default: ~/.ardl/config.json), then apply environment overrides:
// ARDL_STORE_DIR, ARDL_CATALOG, ARDL_AUDIT_LOG, ARDL_TIMEOUT_SEC,
// ARDL_CHUNK_SIZE, ARDL_PROGRESS_INTERVAL_MS, HF_TOKEN.
StoreConfig loadStoreConfig();

// Same as loadStoreConfig(), also returning a short description of which
// sources contributed (for logging).
std::pair<StoreConfig, std::string> loadStoreConfigWithLog();

}  // namespace ardl
