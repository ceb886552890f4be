#include "artifacts/audit_sink.h"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ardl {

namespace {

std::string formatUtc(std::chrono::system_clock::time_point tp) {
    const auto t = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

}  // namespace

nlohmann::json toJson(const AuditEvent& event) {
    nlohmann::json j = {
        {"ts", formatUtc(event.timestamp)},
        {"event_type", event.event_type},
        {"resource_type", "artifact"},
        {"resource_id", event.artifact_id},
        {"action", event.action},
        {"success", event.success},
        {"details", event.details},
    };
    j["user_id"] = event.actor_id ? nlohmann::json(*event.actor_id) : nlohmann::json(nullptr);
    j["error_message"] = event.error_message ? nlohmann::json(*event.error_message) : nlohmann::json(nullptr);
    return j;
}

JsonlAuditSink::JsonlAuditSink(fs::path path) : path_(std::move(path)) {}

void JsonlAuditSink::record(const AuditEvent& event) {
    const std::string line = toJson(event).dump();
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
    }
    std::ofstream ofs(path_, std::ios::app);
    if (!ofs.is_open()) {
        spdlog::warn("JsonlAuditSink: cannot open {} (dropping {})", path_.string(), event.event_type);
        return;
    }
    ofs << line << '\n';
    ofs.flush();
    if (!ofs) {
        spdlog::warn("JsonlAuditSink: write to {} failed (dropping {})", path_.string(), event.event_type);
    }
}

}  // namespace ardl
