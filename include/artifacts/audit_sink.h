#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace ardl {

struct AuditEvent {
    std::string event_type;   // e.g. "artifact.download.started"
    std::string artifact_id;
    std::optional<std::string> actor_id;
    std::string action;       // "download" | "delete"
    bool success{true};
    std::optional<std::string> error_message;
    nlohmann::json details = nlohmann::json::object();
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

nlohmann::json toJson(const AuditEvent& event);

// Write-only receiver of transfer lifecycle events.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void record(const AuditEvent& event) = 0;
};

class NullAuditSink : public AuditSink {
public:
    void record(const AuditEvent&) override {}
};

// Appends one JSON object per line. Write failures are logged, never thrown.
class JsonlAuditSink : public AuditSink {
public:
    explicit JsonlAuditSink(std::filesystem::path path);

    void record(const AuditEvent& event) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

}  // namespace ardl
