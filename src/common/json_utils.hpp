#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace tongchi {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toNodeStatusString(NodeStatus status)
{
    switch (status) {
    case NodeStatus::NotLoaded:
        return "not_loaded";
    case NodeStatus::Loading:
        return "loading";
    case NodeStatus::Loaded:
        return "loaded";
    case NodeStatus::Error:
        return "error";
    }
    return "not_loaded";
}

inline std::string toProcessStatusString(ProcessStatus status)
{
    switch (status) {
    case ProcessStatus::Pending:
        return "pending";
    case ProcessStatus::Running:
        return "running";
    case ProcessStatus::Completed:
        return "completed";
    case ProcessStatus::Failed:
        return "failed";
    case ProcessStatus::Cancelled:
        return "cancelled";
    }
    return "pending";
}

inline ProcessStatus parseProcessStatusString(const std::string &value)
{
    if (value == "running") {
        return ProcessStatus::Running;
    }
    if (value == "completed") {
        return ProcessStatus::Completed;
    }
    if (value == "failed") {
        return ProcessStatus::Failed;
    }
    if (value == "cancelled") {
        return ProcessStatus::Cancelled;
    }
    return ProcessStatus::Pending;
}

inline bool isTerminal(ProcessStatus status)
{
    return status == ProcessStatus::Completed
        || status == ProcessStatus::Failed
        || status == ProcessStatus::Cancelled;
}

inline std::string toTaskStateString(TaskState state)
{
    switch (state) {
    case TaskState::Idle:
        return "idle";
    case TaskState::Running:
        return "running";
    case TaskState::Disabled:
        return "disabled";
    }
    return "idle";
}

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Internal:
        return "internal";
    }
    return "internal";
}

inline std::string toAlertKindString(AlertKind kind)
{
    switch (kind) {
    case AlertKind::Failed:
        return "failed";
    case AlertKind::Removed:
        return "removed";
    case AlertKind::Started:
        return "started";
    }
    return "failed";
}

inline AlertKind parseAlertKindString(const std::string &value)
{
    if (value == "removed") {
        return AlertKind::Removed;
    }
    if (value == "started") {
        return AlertKind::Started;
    }
    return AlertKind::Failed;
}

inline std::string toAlertSeverityString(AlertSeverity severity)
{
    switch (severity) {
    case AlertSeverity::Info:
        return "info";
    case AlertSeverity::Warning:
        return "warning";
    case AlertSeverity::Critical:
        return "critical";
    }
    return "info";
}

inline AlertSeverity parseAlertSeverityString(const std::string &value)
{
    if (value == "critical") {
        return AlertSeverity::Critical;
    }
    if (value == "warning") {
        return AlertSeverity::Warning;
    }
    return AlertSeverity::Info;
}

inline std::string describeError(const Error &error)
{
    return toErrorKindString(error.kind) + ": " + error.message;
}

inline void to_json(nlohmann::json &j, const ChildDescriptor &child)
{
    j = nlohmann::json{
        {"path", child.path},
        {"isContainer", child.isContainer},
        {"label", child.displayLabel}
    };
}

inline void from_json(const nlohmann::json &j, ChildDescriptor &child)
{
    child.path = j.value("path", "");
    child.isContainer = j.value("isContainer", false);
    child.displayLabel = j.value("label", child.path);
}

inline void to_json(nlohmann::json &j, const Alert &alert)
{
    j = nlohmann::json{
        {"id", alert.id},
        {"timestamp", toIso8601Utc(alert.timestamp)},
        {"resourceId", alert.resourceId},
        {"kind", toAlertKindString(alert.kind)},
        {"severity", toAlertSeverityString(alert.severity)},
        {"previousStatus", alert.previousStatus},
        {"currentStatus", alert.currentStatus},
        {"title", alert.title},
        {"message", alert.message}
    };
}

inline void from_json(const nlohmann::json &j, Alert &alert)
{
    alert.id = j.value("id", "");
    alert.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    alert.resourceId = j.value("resourceId", "");
    alert.kind = parseAlertKindString(j.value("kind", "failed"));
    alert.severity = parseAlertSeverityString(j.value("severity", "info"));
    alert.previousStatus = j.value("previousStatus", "");
    alert.currentStatus = j.value("currentStatus", "");
    alert.title = j.value("title", "");
    alert.message = j.value("message", "");
}

inline void to_json(nlohmann::json &j, const ProcessHandle &handle)
{
    j = nlohmann::json{
        {"id", handle.id},
        {"name", handle.name},
        {"description", handle.description},
        {"status", toProcessStatusString(handle.status)},
        {"cancellable", handle.cancellable},
        {"progress", handle.progress},
        {"progressMessage", handle.progressMessage},
        {"startedAt", handle.startedAt ? toIso8601Utc(*handle.startedAt) : std::string()},
        {"finishedAt", handle.finishedAt ? toIso8601Utc(*handle.finishedAt) : std::string()},
        {"result", handle.result},
        {"error", handle.error}
    };
}

} // namespace tongchi
