#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace tongchi {

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

struct ChildDescriptor {
    std::string path;
    bool isContainer = false;
    std::string displayLabel;
};

// Point-in-time view of one tree node, as returned by peek().
struct NodeView {
    std::string path;
    NodeStatus status = NodeStatus::NotLoaded;
    std::vector<ChildDescriptor> children;
    std::optional<std::chrono::system_clock::time_point> loadedAt;
    std::string lastError;
    bool stale = false;
};

struct ExpandResult {
    NodeStatus status = NodeStatus::NotLoaded;
    std::vector<ChildDescriptor> children;
    std::optional<Error> error;
    bool stale = false;

    bool ok() const { return !error.has_value(); }
};

struct ScheduledTask {
    std::string id;
    int intervalSeconds = 60;
    bool enabled = true;
    // Per-execution timeout; zero falls back to the interval.
    int timeoutSeconds = 0;

    TaskState state = TaskState::Idle;
    std::optional<std::chrono::system_clock::time_point> lastRunAt;
    std::optional<std::chrono::system_clock::time_point> nextDueAt;
    std::string lastError;
    int consecutiveFailures = 0;
    int runCount = 0;
};

struct ProcessHandle {
    std::string id;
    std::string name;
    std::string description;
    ProcessStatus status = ProcessStatus::Pending;
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::chrono::system_clock::time_point> finishedAt;
    bool cancellable = true;
    bool cancelRequested = false;

    // Percent complete (0-100) as last reported by the operation.
    int progress = 0;
    std::string progressMessage;

    // Exactly one of result/error is meaningful, and only once terminal.
    nlohmann::json result;
    std::string error;
};

struct Alert {
    std::string id;
    std::chrono::system_clock::time_point timestamp;

    std::string resourceId;
    AlertKind kind = AlertKind::Failed;
    AlertSeverity severity = AlertSeverity::Warning;

    std::string previousStatus;
    std::string currentStatus;

    std::string title;
    std::string message;
};

} // namespace tongchi
