#pragma once

namespace tongchi {

enum class NodeStatus {
    NotLoaded,
    Loading,
    Loaded,
    Error
};

enum class ProcessStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

enum class TaskState {
    Idle,
    Running,
    Disabled
};

enum class ErrorKind {
    Transport,
    NotFound,
    Timeout,
    Cancelled,
    Internal
};

enum class AlertKind {
    Failed,
    Removed,
    Started
};

enum class AlertSeverity {
    Info,
    Warning,
    Critical
};

} // namespace tongchi
