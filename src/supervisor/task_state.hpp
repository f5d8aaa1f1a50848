#pragma once

namespace taskbridge::supervisor {

enum class TaskKind {
    InProcess,
    ExternalProcess,
};

// idle -> starting -> running -> {stopping -> stopped, failed}
enum class TaskState {
    Idle,
    Starting,
    Running,
    Stopping,
    Stopped,
    Failed,
};

enum class StartOutcome {
    Started,
    AlreadyRunning,
    Adopted,
    Failed,
};

enum class StopOutcome {
    Stopped,
    NotRunning,
};

const char* to_string(TaskKind kind);
const char* to_string(TaskState state);
const char* to_string(StartOutcome outcome);

} // namespace taskbridge::supervisor
