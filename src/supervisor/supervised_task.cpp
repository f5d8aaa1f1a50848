#include "supervised_task.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace taskbridge::supervisor {

const char* to_string(TaskKind kind) {
    switch (kind) {
        case TaskKind::InProcess:
            return "in-process";
        case TaskKind::ExternalProcess:
            return "external-process";
    }
    return "unknown";
}

const char* to_string(TaskState state) {
    switch (state) {
        case TaskState::Idle:
            return "idle";
        case TaskState::Starting:
            return "starting";
        case TaskState::Running:
            return "running";
        case TaskState::Stopping:
            return "stopping";
        case TaskState::Stopped:
            return "stopped";
        case TaskState::Failed:
            return "failed";
    }
    return "unknown";
}

const char* to_string(StartOutcome outcome) {
    switch (outcome) {
        case StartOutcome::Started:
            return "started";
        case StartOutcome::AlreadyRunning:
            return "already-running";
        case StartOutcome::Adopted:
            return "adopted";
        case StartOutcome::Failed:
            return "failed";
    }
    return "unknown";
}

SupervisedTask::SupervisedTask(std::string name, TaskKind kind, Notifier& notifier)
    : notifier_(notifier), name_(std::move(name)), kind_(kind) {}

TaskState SupervisedTask::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool SupervisedTask::is_active() const {
    auto current = state();
    return current == TaskState::Starting || current == TaskState::Running;
}

bool SupervisedTask::transition(std::initializer_list<TaskState> from, TaskState to) {
    TaskState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        bool allowed = false;
        for (TaskState candidate : from) {
            if (state_ == candidate) {
                allowed = true;
                break;
            }
        }
        if (!allowed) {
            return false;
        }
        previous = state_;
        state_ = to;
    }

    LOG4CPLUS_DEBUG(supervisor_logger(), name_ << ": " << to_string(previous) << " -> " << to_string(to));
    return true;
}

} // namespace taskbridge::supervisor
