#pragma once

#include "task_state.hpp"

#include "../notifier.hpp"

#include <initializer_list>
#include <mutex>
#include <string>

namespace taskbridge::supervisor {

/**
 * Named, state-tracked unit of background work. State only changes through
 * transition(), so two observers can never both see themselves move the
 * same task into starting or running.
 */
class SupervisedTask {
public:
    SupervisedTask(std::string name, TaskKind kind, Notifier& notifier);
    virtual ~SupervisedTask() = default;

    SupervisedTask(const SupervisedTask&) = delete;
    SupervisedTask& operator=(const SupervisedTask&) = delete;

    const std::string& name() const { return name_; }
    TaskKind kind() const { return kind_; }
    TaskState state() const;

    /// starting or running
    bool is_active() const;

    virtual StopOutcome stop() = 0;

protected:
    /// Moves to `to` only when the current state is one of `from`.
    bool transition(std::initializer_list<TaskState> from, TaskState to);

    Notifier& notifier_;

private:
    std::string name_;
    TaskKind kind_;
    mutable std::mutex state_mutex_;
    TaskState state_ = TaskState::Idle;
};

} // namespace taskbridge::supervisor
