#pragma once

#include "supervised_task.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace taskbridge::supervisor {

/// Owns every supervised task of a backend, one per name.
class TaskRegistry {
public:
    template <typename Task, typename... Args>
    Task& create(const std::string& name, Args&&... args) {
        auto task = std::make_unique<Task>(name, std::forward<Args>(args)...);
        Task& ref = *task;
        add(std::move(task));
        return ref;
    }

    /// Throws std::invalid_argument when the name is taken.
    void add(std::unique_ptr<SupervisedTask> task);

    SupervisedTask* find(const std::string& name);
    std::vector<std::string> names() const;

    /// Stops every task in reverse creation order. Failures are logged and
    /// do not prevent the remaining tasks from being stopped.
    void stop_all();

private:
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<SupervisedTask>> tasks_;
};

} // namespace taskbridge::supervisor
