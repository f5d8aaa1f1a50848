#include "task_registry.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace taskbridge::supervisor {

void TaskRegistry::add(std::unique_ptr<SupervisedTask> task) {
    if (!task) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& existing : tasks_) {
        if (existing->name() == task->name()) {
            throw std::invalid_argument("task already registered: " + task->name());
        }
    }
    LOG4CPLUS_DEBUG(supervisor_logger(), "registered " << to_string(task->kind()) << " task " << task->name());
    tasks_.push_back(std::move(task));
}

SupervisedTask* TaskRegistry::find(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& task : tasks_) {
        if (task->name() == name) {
            return task.get();
        }
    }
    return nullptr;
}

std::vector<std::string> TaskRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(tasks_.size());
    for (const auto& task : tasks_) {
        result.push_back(task->name());
    }
    return result;
}

void TaskRegistry::stop_all() {
    std::vector<SupervisedTask*> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = tasks_.rbegin(); it != tasks_.rend(); ++it) {
            snapshot.push_back(it->get());
        }
    }

    for (SupervisedTask* task : snapshot) {
        try {
            if (task->stop() == StopOutcome::Stopped) {
                LOG4CPLUS_INFO(supervisor_logger(), "teardown stopped " << task->name());
            }
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(supervisor_logger(), "teardown of " << task->name() << " failed: " << exc.what());
        }
    }
}

} // namespace taskbridge::supervisor
