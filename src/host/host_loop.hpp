#pragma once

#include "../line_transport.hpp"
#include "../notifier.hpp"
#include "../rpc/dispatcher.hpp"
#include "../supervisor/task_registry.hpp"

#include <atomic>
#include <functional>
#include <istream>
#include <mutex>
#include <vector>

namespace taskbridge::host {

/**
 * Reads frames from the caller until end of stream, dispatches them, and
 * writes the responses. Owns the dispatcher and the task registry; teardown
 * stops every task and runs exactly once, whoever triggers it first.
 */
class HostLoop {
public:
    HostLoop(std::istream& in, transport::FrameWriter& writer);
    ~HostLoop();

    HostLoop(const HostLoop&) = delete;
    HostLoop& operator=(const HostLoop&) = delete;

    rpc::Dispatcher& dispatcher() { return dispatcher_; }
    supervisor::TaskRegistry& tasks() { return tasks_; }
    Notifier& notifier() { return notifier_; }

    /// Extra teardown step, run before the tasks are stopped.
    void add_teardown(std::function<void()> step);

    /// Returns the process exit code for a normal end of input.
    int run();

    void teardown();
    bool torn_down() const { return torn_down_.load(); }

private:
    std::istream& in_;
    transport::FrameWriter& writer_;
    Notifier notifier_;
    rpc::Dispatcher dispatcher_;
    supervisor::TaskRegistry tasks_;

    std::vector<std::function<void()>> teardown_steps_;
    std::once_flag teardown_once_;
    std::atomic<bool> torn_down_{false};
};

} // namespace taskbridge::host
