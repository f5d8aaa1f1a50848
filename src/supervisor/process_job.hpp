#pragma once

#include "child_process.hpp"
#include "readiness_probe.hpp"
#include "supervised_task.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace taskbridge::supervisor {

struct ProcessJobOptions {
    SpawnSpec spawn;
    Endpoint endpoint;
    ProbePolicy probe;
    std::string shutdown_path; // GET on stop; empty to skip
    std::chrono::milliseconds stop_grace{5000};
    std::chrono::milliseconds shutdown_call_timeout{2000};
};

struct JobStatus {
    TaskState state = TaskState::Idle;
    bool adopted = false;
    std::optional<pid_t> pid;
    std::optional<bool> reachable; // only filled in when re-probed
};

/**
 * Supervises an external server process. start() returns once the child is
 * spawned; readiness is established by a background watcher, and the
 * child's stdout/stderr lines are relayed as "log" events.
 */
class ProcessJob final : public SupervisedTask {
public:
    /// Invoked once per start attempt with the readiness verdict.
    using ReadyCallback = std::function<void(bool ready)>;

    ProcessJob(std::string name, Notifier& notifier, ProcessJobOptions options);
    ~ProcessJob() override;

    void on_ready(ReadyCallback callback);

    StartOutcome start();
    StopOutcome stop() override;

    /// stop() followed by start() without letting another lifecycle call in between.
    StartOutcome restart();

    JobStatus status(bool reprobe = false);
    const ProcessJobOptions& options() const { return options_; }

private:
    // One spawn attempt, shared with its background threads.
    struct Run {
        std::unique_ptr<ChildProcess> child;
        std::atomic<bool> probe_cancelled{false};
        std::atomic<bool> stop_requested{false};
        std::atomic<bool> verdict_reported{false};
    };

    StartOutcome start_locked();
    StopOutcome stop_locked();
    void release_run();
    void wait_until_unreachable();

    void watch_readiness(std::shared_ptr<Run> run);
    void relay_output(std::shared_ptr<Run> run, int fd, const std::string& level, bool primary);
    void handle_child_eof(Run& run);
    bool fail(const std::string& message, int code);
    void report_ready(Run* run, bool ready);

    ProcessJobOptions options_;
    ReadyCallback ready_callback_;

    std::mutex lifecycle_mutex_;
    std::shared_ptr<Run> run_;
    std::thread watcher_;
    std::thread stdout_relay_;
    std::thread stderr_relay_;
    std::atomic<bool> adopted_{false};
};

} // namespace taskbridge::supervisor
