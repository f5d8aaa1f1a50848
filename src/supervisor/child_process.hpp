#pragma once

#include <sys/types.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskbridge::supervisor {

struct SpawnSpec {
    std::string program;
    std::vector<std::string> args;
    std::string working_dir;                 // empty: inherit
    std::map<std::string, std::string> env;  // applied on top of the inherited environment
    bool inherit_env = true;
    bool parent_death_signal = true;         // SIGTERM the child if this process dies
};

/**
 * A spawned child with its stdout/stderr pipes. stdin is /dev/null so the
 * child can never consume protocol frames. The destructor kills and reaps a
 * child that is still alive.
 */
class ChildProcess {
public:
    /// Throws std::runtime_error when the pipes, fork or exec fail.
    static std::unique_ptr<ChildProcess> spawn(const SpawnSpec& spec);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    bool is_running();
    bool wait_for_exit(std::chrono::milliseconds timeout);

    /// Raw wait status once reaped.
    std::optional<int> exit_status() const;
    std::string describe_exit() const;

    bool terminate();
    bool kill();

    /// SIGTERM, wait up to grace, then SIGKILL. Returns true when the child
    /// exited before the grace period ran out.
    bool shutdown(std::chrono::milliseconds grace);

private:
    ChildProcess(pid_t pid, int stdout_fd, int stderr_fd);

    bool reap(bool block);
    bool send_signal(int signo);

    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;

    mutable std::mutex mutex_;
    std::optional<int> status_;
};

} // namespace taskbridge::supervisor
