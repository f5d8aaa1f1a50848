#include "child_process.hpp"

#include "../logger.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <log4cplus/loggingmacros.h>

extern char** environ;

namespace taskbridge::supervisor {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(20);

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair {
    int read_fd = -1;
    int write_fd = -1;

    ~PipePair() {
        close_fd(read_fd);
        close_fd(write_fd);
    }

    void open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) < 0) {
            throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
        }
        read_fd = fds[0];
        write_fd = fds[1];
    }

    int release_read() {
        int fd = read_fd;
        read_fd = -1;
        return fd;
    }
};

std::vector<std::string> build_environment(const SpawnSpec& spec) {
    std::map<std::string, std::string> merged;
    if (spec.inherit_env && environ) {
        for (char** entry = environ; *entry; ++entry) {
            std::string item(*entry);
            auto eq = item.find('=');
            if (eq == std::string::npos) {
                continue;
            }
            merged[item.substr(0, eq)] = item.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : spec.env) {
        merged[key] = value;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        result.push_back(key + "=" + value);
    }
    return result;
}

std::vector<char*> to_pointers(std::vector<std::string>& items) {
    std::vector<char*> pointers;
    pointers.reserve(items.size() + 1);
    for (auto& item : items) {
        pointers.push_back(item.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const SpawnSpec& spec, char** argv, char** envp, int stdout_fd, int stderr_fd,
                             int error_fd) {
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    if (spec.parent_death_signal) {
        ::prctl(PR_SET_PDEATHSIG, SIGTERM);
    }

    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
    }
    ::dup2(stdout_fd, STDOUT_FILENO);
    ::dup2(stderr_fd, STDERR_FILENO);

    if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) < 0) {
        int err = errno;
        ssize_t ignored = ::write(error_fd, &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::execvpe(argv[0], argv, envp);

    int err = errno;
    ssize_t ignored = ::write(error_fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::spawn(const SpawnSpec& spec) {
    if (spec.program.empty()) {
        throw std::runtime_error("no program configured");
    }

    // Everything the child needs is allocated before fork().
    std::vector<std::string> argv_items;
    argv_items.reserve(spec.args.size() + 1);
    argv_items.push_back(spec.program);
    argv_items.insert(argv_items.end(), spec.args.begin(), spec.args.end());
    std::vector<std::string> env_items = build_environment(spec);
    std::vector<char*> argv = to_pointers(argv_items);
    std::vector<char*> envp = to_pointers(env_items);

    PipePair out_pipe;
    PipePair err_pipe;
    PipePair exec_pipe;
    out_pipe.open();
    err_pipe.open();
    exec_pipe.open();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        exec_child(spec, argv.data(), envp.data(), out_pipe.write_fd, err_pipe.write_fd, exec_pipe.write_fd);
    }

    close_fd(out_pipe.write_fd);
    close_fd(err_pipe.write_fd);
    close_fd(exec_pipe.write_fd);

    // The exec pipe is close-on-exec: EOF means exec succeeded.
    int child_errno = 0;
    ssize_t got;
    do {
        got = ::read(exec_pipe.read_fd, &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw std::runtime_error("failed to start " + spec.program + ": " + std::strerror(child_errno));
    }

    LOG4CPLUS_INFO(process_logger(), "spawned " << spec.program << " pid=" << pid);
    return std::unique_ptr<ChildProcess>(new ChildProcess(pid, out_pipe.release_read(), err_pipe.release_read()));
}

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::~ChildProcess() {
    if (is_running()) {
        LOG4CPLUS_WARN(process_logger(), "pid " << pid_ << " still alive on release, killing");
        kill();
        reap(true);
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

bool ChildProcess::reap(bool block) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_) {
        return true;
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        status_ = status;
        return true;
    }
    if (result < 0) {
        // ECHILD: somebody else reaped it; treat as gone.
        LOG4CPLUS_WARN(process_logger(), "waitpid(" << pid_ << ") failed: " << std::strerror(errno));
        status_ = -1;
        return true;
    }
    return false;
}

bool ChildProcess::is_running() {
    return !reap(false);
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (reap(false)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

std::optional<int> ChildProcess::exit_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::string ChildProcess::describe_exit() const {
    auto status = exit_status();
    if (!status) {
        return "still running";
    }
    if (*status < 0) {
        return "exit status unknown";
    }
    if (WIFEXITED(*status)) {
        return "exit code " + std::to_string(WEXITSTATUS(*status));
    }
    if (WIFSIGNALED(*status)) {
        return "killed by signal " + std::to_string(WTERMSIG(*status));
    }
    return "status " + std::to_string(*status);
}

bool ChildProcess::send_signal(int signo) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Never signal a reaped pid: it may already belong to another process.
    if (status_) {
        return false;
    }
    if (::kill(pid_, signo) < 0) {
        LOG4CPLUS_WARN(process_logger(), "kill(" << pid_ << ", " << signo << ") failed: " << std::strerror(errno));
        return false;
    }
    return true;
}

bool ChildProcess::terminate() {
    return send_signal(SIGTERM);
}

bool ChildProcess::kill() {
    return send_signal(SIGKILL);
}

bool ChildProcess::shutdown(std::chrono::milliseconds grace) {
    if (!is_running()) {
        return true;
    }

    terminate();
    if (wait_for_exit(grace)) {
        LOG4CPLUS_INFO(process_logger(), "pid " << pid_ << " exited (" << describe_exit() << ")");
        return true;
    }

    LOG4CPLUS_WARN(process_logger(), "pid " << pid_ << " ignored SIGTERM for " << grace.count() << " ms, killing");
    kill();
    reap(true);
    return false;
}

} // namespace taskbridge::supervisor
