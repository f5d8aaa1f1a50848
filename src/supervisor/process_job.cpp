#include "process_job.hpp"

#include "../logger.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <log4cplus/loggingmacros.h>

namespace taskbridge::supervisor {

namespace {

constexpr int kRelayPollMs = 100;
constexpr auto kExitAfterEofWait = std::chrono::milliseconds(1000);
constexpr auto kExitPollSlice = std::chrono::milliseconds(200);
constexpr auto kDrainPollInterval = std::chrono::milliseconds(50);

} // namespace

ProcessJob::ProcessJob(std::string name, Notifier& notifier, ProcessJobOptions options)
    : SupervisedTask(std::move(name), TaskKind::ExternalProcess, notifier), options_(std::move(options)) {}

ProcessJob::~ProcessJob() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (is_active() || run_) {
        stop_locked();
    }
    release_run();
}

void ProcessJob::on_ready(ReadyCallback callback) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    ready_callback_ = std::move(callback);
}

StartOutcome ProcessJob::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return start_locked();
}

StopOutcome ProcessJob::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return stop_locked();
}

StartOutcome ProcessJob::restart() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    LOG4CPLUS_INFO(supervisor_logger(), name() << ": restart requested");
    stop_locked();
    return start_locked();
}

JobStatus ProcessJob::status(bool reprobe) {
    JobStatus result;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        result.state = state();
        result.adopted = adopted_.load();
        if (run_ && run_->child && run_->child->is_running()) {
            result.pid = run_->child->pid();
        }
    }
    if (reprobe) {
        result.reachable = probe_once(options_.endpoint, options_.probe.attempt_timeout);
    }
    return result;
}

StartOutcome ProcessJob::start_locked() {
    if (is_active()) {
        LOG4CPLUS_INFO(supervisor_logger(), name() << ": start ignored, already " << to_string(state()));
        return StartOutcome::AlreadyRunning;
    }

    // Leftovers of a failed attempt.
    release_run();

    const std::string url = options_.endpoint.url();
    if (probe_once(options_.endpoint, options_.probe.attempt_timeout)) {
        transition({TaskState::Idle, TaskState::Stopped, TaskState::Failed}, TaskState::Running);
        adopted_ = true;
        LOG4CPLUS_INFO(supervisor_logger(), name() << ": already serving at " << url << ", adopting it");
        notifier_.log("info", name() + " already running at " + url);
        report_ready(nullptr, true);
        return StartOutcome::Adopted;
    }

    transition({TaskState::Idle, TaskState::Stopped, TaskState::Failed}, TaskState::Starting);
    notifier_.log("info", "starting " + name());

    auto run = std::make_shared<Run>();
    try {
        run->child = ChildProcess::spawn(options_.spawn);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(supervisor_logger(), name() << ": spawn failed: " << exc.what());
        fail(name() + " failed to start: " + exc.what(), error_code::kSpawnFailed);
        report_ready(nullptr, false);
        return StartOutcome::Failed;
    }

    run_ = run;
    stdout_relay_ = std::thread(&ProcessJob::relay_output, this, run, run->child->stdout_fd(), "info", true);
    stderr_relay_ = std::thread(&ProcessJob::relay_output, this, run, run->child->stderr_fd(), "error", false);
    watcher_ = std::thread(&ProcessJob::watch_readiness, this, run);
    return StartOutcome::Started;
}

StopOutcome ProcessJob::stop_locked() {
    const bool active = transition({TaskState::Starting, TaskState::Running}, TaskState::Stopping);
    const bool owned = run_ != nullptr;
    const bool was_adopted = adopted_.exchange(false);

    if (run_) {
        run_->probe_cancelled = true;
        if (run_->child && !run_->child->shutdown(options_.stop_grace)) {
            notifier_.log("error", name() + " did not exit within " + std::to_string(options_.stop_grace.count()) +
                                       " ms and was killed");
        }
    }
    release_run();

    // Also covers an adopted instance that is not our child.
    if (!options_.shutdown_path.empty()) {
        auto code = http_get(options_.endpoint, options_.shutdown_path, options_.shutdown_call_timeout);
        if (code) {
            LOG4CPLUS_INFO(supervisor_logger(), name() << ": shutdown call answered " << *code);
            wait_until_unreachable();
        } else {
            LOG4CPLUS_DEBUG(supervisor_logger(), name() << ": shutdown endpoint not reachable");
        }
    }

    if (!active && !owned && !was_adopted) {
        return StopOutcome::NotRunning;
    }

    transition({TaskState::Stopping, TaskState::Failed}, TaskState::Stopped);
    notifier_.log("info", name() + " stopped");
    return StopOutcome::Stopped;
}

void ProcessJob::wait_until_unreachable() {
    // Something still serves the endpoint; a following start must not adopt it.
    ProbePolicy drain;
    drain.interval = kDrainPollInterval;
    drain.timeout = options_.stop_grace;
    drain.attempt_timeout = options_.probe.attempt_timeout;
    std::atomic<bool> cancelled{false};

    auto result = wait_until_ready([this] { return !probe_once(options_.endpoint, options_.probe.attempt_timeout); },
                                   drain, cancelled);
    if (result != ReadinessResult::Ready) {
        LOG4CPLUS_WARN(supervisor_logger(), name() << ": " << options_.endpoint.url() << " still answering "
                                                   << options_.stop_grace.count() << " ms after shutdown");
        notifier_.log("error", name() + " still answering at " + options_.endpoint.url() + " after shutdown");
    }
}

void ProcessJob::release_run() {
    if (run_) {
        run_->probe_cancelled = true;
        run_->stop_requested = true;
    }
    for (std::thread* worker : {&watcher_, &stdout_relay_, &stderr_relay_}) {
        if (worker->joinable()) {
            worker->join();
        }
    }
    run_.reset();
}

bool ProcessJob::fail(const std::string& message, int code) {
    if (!transition({TaskState::Starting, TaskState::Running}, TaskState::Failed)) {
        return false;
    }
    LOG4CPLUS_ERROR(supervisor_logger(), message);
    notifier_.error(message, code);
    return true;
}

void ProcessJob::report_ready(Run* run, bool ready) {
    if (run && run->verdict_reported.exchange(true)) {
        return;
    }
    if (ready_callback_) {
        ready_callback_(ready);
    }
}

void ProcessJob::watch_readiness(std::shared_ptr<Run> run) {
    auto result = wait_until_ready(
        [this] { return probe_once(options_.endpoint, options_.probe.attempt_timeout); },
        options_.probe, run->probe_cancelled);

    switch (result) {
        case ReadinessResult::Ready:
            if (transition({TaskState::Starting}, TaskState::Running)) {
                LOG4CPLUS_INFO(supervisor_logger(), name() << ": ready at " << options_.endpoint.url());
                notifier_.log("info", name() + " ready at " + options_.endpoint.url());
                report_ready(run.get(), true);
            }
            break;
        case ReadinessResult::TimedOut:
            if (fail(name() + " did not become ready within " + std::to_string(options_.probe.timeout.count()) + " ms",
                     error_code::kReadinessTimeout)) {
                report_ready(run.get(), false);
                // Best effort; the process may outlive this.
                run->child->shutdown(options_.stop_grace);
            }
            break;
        case ReadinessResult::Cancelled:
            break;
    }
}

void ProcessJob::relay_output(std::shared_ptr<Run> run, int fd, const std::string& level, bool primary) {
    std::string pending;
    char buffer[4096];
    bool eof = false;

    auto flush_lines = [&](bool all) {
        size_t start = 0;
        size_t newline;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            std::string line = pending.substr(start, newline - start);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                notifier_.log(level, line);
            }
            start = newline + 1;
        }
        pending.erase(0, start);
        if (all && !pending.empty()) {
            notifier_.log(level, pending);
            pending.clear();
        }
    };

    while (!run->stop_requested.load()) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, kRelayPollMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG4CPLUS_ERROR(process_logger(), name() << ": poll on " << level << " pipe failed: " << std::strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }

        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG4CPLUS_ERROR(process_logger(), name() << ": read on " << level << " pipe failed: " << std::strerror(errno));
            break;
        }
        if (n == 0) {
            eof = true;
            break;
        }
        pending.append(buffer, static_cast<size_t>(n));
        flush_lines(false);
    }

    flush_lines(true);

    if (eof && primary && !run->stop_requested.load()) {
        handle_child_eof(*run);
    }
}

void ProcessJob::handle_child_eof(Run& run) {
    if (!run.child->wait_for_exit(kExitAfterEofWait)) {
        LOG4CPLUS_WARN(process_logger(), name() << ": pid " << run.child->pid()
                                                << " closed stdout but is still running, watching for its exit");
        while (!run.child->wait_for_exit(kExitPollSlice)) {
            if (run.stop_requested.load()) {
                return;
            }
        }
        if (run.stop_requested.load()) {
            return;
        }
    }

    run.probe_cancelled = true;
    const std::string message = name() + " exited unexpectedly (" + run.child->describe_exit() + ")";
    if (fail(message, error_code::kChildExited)) {
        report_ready(&run, false);
    } else {
        LOG4CPLUS_INFO(process_logger(), name() << ": pid " << run.child->pid() << " exited ("
                                                << run.child->describe_exit() << ")");
    }
}

} // namespace taskbridge::supervisor
