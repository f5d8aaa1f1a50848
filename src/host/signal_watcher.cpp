#include "signal_watcher.hpp"

#include "../logger.hpp"

#include <signal.h>

#include <cerrno>
#include <cstring>
#include <ctime>

#include <log4cplus/loggingmacros.h>

namespace taskbridge::host {

namespace {

sigset_t termination_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    return set;
}

} // namespace

void SignalWatcher::block_termination_signals() {
    sigset_t set = termination_signals();
    int rc = ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        LOG4CPLUS_ERROR(core_logger(), "pthread_sigmask failed: " << std::strerror(rc));
    }
    // A vanished caller must surface as a write error, not kill us.
    ::signal(SIGPIPE, SIG_IGN);
}

SignalWatcher::SignalWatcher(Handler handler) : handler_(std::move(handler)), thread_(&SignalWatcher::run, this) {}

SignalWatcher::~SignalWatcher() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SignalWatcher::run() {
    sigset_t set = termination_signals();
    timespec poll_interval{0, 200 * 1000 * 1000};

    while (running_.load()) {
        int signo = ::sigtimedwait(&set, nullptr, &poll_interval);
        if (signo < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                LOG4CPLUS_ERROR(core_logger(), "sigtimedwait failed: " << std::strerror(errno));
            }
            continue;
        }

        LOG4CPLUS_WARN(core_logger(), "Received signal " << signo << " (" << ::strsignal(signo) << ")");
        handler_(signo);
        return;
    }
}

} // namespace taskbridge::host
