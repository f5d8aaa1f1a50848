#pragma once

#include <atomic>
#include <functional>
#include <thread>

namespace taskbridge::host {

/**
 * Consumes SIGINT/SIGTERM/SIGHUP on a dedicated thread with sigtimedwait, so
 * shutdown work never runs inside an async signal handler.
 * block_termination_signals() must run before any other thread exists.
 */
class SignalWatcher {
public:
    using Handler = std::function<void(int signo)>;

    static void block_termination_signals();

    explicit SignalWatcher(Handler handler);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void run();

    Handler handler_;
    std::atomic<bool> running_{true};
    std::thread thread_;
};

} // namespace taskbridge::host
