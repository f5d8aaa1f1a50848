#pragma once

#include "supervised_task.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace taskbridge::supervisor {

struct TickResult {
    std::optional<Notification> event;
    bool done = false;
};

/**
 * In-process repeating task. `tick` runs once per period on a dedicated
 * thread; its event is written as a notification. A tick that reports done
 * moves the task to stopped and writes the completion notification.
 */
class PeriodicTask final : public SupervisedTask {
public:
    /// `elapsed` counts ticks, starting at 1.
    using TickFn = std::function<TickResult(int64_t elapsed)>;
    using CompletionFn = std::function<std::optional<Notification>()>;

    PeriodicTask(std::string name, Notifier& notifier,
                 std::chrono::milliseconds stop_grace = std::chrono::milliseconds(2000));
    ~PeriodicTask() override;

    StartOutcome start(std::chrono::milliseconds period, TickFn tick, CompletionFn on_complete = nullptr);
    StopOutcome stop() override;

    int64_t ticks() const;

private:
    // Shared with the worker thread so an abandoned worker stays valid.
    struct Worker {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
        bool abandoned = false;
        bool finished = false;
    };

    void run(std::shared_ptr<Worker> worker, std::chrono::milliseconds period, TickFn tick,
             CompletionFn on_complete);
    void reap_finished_worker();

    std::chrono::milliseconds stop_grace_;
    std::mutex lifecycle_mutex_;
    std::shared_ptr<Worker> worker_;
    std::thread thread_;
    std::atomic<int64_t> ticks_{0};
};

} // namespace taskbridge::supervisor
