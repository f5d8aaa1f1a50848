#include "periodic_task.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace taskbridge::supervisor {

PeriodicTask::PeriodicTask(std::string name, Notifier& notifier, std::chrono::milliseconds stop_grace)
    : SupervisedTask(std::move(name), TaskKind::InProcess, notifier), stop_grace_(stop_grace) {}

PeriodicTask::~PeriodicTask() {
    stop();
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (thread_.joinable()) {
        thread_.join();
    }
}

int64_t PeriodicTask::ticks() const {
    return ticks_.load();
}

StartOutcome PeriodicTask::start(std::chrono::milliseconds period, TickFn tick, CompletionFn on_complete) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (!transition({TaskState::Idle, TaskState::Stopped, TaskState::Failed}, TaskState::Starting)) {
        LOG4CPLUS_INFO(supervisor_logger(), name() << ": start ignored, already " << to_string(state()));
        return StartOutcome::AlreadyRunning;
    }

    // A worker that completed or failed on its own is still joinable.
    reap_finished_worker();

    ticks_ = 0;
    worker_ = std::make_shared<Worker>();
    // Running before the first tick can report done.
    transition({TaskState::Starting}, TaskState::Running);
    thread_ = std::thread(&PeriodicTask::run, this, worker_, period, std::move(tick), std::move(on_complete));

    LOG4CPLUS_INFO(supervisor_logger(), name() << ": started, period " << period.count() << " ms");
    return StartOutcome::Started;
}

StopOutcome PeriodicTask::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (!transition({TaskState::Starting, TaskState::Running}, TaskState::Stopping)) {
        reap_finished_worker();
        return StopOutcome::NotRunning;
    }

    auto worker = worker_;
    bool finished = false;
    {
        std::unique_lock<std::mutex> worker_lock(worker->mutex);
        worker->cancelled = true;
        worker->cv.notify_all();
        finished = worker->cv.wait_for(worker_lock, stop_grace_, [&] { return worker->finished; });
        if (!finished) {
            worker->abandoned = true;
        }
    }

    if (finished) {
        thread_.join();
    } else {
        LOG4CPLUS_WARN(supervisor_logger(), name() << ": worker did not finish within " << stop_grace_.count()
                                                   << " ms, detaching");
        thread_.detach();
    }
    worker_.reset();

    transition({TaskState::Stopping}, TaskState::Stopped);
    LOG4CPLUS_INFO(supervisor_logger(), name() << ": stopped after " << ticks_.load() << " ticks");
    return StopOutcome::Stopped;
}

void PeriodicTask::reap_finished_worker() {
    if (!thread_.joinable()) {
        return;
    }
    thread_.join();
    worker_.reset();
}

void PeriodicTask::run(std::shared_ptr<Worker> worker, std::chrono::milliseconds period, TickFn tick,
                       CompletionFn on_complete) {
    // Called with worker->mutex held.
    auto finish = [&worker] {
        worker->finished = true;
        worker->cv.notify_all();
    };

    for (int64_t elapsed = 1;; ++elapsed) {
        {
            std::unique_lock<std::mutex> lock(worker->mutex);
            if (worker->cv.wait_for(lock, period, [&] { return worker->cancelled; })) {
                finish();
                return;
            }
        }

        TickResult result;
        try {
            result = tick(elapsed);
        } catch (const std::exception& exc) {
            std::unique_lock<std::mutex> lock(worker->mutex);
            if (worker->abandoned) {
                finish();
                return;
            }
            LOG4CPLUS_ERROR(supervisor_logger(), name() << ": tick " << elapsed << " failed: " << exc.what());
            if (transition({TaskState::Running}, TaskState::Failed)) {
                notifier_.error(name() + " failed: " + exc.what(), error_code::kInternalError);
            }
            finish();
            return;
        }

        std::unique_lock<std::mutex> lock(worker->mutex);
        if (worker->abandoned) {
            finish();
            return;
        }

        // The in-flight tick is completed even when a stop is waiting on it.
        ticks_ = elapsed;
        if (result.event) {
            notifier_.writer().write(*result.event);
        }

        if (result.done) {
            if (transition({TaskState::Running}, TaskState::Stopped)) {
                LOG4CPLUS_INFO(supervisor_logger(), name() << ": completed after " << elapsed << " ticks");
                if (on_complete) {
                    if (auto completion = on_complete()) {
                        notifier_.writer().write(*completion);
                    }
                }
            }
            finish();
            return;
        }

        if (worker->cancelled) {
            finish();
            return;
        }
    }
}

} // namespace taskbridge::supervisor
