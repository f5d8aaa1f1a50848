#include "countdown_service.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace taskbridge::backends {

namespace {

json failure(const std::string& message) {
    return json{{"success", false}, {"error", message}};
}

Notification timer_event(json params) {
    return Notification{method::kEvent, std::move(params)};
}

} // namespace

CountdownService::CountdownService(supervisor::PeriodicTask& task, Notifier& notifier,
                                   const config::CountdownConfig& config)
    : task_(task),
      notifier_(notifier),
      tick_period_(config.tick_period),
      duration_(config.default_duration_s),
      remaining_(config.default_duration_s) {}

json CountdownService::start(std::optional<int64_t> duration) {
    if (task_.is_active()) {
        return failure("Timer already running");
    }

    int64_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (duration) {
            duration_ = *duration;
        }
        remaining_ = duration_;
        remaining = remaining_;
        start_time_ = std::chrono::system_clock::now();
    }

    auto outcome = task_.start(
        tick_period_, [this](int64_t) { return tick(); },
        [] { return std::optional<Notification>(timer_event(json{{"type", "complete"}})); });
    if (outcome == supervisor::StartOutcome::AlreadyRunning) {
        return failure("Timer already running");
    }

    LOG4CPLUS_INFO(supervisor_logger(), "countdown started with " << remaining << " s remaining");
    return json{{"success", true}, {"remaining", remaining}};
}

json CountdownService::pause() {
    if (task_.stop() == supervisor::StopOutcome::NotRunning) {
        return failure("Timer not running");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    LOG4CPLUS_INFO(supervisor_logger(), "countdown paused at " << remaining_ << " s");
    return json{{"success", true}, {"remaining", remaining_}};
}

json CountdownService::reset() {
    task_.stop();

    int64_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining_ = duration_;
        start_time_.reset();
        remaining = remaining_;
    }

    notifier_.notify(method::kEvent, json{{"type", "reset"}, {"remaining", remaining}});
    return json{{"success", true}, {"remaining", remaining}};
}

json CountdownService::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return json{
        {"isRunning", task_.is_active()},
        {"remaining", remaining_},
        {"duration", duration_},
        {"startTime", start_time_ ? json(codec::to_iso(*start_time_)) : json(nullptr)},
    };
}

supervisor::TickResult CountdownService::tick() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (remaining_ > 0) {
        --remaining_;
    }

    supervisor::TickResult result;
    result.event = timer_event(json{{"type", "tick"}, {"remaining", remaining_}, {"total", duration_}});
    result.done = remaining_ <= 0;
    return result;
}

} // namespace taskbridge::backends
