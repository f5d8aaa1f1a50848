#pragma once

#include "../config.hpp"
#include "../notifier.hpp"
#include "../rpc/dispatcher.hpp"
#include "../supervisor/periodic_task.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace taskbridge::backends {

/**
 * Countdown timer driven by a PeriodicTask. Every period `remaining` drops by
 * one and a tick event is emitted; at zero the task completes.
 */
class CountdownService {
public:
    CountdownService(supervisor::PeriodicTask& task, Notifier& notifier, const config::CountdownConfig& config);

    json start(std::optional<int64_t> duration);
    json pause();
    json reset();
    json status() const;

private:
    supervisor::TickResult tick();

    supervisor::PeriodicTask& task_;
    Notifier& notifier_;
    std::chrono::milliseconds tick_period_;

    mutable std::mutex mutex_;
    int64_t duration_;
    int64_t remaining_;
    std::optional<std::chrono::system_clock::time_point> start_time_;
};

void register_countdown_methods(rpc::Dispatcher& dispatcher, CountdownService& service);

} // namespace taskbridge::backends
