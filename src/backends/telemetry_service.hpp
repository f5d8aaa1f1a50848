#pragma once

#include "telemetry_sampler.hpp"

#include "../config.hpp"
#include "../notifier.hpp"
#include "../rpc/dispatcher.hpp"
#include "../supervisor/periodic_task.hpp"

namespace taskbridge::backends {

/// Snapshot queries plus a periodic monitor pushing "monitor_data" notifications.
class TelemetryService {
public:
    TelemetryService(supervisor::PeriodicTask& monitor, Notifier& notifier, TelemetrySampler& sampler,
                     const config::TelemetryConfig& config);

    json start_monitor();
    json stop_monitor();

    TelemetrySampler& sampler() { return sampler_; }

private:
    supervisor::TickResult sample();

    supervisor::PeriodicTask& monitor_;
    Notifier& notifier_;
    TelemetrySampler& sampler_;
    std::chrono::milliseconds sample_period_;
};

void register_telemetry_methods(rpc::Dispatcher& dispatcher, TelemetryService& service);

} // namespace taskbridge::backends
