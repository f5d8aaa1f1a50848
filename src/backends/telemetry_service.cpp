#include "telemetry_service.hpp"

#include "../json_codec.hpp"

namespace taskbridge::backends {

TelemetryService::TelemetryService(supervisor::PeriodicTask& monitor, Notifier& notifier, TelemetrySampler& sampler,
                                   const config::TelemetryConfig& config)
    : monitor_(monitor), notifier_(notifier), sampler_(sampler), sample_period_(config.sample_period) {}

json TelemetryService::start_monitor() {
    auto outcome = monitor_.start(sample_period_, [this](int64_t) { return sample(); });
    if (outcome == supervisor::StartOutcome::AlreadyRunning) {
        return json{{"success", false}, {"error", "Monitor already running"}};
    }

    notifier_.notify("monitor_started", json{{"message", "Monitor started"}});
    return json{{"success", true}};
}

json TelemetryService::stop_monitor() {
    if (monitor_.stop() == supervisor::StopOutcome::NotRunning) {
        return json{{"success", false}, {"error", "Monitor not running"}};
    }

    notifier_.notify("monitor_stopped", json{{"message", "Monitor stopped"}});
    return json{{"success", true}};
}

supervisor::TickResult TelemetryService::sample() {
    json data{
        {"cpu", sampler_.cpu_info()},
        {"memory", sampler_.memory_info()},
        {"network", sampler_.network_info()},
        {"timestamp", codec::now_iso()},
    };

    supervisor::TickResult result;
    result.event = Notification{"monitor_data", json{{"data", std::move(data)}}};
    return result;
}

} // namespace taskbridge::backends
