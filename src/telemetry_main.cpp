#include "backends/telemetry_service.hpp"
#include "host/backend_main.hpp"

#include <memory>

using namespace taskbridge;

int main(int argc, char** argv) {
    backends::TelemetrySampler sampler;
    std::unique_ptr<backends::TelemetryService> service;

    host::BackendDefinition definition;
    definition.name = "taskbridge-telemetry";
    definition.version = "1.0.0";
    definition.setup = [&](host::HostLoop& loop, const config::BackendConfig& config) {
        auto& monitor = loop.tasks().create<supervisor::PeriodicTask>("monitor", loop.notifier(),
                                                                      config.telemetry.stop_grace);
        service = std::make_unique<backends::TelemetryService>(monitor, loop.notifier(), sampler, config.telemetry);
        backends::register_telemetry_methods(loop.dispatcher(), *service);
    };

    return host::run_backend(argc, argv, definition);
}
