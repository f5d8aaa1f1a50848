#include "backends/countdown_service.hpp"
#include "host/backend_main.hpp"

#include <memory>

using namespace taskbridge;

int main(int argc, char** argv) {
    std::unique_ptr<backends::CountdownService> service;

    host::BackendDefinition definition;
    definition.name = "taskbridge-countdown";
    definition.version = "1.0.0";
    definition.setup = [&service](host::HostLoop& loop, const config::BackendConfig& config) {
        auto& timer = loop.tasks().create<supervisor::PeriodicTask>("countdown", loop.notifier(),
                                                                    config.countdown.stop_grace);
        service = std::make_unique<backends::CountdownService>(timer, loop.notifier(), config.countdown);
        backends::register_countdown_methods(loop.dispatcher(), *service);
    };

    return host::run_backend(argc, argv, definition);
}
