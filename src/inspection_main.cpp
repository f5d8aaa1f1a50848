#include "backends/inspection_service.hpp"
#include "host/backend_main.hpp"

#include <memory>

using namespace taskbridge;

int main(int argc, char** argv) {
    std::unique_ptr<backends::InspectionService> service;

    host::BackendDefinition definition;
    definition.name = "taskbridge-inspection";
    definition.version = "1.0.0";
    definition.setup = [&service](host::HostLoop& loop, const config::BackendConfig& config) {
        if (config.inspection.command.empty()) {
            throw host::FatalStartupError("inspection.command is not configured");
        }
        auto& job = loop.tasks().create<supervisor::ProcessJob>("inspection server", loop.notifier(),
                                                                config.inspection.to_job_options());
        service = std::make_unique<backends::InspectionService>(job, loop.notifier());
        backends::register_inspection_methods(loop.dispatcher(), *service);
    };
    definition.started = [&service](host::HostLoop&) { service->launch(); };

    return host::run_backend(argc, argv, definition);
}
