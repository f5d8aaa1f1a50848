#include "inspection_service.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <memory>

namespace taskbridge::backends {

InspectionService::InspectionService(supervisor::ProcessJob& job, Notifier& notifier)
    : job_(job), notifier_(notifier), url_(job.options().endpoint.url()) {
    job_.on_ready([this](bool ready) { announce(ready); });
}

void InspectionService::launch() {
    auto outcome = job_.start();
    LOG4CPLUS_INFO(supervisor_logger(), job_.name() << ": initial start " << supervisor::to_string(outcome));
}

void InspectionService::announce(bool ready) {
    notifier_.emit("serverReady", json{{"success", ready}, {"url", ready ? json(url_) : json(nullptr)}});
}

json InspectionService::server_url() const {
    return json{{"url", url_}};
}

json InspectionService::server_status(bool reprobe) {
    auto status = job_.status(reprobe);
    bool running = status.state == supervisor::TaskState::Running && status.reachable.value_or(true);

    json result{
        {"running", running},
        {"state", supervisor::to_string(status.state)},
        {"adopted", status.adopted},
        {"pid", status.pid ? json(*status.pid) : json(nullptr)},
        {"url", running ? json(url_) : json(nullptr)},
    };
    if (status.reachable) {
        result["reachable"] = *status.reachable;
    }
    return result;
}

json InspectionService::restart() {
    auto outcome = job_.restart();
    bool success = outcome != supervisor::StartOutcome::Failed;
    return json{
        {"success", success},
        {"state", supervisor::to_string(job_.state())},
        {"adopted", outcome == supervisor::StartOutcome::Adopted},
        {"url", success ? json(url_) : json(nullptr)},
    };
}

json InspectionService::shutdown() {
    job_.stop();
    return json{{"success", true}};
}

namespace {

class GetServerUrlMethod final : public rpc::MethodHandler {
public:
    explicit GetServerUrlMethod(InspectionService& service) : service_(service) {}

    const char* name() const override { return "getServerUrl"; }
    json handle(rpc::MethodContext&) override { return service_.server_url(); }

private:
    InspectionService& service_;
};

class GetServerStatusMethod final : public rpc::MethodHandler {
public:
    explicit GetServerStatusMethod(InspectionService& service) : service_(service) {}

    const char* name() const override { return "getServerStatus"; }

    json handle(rpc::MethodContext& ctx) override {
        return service_.server_status(optional_bool_param(ctx, "reprobe", false));
    }

private:
    InspectionService& service_;
};

class RestartServerMethod final : public rpc::MethodHandler {
public:
    explicit RestartServerMethod(InspectionService& service) : service_(service) {}

    const char* name() const override { return "restartServer"; }
    json handle(rpc::MethodContext&) override { return service_.restart(); }

private:
    InspectionService& service_;
};

class ShutdownMethod final : public rpc::MethodHandler {
public:
    explicit ShutdownMethod(InspectionService& service) : service_(service) {}

    const char* name() const override { return "shutdown"; }
    json handle(rpc::MethodContext&) override { return service_.shutdown(); }

private:
    InspectionService& service_;
};

} // namespace

void register_inspection_methods(rpc::Dispatcher& dispatcher, InspectionService& service) {
    dispatcher.register_handler(std::make_unique<GetServerUrlMethod>(service));
    dispatcher.register_handler(std::make_unique<GetServerStatusMethod>(service));
    dispatcher.register_handler(std::make_unique<RestartServerMethod>(service));
    dispatcher.register_handler(std::make_unique<ShutdownMethod>(service));
}

} // namespace taskbridge::backends
