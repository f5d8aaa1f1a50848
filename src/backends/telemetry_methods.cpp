#include "telemetry_service.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <functional>
#include <memory>
#include <stdexcept>

namespace taskbridge::backends {

namespace {

// Wraps one sampler reading as {data: ...}; sampler failures become internal errors.
class SnapshotMethod final : public rpc::MethodHandler {
public:
    using Reader = std::function<json(TelemetrySampler&)>;

    SnapshotMethod(const char* name, TelemetrySampler& sampler, Reader reader)
        : name_(name), sampler_(sampler), reader_(std::move(reader)) {}

    const char* name() const override { return name_; }

    json handle(rpc::MethodContext&) override {
        try {
            return json{{"data", reader_(sampler_)}};
        } catch (const std::runtime_error& exc) {
            LOG4CPLUS_ERROR(rpc_logger(), name_ << ": sampling failed: " << exc.what());
            throw rpc::RpcError(error_code::kInternalError, std::string("Sampling failed: ") + exc.what());
        }
    }

private:
    const char* name_;
    TelemetrySampler& sampler_;
    Reader reader_;
};

class ProcessesMethod final : public rpc::MethodHandler {
public:
    explicit ProcessesMethod(TelemetrySampler& sampler) : sampler_(sampler) {}

    const char* name() const override { return "getProcesses"; }

    json handle(rpc::MethodContext& ctx) override {
        const std::string sort_by = optional_string_param(ctx, "sortBy", "cpu");
        TelemetrySampler::ProcessOrder order;
        if (sort_by == "cpu") {
            order = TelemetrySampler::ProcessOrder::Cpu;
        } else if (sort_by == "memory") {
            order = TelemetrySampler::ProcessOrder::Memory;
        } else {
            throw rpc::RpcError(error_code::kInvalidParams, "sortBy must be \"cpu\" or \"memory\"");
        }

        const int64_t limit = optional_int_param(ctx, "limit").value_or(kDefaultLimit);
        if (limit <= 0) {
            throw rpc::RpcError(error_code::kInvalidParams, "limit must be a positive integer");
        }

        try {
            return json{{"data", sampler_.processes(order, static_cast<size_t>(limit))}};
        } catch (const std::runtime_error& exc) {
            LOG4CPLUS_ERROR(rpc_logger(), "getProcesses: sampling failed: " << exc.what());
            throw rpc::RpcError(error_code::kInternalError, std::string("Sampling failed: ") + exc.what());
        }
    }

private:
    static constexpr int64_t kDefaultLimit = 10;

    TelemetrySampler& sampler_;
};

class StartMonitorMethod final : public rpc::MethodHandler {
public:
    explicit StartMonitorMethod(TelemetryService& service) : service_(service) {}

    const char* name() const override { return "startMonitor"; }
    json handle(rpc::MethodContext&) override { return service_.start_monitor(); }

private:
    TelemetryService& service_;
};

class StopMonitorMethod final : public rpc::MethodHandler {
public:
    explicit StopMonitorMethod(TelemetryService& service) : service_(service) {}

    const char* name() const override { return "stopMonitor"; }
    json handle(rpc::MethodContext&) override { return service_.stop_monitor(); }

private:
    TelemetryService& service_;
};

} // namespace

void register_telemetry_methods(rpc::Dispatcher& dispatcher, TelemetryService& service) {
    auto& sampler = service.sampler();
    dispatcher.register_handler(std::make_unique<SnapshotMethod>(
        "getSystemInfo", sampler, [](TelemetrySampler& s) { return s.system_info(); }));
    dispatcher.register_handler(std::make_unique<SnapshotMethod>(
        "getCpuInfo", sampler, [](TelemetrySampler& s) { return s.cpu_info(); }));
    dispatcher.register_handler(std::make_unique<SnapshotMethod>(
        "getMemoryInfo", sampler, [](TelemetrySampler& s) { return s.memory_info(); }));
    dispatcher.register_handler(std::make_unique<SnapshotMethod>(
        "getNetworkInfo", sampler, [](TelemetrySampler& s) { return s.network_info(); }));
    dispatcher.register_handler(std::make_unique<SnapshotMethod>(
        "getDiskInfo", sampler, [](TelemetrySampler& s) { return s.disk_info(); }));
    dispatcher.register_handler(std::make_unique<ProcessesMethod>(sampler));
    dispatcher.register_handler(std::make_unique<StartMonitorMethod>(service));
    dispatcher.register_handler(std::make_unique<StopMonitorMethod>(service));
}

} // namespace taskbridge::backends
