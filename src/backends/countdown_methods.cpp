#include "countdown_service.hpp"

#include <memory>

namespace taskbridge::backends {

namespace {

class CountdownStartMethod final : public rpc::MethodHandler {
public:
    explicit CountdownStartMethod(CountdownService& service) : service_(service) {}

    const char* name() const override { return "start"; }

    json handle(rpc::MethodContext& ctx) override {
        auto duration = optional_int_param(ctx, "duration");
        if (duration && *duration <= 0) {
            throw rpc::RpcError(error_code::kInvalidParams, "duration must be a positive integer");
        }
        return service_.start(duration);
    }

private:
    CountdownService& service_;
};

class CountdownPauseMethod final : public rpc::MethodHandler {
public:
    explicit CountdownPauseMethod(CountdownService& service) : service_(service) {}

    const char* name() const override { return "pause"; }
    json handle(rpc::MethodContext&) override { return service_.pause(); }

private:
    CountdownService& service_;
};

class CountdownResetMethod final : public rpc::MethodHandler {
public:
    explicit CountdownResetMethod(CountdownService& service) : service_(service) {}

    const char* name() const override { return "reset"; }
    json handle(rpc::MethodContext&) override { return service_.reset(); }

private:
    CountdownService& service_;
};

class CountdownStatusMethod final : public rpc::MethodHandler {
public:
    explicit CountdownStatusMethod(CountdownService& service) : service_(service) {}

    const char* name() const override { return "getStatus"; }
    json handle(rpc::MethodContext&) override { return service_.status(); }

private:
    CountdownService& service_;
};

} // namespace

void register_countdown_methods(rpc::Dispatcher& dispatcher, CountdownService& service) {
    dispatcher.register_handler(std::make_unique<CountdownStartMethod>(service));
    dispatcher.register_handler(std::make_unique<CountdownPauseMethod>(service));
    dispatcher.register_handler(std::make_unique<CountdownResetMethod>(service));
    dispatcher.register_handler(std::make_unique<CountdownStatusMethod>(service));
}

} // namespace taskbridge::backends
