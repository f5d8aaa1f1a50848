#include "method_registry.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace taskbridge::rpc {

void MethodRegistry::add(std::unique_ptr<MethodHandler> handler) {
    if (!handler) {
        return;
    }
    std::string name = handler->name();
    auto [it, inserted] = handlers_.try_emplace(name, std::move(handler));
    if (!inserted) {
        LOG4CPLUS_WARN(rpc_logger(), "Replacing handler for method " << name);
        it->second = std::move(handler);
        return;
    }
    names_.push_back(name);
}

MethodHandler* MethodRegistry::find(const std::string& method) {
    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

} // namespace taskbridge::rpc
