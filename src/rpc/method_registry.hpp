#pragma once

#include "method_handler.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace taskbridge::rpc {

class MethodRegistry {
public:
    void add(std::unique_ptr<MethodHandler> handler);
    MethodHandler* find(const std::string& method);

    /// Registered names in registration order.
    const std::vector<std::string>& names() const { return names_; }

private:
    std::unordered_map<std::string, std::unique_ptr<MethodHandler>> handlers_;
    std::vector<std::string> names_;
};

} // namespace taskbridge::rpc
