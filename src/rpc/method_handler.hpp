#pragma once

#include "../protocol.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace taskbridge::rpc {

/// Handler failure that carries its own error object into the response.
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message, std::optional<json> data = std::nullopt)
        : std::runtime_error(message), error_{code, message, std::move(data)} {}

    const ErrorObject& error() const { return error_; }

private:
    ErrorObject error_;
};

struct MethodContext {
    const std::string& method;
    const json& params;
    const std::optional<RequestId>& id;
};

class MethodHandler {
public:
    virtual ~MethodHandler() = default;
    virtual const char* name() const = 0;

    /// Returns the response result. Throws RpcError or any std::exception on failure.
    virtual json handle(MethodContext& ctx) = 0;

protected:
    const json& require_object_params(const MethodContext& ctx) const;
    std::optional<int64_t> optional_int_param(const MethodContext& ctx, const std::string& key) const;
    bool optional_bool_param(const MethodContext& ctx, const std::string& key, bool fallback) const;
    std::string optional_string_param(const MethodContext& ctx, const std::string& key,
                                      const std::string& fallback) const;
};

/// Adapts a plain function to the MethodHandler interface.
class FunctionMethodHandler final : public MethodHandler {
public:
    using Function = std::function<json(const json& params)>;

    FunctionMethodHandler(std::string name, Function fn) : name_(std::move(name)), fn_(std::move(fn)) {}

    const char* name() const override { return name_.c_str(); }
    json handle(MethodContext& ctx) override { return fn_(ctx.params); }

private:
    std::string name_;
    Function fn_;
};

} // namespace taskbridge::rpc
