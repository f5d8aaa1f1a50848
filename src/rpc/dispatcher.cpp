#include "dispatcher.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"
#include "../notifier.hpp"

#include <log4cplus/loggingmacros.h>

#include <limits>

namespace taskbridge::rpc {

const json& MethodHandler::require_object_params(const MethodContext& ctx) const {
    if (!ctx.params.is_object()) {
        throw RpcError(error_code::kInvalidParams, std::string("Invalid params for ") + ctx.method + ": expected object");
    }
    return ctx.params;
}

std::optional<int64_t> MethodHandler::optional_int_param(const MethodContext& ctx, const std::string& key) const {
    const json* value = codec::find_key(ctx.params, key);
    if (!value || value->is_null()) {
        return std::nullopt;
    }
    if (!value->is_number()) {
        throw RpcError(error_code::kInvalidParams, "Invalid params: " + key + " must be an integer");
    }
    constexpr int64_t kNotAnInteger = std::numeric_limits<int64_t>::min();
    int64_t number = codec::as_int64(*value, kNotAnInteger);
    if (number == kNotAnInteger) {
        throw RpcError(error_code::kInvalidParams, "Invalid params: " + key + " must be an integer");
    }
    return number;
}

bool MethodHandler::optional_bool_param(const MethodContext& ctx, const std::string& key, bool fallback) const {
    const json* value = codec::find_key(ctx.params, key);
    if (!value || value->is_null()) {
        return fallback;
    }
    if (!value->is_boolean()) {
        throw RpcError(error_code::kInvalidParams, "Invalid params: " + key + " must be a boolean");
    }
    return value->get<bool>();
}

std::string MethodHandler::optional_string_param(const MethodContext& ctx, const std::string& key,
                                                const std::string& fallback) const {
    const json* value = codec::find_key(ctx.params, key);
    if (!value || value->is_null()) {
        return fallback;
    }
    if (!value->is_string()) {
        throw RpcError(error_code::kInvalidParams, "Invalid params: " + key + " must be a string");
    }
    return value->get<std::string>();
}

void Dispatcher::register_handler(std::unique_ptr<MethodHandler> handler) {
    registry_.add(std::move(handler));
}

void Dispatcher::register_handler(const std::string& method, FunctionMethodHandler::Function fn) {
    registry_.add(std::make_unique<FunctionMethodHandler>(method, std::move(fn)));
}

void Dispatcher::subscribe(const std::string& method, Subscriber subscriber) {
    subscribers_[method].push_back(std::move(subscriber));
}

std::optional<Envelope> Dispatcher::handle_frame(const std::string& line) {
    Envelope envelope;
    try {
        envelope = codec::decode(line);
    } catch (const codec::ProtocolError& exc) {
        LOG4CPLUS_ERROR(rpc_logger(), "Decode error: " << exc.what());
        if (exc.id()) {
            return Envelope{make_error(*exc.id(), exc.code(), exc.what())};
        }
        return Envelope{Notification{method::kError, json{{"code", exc.code()}, {"message", exc.what()}}}};
    }

    if (auto response = dispatch(envelope)) {
        return Envelope{std::move(*response)};
    }
    return std::nullopt;
}

std::optional<Response> Dispatcher::dispatch(const Envelope& envelope) {
    if (const auto* request = std::get_if<Request>(&envelope)) {
        return dispatch_request(*request);
    }
    if (const auto* notification = std::get_if<Notification>(&envelope)) {
        dispatch_notification(*notification);
        return std::nullopt;
    }

    const auto& response = std::get<Response>(envelope);
    LOG4CPLUS_WARN(rpc_logger(), "Discarding inbound response id=" << to_string(response.id));
    return std::nullopt;
}

std::optional<Response> Dispatcher::dispatch_request(const Request& request) {
    LOG4CPLUS_DEBUG(rpc_logger(), "RPC method: " << request.method
                                  << " id=" << (request.id ? to_string(*request.id) : std::string("null")));

    MethodHandler* handler = registry_.find(request.method);
    if (!handler) {
        LOG4CPLUS_WARN(rpc_logger(), "Unknown method: " << request.method);
        if (!request.id) {
            return std::nullopt;
        }
        return make_error(*request.id, error_code::kMethodNotFound, "Method not found: " + request.method);
    }

    try {
        json result = invoke(*handler, request.method, request.params, request.id);
        if (!request.id) {
            return std::nullopt;
        }
        return make_result(*request.id, std::move(result));
    } catch (const RpcError& exc) {
        LOG4CPLUS_WARN(rpc_logger(), request.method << " failed: " << exc.what());
        if (!request.id) {
            return std::nullopt;
        }
        Response response{*request.id, std::nullopt, exc.error()};
        return response;
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(rpc_logger(), request.method << " raised: " << exc.what());
        if (!request.id) {
            return std::nullopt;
        }
        return make_error(*request.id, error_code::kInternalError, std::string("Internal error: ") + exc.what());
    }
}

void Dispatcher::dispatch_notification(const Notification& notification) {
    auto it = subscribers_.find(notification.method);
    if (it != subscribers_.end()) {
        for (auto& subscriber : it->second) {
            try {
                subscriber(notification.params);
            } catch (const std::exception& exc) {
                LOG4CPLUS_ERROR(rpc_logger(), "Subscriber for " << notification.method << " raised: " << exc.what());
            }
        }
        return;
    }

    // An idless call of a known method runs for its side effect only.
    if (MethodHandler* handler = registry_.find(notification.method)) {
        std::optional<RequestId> no_id;
        try {
            invoke(*handler, notification.method, notification.params, no_id);
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(rpc_logger(), notification.method << " (no id) raised: " << exc.what());
        }
        return;
    }

    LOG4CPLUS_DEBUG(rpc_logger(), "No subscriber for notification " << notification.method);
}

json Dispatcher::invoke(MethodHandler& handler, const std::string& method, const json& params,
                        const std::optional<RequestId>& id) {
    MethodContext ctx{method, params, id};
    return handler.handle(ctx);
}

} // namespace taskbridge::rpc
