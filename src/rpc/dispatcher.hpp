#pragma once

#include "method_registry.hpp"

#include "../protocol.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace taskbridge::rpc {

/**
 * Routes decoded envelopes. Requests go to the registered method handler and
 * produce at most one response; inbound notifications go to subscribers and
 * never produce output; inbound responses are discarded.
 */
class Dispatcher {
public:
    using Subscriber = std::function<void(const json& params)>;

    void register_handler(std::unique_ptr<MethodHandler> handler);
    void register_handler(const std::string& method, FunctionMethodHandler::Function fn);
    void subscribe(const std::string& method, Subscriber subscriber);

    /// Returns the response to write, or nullopt when nothing is to be written.
    std::optional<Response> dispatch(const Envelope& envelope);

    /**
     * Decodes one frame and dispatches it. Returns the envelope to write back:
     * a response, or an "error" notification for frames without a usable id.
     */
    std::optional<Envelope> handle_frame(const std::string& line);

    const std::vector<std::string>& methods() const { return registry_.names(); }

private:
    std::optional<Response> dispatch_request(const Request& request);
    void dispatch_notification(const Notification& notification);
    json invoke(MethodHandler& handler, const std::string& method, const json& params,
                const std::optional<RequestId>& id);

    MethodRegistry registry_;
    std::unordered_map<std::string, std::vector<Subscriber>> subscribers_;
};

} // namespace taskbridge::rpc
