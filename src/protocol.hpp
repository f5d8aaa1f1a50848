#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace taskbridge {

using json = nlohmann::json;

/// Caller-supplied request identifier (integer or string).
using RequestId = std::variant<int64_t, std::string>;

namespace error_code {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// Domain range -32000..-32099
constexpr int kReadinessTimeout = -32001;
constexpr int kChildExited = -32002;
constexpr int kSpawnFailed = -32003;
constexpr int kFatalStartup = -32004;
} // namespace error_code

struct ErrorObject {
    int code = error_code::kInternalError;
    std::string message;
    std::optional<json> data;
};

struct Request {
    std::optional<RequestId> id; // nullopt: "id": null, response is suppressed
    std::string method;
    json params = json::object();
};

struct Response {
    RequestId id;
    std::optional<json> result;
    std::optional<ErrorObject> error;
};

struct Notification {
    std::string method;
    json params = json::object();
};

using Envelope = std::variant<Request, Response, Notification>;

bool operator==(const ErrorObject& lhs, const ErrorObject& rhs);
bool operator==(const Request& lhs, const Request& rhs);
bool operator==(const Response& lhs, const Response& rhs);
bool operator==(const Notification& lhs, const Notification& rhs);

std::string to_string(const RequestId& id);

Response make_result(const RequestId& id, json result);
Response make_error(const RequestId& id, int code, std::string message);

} // namespace taskbridge
