#include "protocol.hpp"

namespace taskbridge {

bool operator==(const ErrorObject& lhs, const ErrorObject& rhs) {
    return lhs.code == rhs.code && lhs.message == rhs.message && lhs.data == rhs.data;
}

bool operator==(const Request& lhs, const Request& rhs) {
    return lhs.id == rhs.id && lhs.method == rhs.method && lhs.params == rhs.params;
}

bool operator==(const Response& lhs, const Response& rhs) {
    return lhs.id == rhs.id && lhs.result == rhs.result && lhs.error == rhs.error;
}

bool operator==(const Notification& lhs, const Notification& rhs) {
    return lhs.method == rhs.method && lhs.params == rhs.params;
}

std::string to_string(const RequestId& id) {
    if (const auto* number = std::get_if<int64_t>(&id)) {
        return std::to_string(*number);
    }
    return std::get<std::string>(id);
}

Response make_result(const RequestId& id, json result) {
    Response response{id, std::move(result), std::nullopt};
    return response;
}

Response make_error(const RequestId& id, int code, std::string message) {
    Response response{id, std::nullopt, ErrorObject{code, std::move(message), std::nullopt}};
    return response;
}

} // namespace taskbridge
