#include "json_codec.hpp"

#include <cmath>
#include <ctime>
#include <limits>

namespace taskbridge::codec {

namespace {

constexpr double kMaxSafeInteger = 9007199254740991.0; // 2^53 - 1

// Reads the "id" member. Returns false when the member has a type that can
// not serve as an id (object, array, bool, fraction, out-of-range integer).
// Integral floats such as 1.0 are read as integers.
bool read_id(const json& root, std::optional<RequestId>& out) {
    out.reset();
    auto it = root.find("id");
    if (it == root.end() || it->is_null()) {
        return true;
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        out = static_cast<int64_t>(value);
        return true;
    }
    if (it->is_number_integer()) {
        out = it->get<int64_t>();
        return true;
    }
    if (it->is_number_float()) {
        double number = it->get<double>();
        if (!std::isfinite(number) || std::trunc(number) != number || std::fabs(number) > kMaxSafeInteger) {
            return false;
        }
        out = static_cast<int64_t>(number);
        return true;
    }
    if (it->is_string()) {
        out = it->get<std::string>();
        return true;
    }
    return false;
}

json id_to_json(const std::optional<RequestId>& id) {
    if (!id) {
        return nullptr;
    }
    if (const auto* number = std::get_if<int64_t>(&*id)) {
        return *number;
    }
    return std::get<std::string>(*id);
}

json read_params(const json& root, const std::optional<RequestId>& id) {
    auto it = root.find("params");
    if (it == root.end() || it->is_null()) {
        return json::object();
    }
    if (!it->is_object() && !it->is_array()) {
        throw ProtocolError(error_code::kInvalidRequest, "Invalid Request: params must be an object or array", id);
    }
    return *it;
}

} // namespace

json to_json(const ErrorObject& error) {
    json value = {{"code", error.code}, {"message", error.message}};
    if (error.data) {
        value["data"] = *error.data;
    }
    return value;
}

ErrorObject error_from_json(const json& value) {
    ErrorObject error;
    if (!value.is_object()) {
        throw ProtocolError(error_code::kInvalidRequest, "Invalid Response: error must be an object");
    }
    auto code = value.find("code");
    auto message = value.find("message");
    if (code == value.end() || !code->is_number_integer() || message == value.end() || !message->is_string()) {
        throw ProtocolError(error_code::kInvalidRequest, "Invalid Response: error needs integer code and string message");
    }
    error.code = code->get<int>();
    error.message = message->get<std::string>();
    if (auto data = value.find("data"); data != value.end()) {
        error.data = *data;
    }
    return error;
}

Envelope decode(const std::string& line) {
    json root;
    try {
        root = json::parse(line);
    } catch (const json::parse_error& exc) {
        throw ProtocolError(error_code::kParseError, std::string("Parse error: ") + exc.what());
    }

    if (!root.is_object()) {
        throw ProtocolError(error_code::kInvalidRequest, "Invalid Request: frame is not a JSON object");
    }

    std::optional<RequestId> id;
    const bool id_valid = read_id(root, id);
    const bool has_id_key = root.contains("id");

    if (auto method = root.find("method"); method != root.end()) {
        if (!id_valid) {
            throw ProtocolError(error_code::kInvalidRequest, "Invalid Request: id must be an integer or string");
        }
        if (!method->is_string() || method->get_ref<const std::string&>().empty()) {
            throw ProtocolError(error_code::kInvalidRequest, "Invalid Request: method must be a non-empty string", id);
        }
        json params = read_params(root, id);
        if (has_id_key) {
            return Request{id, method->get<std::string>(), std::move(params)};
        }
        return Notification{method->get<std::string>(), std::move(params)};
    }

    const bool has_result = root.contains("result");
    const bool has_error = root.contains("error");
    if (id && id_valid && has_result != has_error) {
        Response response{*id, std::nullopt, std::nullopt};
        if (has_result) {
            response.result = root.at("result");
        } else {
            response.error = error_from_json(root.at("error"));
        }
        return response;
    }

    throw ProtocolError(error_code::kInvalidRequest, "Invalid Request: missing method", id_valid ? id : std::nullopt);
}

std::string encode(const Envelope& envelope) {
    json root = {{"jsonrpc", "2.0"}};

    if (const auto* request = std::get_if<Request>(&envelope)) {
        root["id"] = id_to_json(request->id);
        root["method"] = request->method;
        root["params"] = request->params;
    } else if (const auto* response = std::get_if<Response>(&envelope)) {
        root["id"] = id_to_json(response->id);
        if (response->error) {
            root["error"] = to_json(*response->error);
        } else {
            root["result"] = response->result ? *response->result : json(nullptr);
        }
    } else {
        const auto& notification = std::get<Notification>(envelope);
        root["method"] = notification.method;
        root["params"] = notification.params;
    }

    // Child log lines are relayed verbatim and may carry invalid UTF-8.
    return root.dump(-1, ' ', false, json::error_handler_t::replace);
}

const json* find_key(const json& object, const std::string& key) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    if (it == object.end()) {
        return nullptr;
    }
    return &*it;
}

std::string as_string(const json& value, const std::string& fallback) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return fallback;
}

int64_t as_int64(const json& value, int64_t fallback) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        double number = value.get<double>();
        if (std::isfinite(number) && std::fabs(number) <= kMaxSafeInteger &&
            number == std::floor(number)) {
            return static_cast<int64_t>(number);
        }
    }
    return fallback;
}

bool as_bool(const json& value, bool fallback) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    return fallback;
}

double as_double(const json& value, double fallback) {
    if (value.is_number()) {
        return value.get<double>();
    }
    return fallback;
}

std::string to_iso(std::chrono::system_clock::time_point time) {
    std::time_t tt = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

std::string now_iso() {
    return to_iso(std::chrono::system_clock::now());
}

} // namespace taskbridge::codec
