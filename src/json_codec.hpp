#pragma once

#include "protocol.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace taskbridge::codec {

/**
 * Raised by decode() when a frame is not valid JSON or has no recognizable
 * envelope shape. When the frame carried a usable id it is kept so the
 * caller can answer with a correlated error response.
 */
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message, std::optional<RequestId> id = std::nullopt)
        : std::runtime_error(message), code_(code), id_(std::move(id)) {}

    int code() const { return code_; }
    const std::optional<RequestId>& id() const { return id_; }

private:
    int code_;
    std::optional<RequestId> id_;
};

Envelope decode(const std::string& line);
std::string encode(const Envelope& envelope);

json to_json(const ErrorObject& error);
ErrorObject error_from_json(const json& value);

// Tolerant accessors for handler params
const json* find_key(const json& object, const std::string& key);
std::string as_string(const json& value, const std::string& fallback = "");
int64_t as_int64(const json& value, int64_t fallback = 0);
bool as_bool(const json& value, bool fallback = false);
double as_double(const json& value, double fallback = 0.0);

/// Current UTC time as YYYY-MM-DDTHH:MM:SSZ.
std::string now_iso();
std::string to_iso(std::chrono::system_clock::time_point time);

} // namespace taskbridge::codec
