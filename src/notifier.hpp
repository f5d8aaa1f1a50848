#pragma once

#include "line_transport.hpp"
#include "protocol.hpp"

#include <optional>
#include <string>
#include <vector>

namespace taskbridge {

namespace method {
constexpr const char* kReady = "$ready";
constexpr const char* kEvent = "$event";
constexpr const char* kError = "error";
constexpr const char* kExit = "exit";
} // namespace method

/// Builds the outgoing notifications every backend shares.
class Notifier {
public:
    explicit Notifier(transport::FrameWriter& writer) : writer_(writer) {}

    void notify(const std::string& method, json params = json::object());

    /// $event {event, data}
    void emit(const std::string& event, json data = nullptr);

    /// $event {event:"log", data:{level, message}}
    void log(const std::string& level, const std::string& message);

    void error(const std::string& message, std::optional<int> code = std::nullopt);
    void ready(const std::string& version, const std::vector<std::string>& methods);

    transport::FrameWriter& writer() { return writer_; }

private:
    transport::FrameWriter& writer_;
};

} // namespace taskbridge
