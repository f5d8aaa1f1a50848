#include "notifier.hpp"

namespace taskbridge {

void Notifier::notify(const std::string& method, json params) {
    writer_.write(Notification{method, std::move(params)});
}

void Notifier::emit(const std::string& event, json data) {
    notify(method::kEvent, json{{"event", event}, {"data", std::move(data)}});
}

void Notifier::log(const std::string& level, const std::string& message) {
    emit("log", json{{"level", level}, {"message", message}});
}

void Notifier::error(const std::string& message, std::optional<int> code) {
    json params = {{"message", message}};
    if (code) {
        params["code"] = *code;
    }
    notify(method::kError, std::move(params));
}

void Notifier::ready(const std::string& version, const std::vector<std::string>& methods) {
    notify(method::kReady, json{{"version", version}, {"methods", methods}});
}

} // namespace taskbridge
