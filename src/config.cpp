#include "config.hpp"

#include <filesystem>

namespace taskbridge::config {

namespace fs = std::filesystem;

namespace {

std::chrono::milliseconds read_millis(const YAML::Node& section, const std::string& section_name,
                                      const std::string& key, std::chrono::milliseconds fallback) {
    const YAML::Node node = section[key];
    if (!node) {
        return fallback;
    }
    int64_t value = node.as<int64_t>();
    if (value <= 0) {
        throw ConfigError(section_name + "." + key + " must be > 0");
    }
    return std::chrono::milliseconds(value);
}

template <typename T>
T read_value(const YAML::Node& section, const std::string& key, const T& fallback) {
    const YAML::Node node = section[key];
    if (!node) {
        return fallback;
    }
    return node.as<T>();
}

void parse_logging(const YAML::Node& node, LoggingConfig& out) {
    out.config_path = read_value<std::string>(node, "config", out.config_path);
}

void parse_host(const YAML::Node& node, HostConfig& out) {
    out.signal_exit_code = read_value<int>(node, "signal_exit_code", out.signal_exit_code);
    if (out.signal_exit_code < 0 || out.signal_exit_code > 255) {
        throw ConfigError("host.signal_exit_code must be within 0..255");
    }
}

void parse_countdown(const YAML::Node& node, CountdownConfig& out) {
    out.default_duration_s = read_value<int64_t>(node, "default_duration_s", out.default_duration_s);
    if (out.default_duration_s <= 0) {
        throw ConfigError("countdown.default_duration_s must be > 0");
    }
    out.tick_period = read_millis(node, "countdown", "tick_period_ms", out.tick_period);
    out.stop_grace = read_millis(node, "countdown", "stop_grace_ms", out.stop_grace);
}

void parse_telemetry(const YAML::Node& node, TelemetryConfig& out) {
    out.sample_period = read_millis(node, "telemetry", "sample_period_ms", out.sample_period);
    out.stop_grace = read_millis(node, "telemetry", "stop_grace_ms", out.stop_grace);
}

void parse_inspection(const YAML::Node& node, InspectionConfig& out) {
    if (const YAML::Node command = node["command"]) {
        if (!command.IsSequence() || command.size() == 0) {
            throw ConfigError("inspection.command must be a non-empty list");
        }
        out.command.clear();
        for (const auto& item : command) {
            out.command.push_back(item.as<std::string>());
        }
    }
    if (const YAML::Node env = node["env"]) {
        if (!env.IsMap()) {
            throw ConfigError("inspection.env must be a map");
        }
        for (const auto& entry : env) {
            out.env[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
    out.working_dir = read_value<std::string>(node, "working_dir", out.working_dir);
    out.inherit_env = read_value<bool>(node, "inherit_env", out.inherit_env);
    out.host = read_value<std::string>(node, "host", out.host);
    out.port = read_value<int>(node, "port", out.port);
    if (out.port <= 0 || out.port > 65535) {
        throw ConfigError("inspection.port must be within 1..65535");
    }
    out.readiness_path = read_value<std::string>(node, "readiness_path", out.readiness_path);
    out.shutdown_path = read_value<std::string>(node, "shutdown_path", out.shutdown_path);
    out.probe_interval = read_millis(node, "inspection", "probe_interval_ms", out.probe_interval);
    out.probe_timeout = read_millis(node, "inspection", "probe_timeout_ms", out.probe_timeout);
    out.probe_attempt_timeout = read_millis(node, "inspection", "probe_attempt_timeout_ms", out.probe_attempt_timeout);
    out.stop_grace = read_millis(node, "inspection", "stop_grace_ms", out.stop_grace);
}

BackendConfig parse_root(const YAML::Node& root) {
    BackendConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("configuration root must be a map");
    }

    try {
        if (root["logging"]) parse_logging(root["logging"], config.logging);
        if (root["host"]) parse_host(root["host"], config.host);
        if (root["countdown"]) parse_countdown(root["countdown"], config.countdown);
        if (root["telemetry"]) parse_telemetry(root["telemetry"], config.telemetry);
        if (root["inspection"]) parse_inspection(root["inspection"], config.inspection);
    } catch (const YAML::Exception& exc) {
        throw ConfigError(std::string("invalid configuration value: ") + exc.what());
    }
    return config;
}

} // namespace

supervisor::ProcessJobOptions InspectionConfig::to_job_options() const {
    supervisor::ProcessJobOptions options;
    if (!command.empty()) {
        options.spawn.program = command.front();
        options.spawn.args.assign(command.begin() + 1, command.end());
    }
    options.spawn.working_dir = working_dir;
    options.spawn.env = env;
    options.spawn.inherit_env = inherit_env;
    options.endpoint.host = host;
    options.endpoint.port = port;
    options.endpoint.http_path = readiness_path;
    options.probe.interval = probe_interval;
    options.probe.timeout = probe_timeout;
    options.probe.attempt_timeout = probe_attempt_timeout;
    options.shutdown_path = shutdown_path;
    options.stop_grace = stop_grace;
    return options;
}

BackendConfig load_config(const std::string& path) {
    if (!fs::exists(path)) {
        throw ConfigError("config file not found: " + path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& exc) {
        throw ConfigError("failed to parse " + path + ": " + exc.what());
    }

    BackendConfig config = parse_root(root);
    config.config_file_path = fs::absolute(path).string();

    // Relative paths in the file are relative to the file itself.
    fs::path base = fs::path(config.config_file_path).parent_path();
    if (!config.inspection.working_dir.empty() && fs::path(config.inspection.working_dir).is_relative()) {
        config.inspection.working_dir = (base / config.inspection.working_dir).lexically_normal().string();
    }
    if (fs::path(config.logging.config_path).is_relative() && fs::exists(base / config.logging.config_path)) {
        config.logging.config_path = (base / config.logging.config_path).string();
    }
    return config;
}

BackendConfig parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& exc) {
        throw ConfigError(std::string("failed to parse configuration: ") + exc.what());
    }
    return parse_root(root);
}

} // namespace taskbridge::config
