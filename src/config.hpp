#pragma once

#include "supervisor/process_job.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace taskbridge::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct LoggingConfig {
    std::string config_path = "log4cplus.ini";
};

struct HostConfig {
    int signal_exit_code = 0;
};

struct CountdownConfig {
    int64_t default_duration_s = 25 * 60;
    std::chrono::milliseconds tick_period{1000};
    std::chrono::milliseconds stop_grace{2000};
};

struct TelemetryConfig {
    std::chrono::milliseconds sample_period{1000};
    std::chrono::milliseconds stop_grace{2000};
};

struct InspectionConfig {
    std::vector<std::string> command; // program followed by its arguments
    std::string working_dir;
    std::map<std::string, std::string> env;
    bool inherit_env = true;
    std::string host = "127.0.0.1";
    int port = 20242;
    std::string readiness_path = "/api/info";
    std::string shutdown_path = "/shutdown";
    std::chrono::milliseconds probe_interval{500};
    std::chrono::milliseconds probe_timeout{30000};
    std::chrono::milliseconds probe_attempt_timeout{2000};
    std::chrono::milliseconds stop_grace{5000};

    supervisor::ProcessJobOptions to_job_options() const;
};

struct BackendConfig {
    std::string config_file_path; // empty when running on defaults
    LoggingConfig logging;
    HostConfig host;
    CountdownConfig countdown;
    TelemetryConfig telemetry;
    InspectionConfig inspection;
};

/// Reads a YAML file. Throws ConfigError on I/O, syntax or validation errors.
BackendConfig load_config(const std::string& path);

/// Same as load_config for an in-memory document.
BackendConfig parse_config(const std::string& yaml_text);

} // namespace taskbridge::config
