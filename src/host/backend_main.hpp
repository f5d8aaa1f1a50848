#pragma once

#include "host_loop.hpp"

#include "../config.hpp"

#include <functional>
#include <stdexcept>
#include <string>

namespace taskbridge::host {

/// Raised by a backend's setup when it cannot serve at all.
class FatalStartupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct BackendDefinition {
    std::string name;    // logged and printed by --version
    std::string version; // announced in $ready

    /// Registers methods and creates tasks. Runs before $ready.
    std::function<void(HostLoop&, const config::BackendConfig&)> setup;

    /// Runs right after $ready, e.g. to kick off startup work.
    std::function<void(HostLoop&)> started;
};

/**
 * Shared entry point of every backend executable: parses the command line,
 * configures logging, loads the YAML configuration, announces readiness and
 * runs the host loop until end of input or a termination signal.
 */
int run_backend(int argc, char** argv, const BackendDefinition& definition);

} // namespace taskbridge::host
