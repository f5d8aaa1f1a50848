#include "backend_main.hpp"

#include "signal_watcher.hpp"

#include "../logger.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

#ifndef TASKBRIDGE_VERSION_STRING
#define TASKBRIDGE_VERSION_STRING "0.0.0"
#endif
#ifndef TASKBRIDGE_GIT_VERSION_STRING
#define TASKBRIDGE_GIT_VERSION_STRING "unknown"
#endif
#ifndef TASKBRIDGE_BUILD_TIMESTAMP
#define TASKBRIDGE_BUILD_TIMESTAMP "unknown"
#endif

namespace taskbridge::host {

namespace {

struct CommandLine {
    bool show_version = false;
    bool enable_pdeathsig = false;
    std::string config_path;
    std::optional<std::string> log_config_path;
};

CommandLine parse_command_line(int argc, char** argv) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            cmd.show_version = true;
            continue;
        }

        if (strcmp(argv[i], "--pdeathsig") == 0) {
            cmd.enable_pdeathsig = true;
            continue;
        }

        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            cmd.config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--config=", 9) == 0) {
            cmd.config_path = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--log-config") == 0 && i + 1 < argc) {
            cmd.log_config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--log-config=", 13) == 0) {
            cmd.log_config_path = std::string(argv[i] + 13);
            continue;
        }

        std::cerr << "Ignoring unknown argument: " << argv[i] << std::endl;
    }
    return cmd;
}

} // namespace

int run_backend(int argc, char** argv, const BackendDefinition& definition) {
    // Blocked before any thread exists, logging included, so every thread inherits the mask.
    SignalWatcher::block_termination_signals();

    log4cplus::Initializer log_initializer;

    CommandLine cmd = parse_command_line(argc, argv);
    if (cmd.show_version) {
        // stdout is the protocol channel only once the loop runs.
        std::cout << definition.name << " " << definition.version << std::endl;
        std::cout << "Version: " << TASKBRIDGE_VERSION_STRING << std::endl;
        std::cout << "Commit: " << TASKBRIDGE_GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << TASKBRIDGE_BUILD_TIMESTAMP << std::endl;
        return 0;
    }

#ifdef __linux__
    if (cmd.enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    transport::FrameWriter writer(std::cout);

    config::BackendConfig backend_config;
    std::optional<std::string> config_error;
    if (!cmd.config_path.empty()) {
        try {
            backend_config = config::load_config(cmd.config_path);
        } catch (const config::ConfigError& exc) {
            config_error = exc.what();
        }
    }

    init_logging(cmd.log_config_path.value_or(backend_config.logging.config_path));

    LOG4CPLUS_INFO(core_logger(), definition.name << " starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << TASKBRIDGE_VERSION_STRING << ", Commit: "
                                              << TASKBRIDGE_GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << TASKBRIDGE_BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Config: " << (backend_config.config_file_path.empty()
                                                     ? std::string("<defaults>")
                                                     : backend_config.config_file_path));
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (cmd.enable_pdeathsig ? "enabled" : "disabled"));

    if (config_error) {
        LOG4CPLUS_FATAL(core_logger(), "Configuration error: " << *config_error);
        Notifier(writer).error("Configuration error: " + *config_error, error_code::kFatalStartup);
        return 1;
    }

    auto loop = std::make_unique<HostLoop>(std::cin, writer);

    try {
        definition.setup(*loop, backend_config);
    } catch (const std::exception& exc) {
        LOG4CPLUS_FATAL(core_logger(), "Startup failed: " << exc.what());
        loop->teardown();
        loop->notifier().error(std::string("Startup failed: ") + exc.what(), error_code::kFatalStartup);
        return 1;
    }

    const int signal_exit_code = backend_config.host.signal_exit_code;
    HostLoop* loop_ptr = loop.get();
    SignalWatcher signals([loop_ptr, signal_exit_code](int signo) {
        LOG4CPLUS_INFO(core_logger(), "Received signal " << signo << ", shutting down");
        loop_ptr->teardown();
        loop_ptr->notifier().notify(method::kExit, json{{"message", std::string("Terminated by signal ") +
                                                                         std::to_string(signo)}});
        // The main thread is blocked reading stdin; leave without unwinding it.
        std::_Exit(signal_exit_code);
    });

    loop->notifier().ready(definition.version, loop->dispatcher().methods());

    int exit_code = 0;
    try {
        if (definition.started) {
            definition.started(*loop);
        }
        exit_code = loop->run();
    } catch (const std::exception& exc) {
        LOG4CPLUS_FATAL(core_logger(), "Unhandled error: " << exc.what());
        loop->teardown();
        loop->notifier().error(std::string("Fatal error: ") + exc.what(), error_code::kInternalError);
        exit_code = 1;
    }

    LOG4CPLUS_INFO(core_logger(), definition.name << " exiting with code " << exit_code);
    return exit_code;
}

} // namespace taskbridge::host
