#include "host_loop.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cstdint>

namespace taskbridge::host {

HostLoop::HostLoop(std::istream& in, transport::FrameWriter& writer)
    : in_(in), writer_(writer), notifier_(writer) {}

HostLoop::~HostLoop() {
    teardown();
}

void HostLoop::add_teardown(std::function<void()> step) {
    teardown_steps_.push_back(std::move(step));
}

int HostLoop::run() {
    std::string line;
    uint64_t frames = 0;

    while (true) {
        auto status = transport::read_frame(in_, line);
        if (status == transport::FrameStatus::Eof) {
            break;
        }
        if (status == transport::FrameStatus::TooLong) {
            LOG4CPLUS_ERROR(core_logger(), "Dropping frame larger than " << transport::kMaxFrameBytes << " bytes");
            notifier_.error("Frame exceeds " + std::to_string(transport::kMaxFrameBytes) + " bytes",
                            error_code::kInvalidRequest);
            continue;
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        ++frames;
        if (auto reply = dispatcher_.handle_frame(line)) {
            writer_.write(*reply);
        }
    }

    LOG4CPLUS_INFO(core_logger(), "EOF on stdin after " << frames << " frames; exiting cleanly");
    teardown();
    return 0;
}

void HostLoop::teardown() {
    std::call_once(teardown_once_, [this] {
        LOG4CPLUS_INFO(core_logger(), "Teardown started");
        for (auto& step : teardown_steps_) {
            try {
                step();
            } catch (const std::exception& exc) {
                LOG4CPLUS_ERROR(core_logger(), "Teardown step failed: " << exc.what());
            }
        }
        tasks_.stop_all();
        torn_down_ = true;
        LOG4CPLUS_INFO(core_logger(), "Teardown finished");
    });
}

} // namespace taskbridge::host
