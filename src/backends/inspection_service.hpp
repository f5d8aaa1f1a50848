#pragma once

#include "../config.hpp"
#include "../notifier.hpp"
#include "../rpc/dispatcher.hpp"
#include "../supervisor/process_job.hpp"

namespace taskbridge::backends {

/**
 * Keeps the inspection server alive through a ProcessJob and answers
 * queries about it. Every readiness verdict is announced as a
 * "serverReady" event.
 */
class InspectionService {
public:
    InspectionService(supervisor::ProcessJob& job, Notifier& notifier);

    /// Kicks off the first start; the verdict arrives asynchronously.
    void launch();

    json server_url() const;
    json server_status(bool reprobe);
    json restart();
    json shutdown();

private:
    void announce(bool ready);

    supervisor::ProcessJob& job_;
    Notifier& notifier_;
    std::string url_;
};

void register_inspection_methods(rpc::Dispatcher& dispatcher, InspectionService& service);

} // namespace taskbridge::backends
