#include <gtest/gtest.h>

#include "backends/telemetry_service.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <thread>

#include <unistd.h>

using namespace taskbridge;
using namespace taskbridge::testing;
namespace fs = std::filesystem;

namespace {

// Fake procfs tree under a temporary directory.
class FakeProc {
public:
    FakeProc() {
        root_ = fs::temp_directory_path() / ("taskbridge-proc-" + std::to_string(::getpid()) + "-" +
                                             std::to_string(counter_++));
        fs::create_directories(root_ / "net");
        write("stat", "cpu  100 0 100 800 0 0 0 0\ncpu0 50 0 50 400 0 0 0 0\ncpu1 50 0 50 400 0 0 0 0\n"
                      "btime 86400\n");
        write("meminfo", "MemTotal:        1000 kB\nMemFree:          200 kB\nMemAvailable:     400 kB\n"
                         "SwapTotal:        100 kB\nSwapFree:          75 kB\n");
        write("net/dev", "Inter-|   Receive                                                |  Transmit\n"
                         " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets\n"
                         "    lo: 100 2 0 0 0 0 0 0 100 2 0 0 0 0 0 0\n"
                         "  eth0: 1000 10 0 0 0 0 0 0 500 5 0 0 0 0 0 0\n");
        write("cpuinfo", "processor\t: 0\nphysical id\t: 0\ncore id\t\t: 0\n\n"
                         "processor\t: 1\nphysical id\t: 0\ncore id\t\t: 0\n");
    }

    ~FakeProc() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream out(root_ / name, std::ios::trunc);
        out << content;
    }

    void remove(const std::string& name) { fs::remove(root_ / name); }

    void write_process(int pid, const std::string& comm, uint64_t utime, uint64_t stime, uint64_t start_ticks,
                       int64_t rss_pages) {
        fs::create_directories(root_ / std::to_string(pid));
        std::ostringstream stat;
        stat << pid << " (" << comm << ") S 1 " << pid << " " << pid << " 0 -1 4194560 100 0 0 0 " << utime << " "
             << stime << " 0 0 20 0 1 0 " << start_ticks << " 1000000 " << rss_pages << " 18446744073709551615\n";
        write(std::to_string(pid) + "/stat", stat.str());
    }

    std::string path() const { return root_.string(); }

private:
    static inline int counter_ = 0;
    fs::path root_;
};

} // namespace

TEST(TelemetrySampler, MemoryInfoIsReportedInBytes) {
    FakeProc proc;
    backends::TelemetrySampler sampler(proc.path(), proc.path() + "/sys");

    auto memory = sampler.memory_info();
    EXPECT_EQ(memory["total"], 1024000u);
    EXPECT_EQ(memory["available"], 409600u);
    EXPECT_EQ(memory["used"], 614400u);
    EXPECT_DOUBLE_EQ(memory["percent"].get<double>(), 60.0);
    EXPECT_EQ(memory["swap_used"], 25600u);
    EXPECT_DOUBLE_EQ(memory["swap_percent"].get<double>(), 25.0);
}

TEST(TelemetrySampler, NetworkCountersAreSummedOverInterfaces) {
    FakeProc proc;
    backends::TelemetrySampler sampler(proc.path(), proc.path() + "/sys");

    auto network = sampler.network_info();
    EXPECT_EQ(network["bytes_recv"], 1100u);
    EXPECT_EQ(network["packets_recv"], 12u);
    EXPECT_EQ(network["bytes_sent"], 600u);
    EXPECT_EQ(network["packets_sent"], 7u);
}

TEST(TelemetrySampler, CpuUsageComesFromDeltasBetweenReadings) {
    FakeProc proc;
    backends::TelemetrySampler sampler(proc.path(), proc.path() + "/sys");

    auto first = sampler.cpu_info(1ms);
    EXPECT_DOUBLE_EQ(first["percent"].get<double>(), 0.0);
    EXPECT_EQ(first["percent_per_core"].size(), 2u);
    EXPECT_TRUE(first["frequency"].is_null());

    // +100 busy and +100 idle on the aggregate line, cpu1 fully busy.
    proc.write("stat", "cpu  150 0 150 900 0 0 0 0\ncpu0 50 0 50 500 0 0 0 0\ncpu1 100 0 100 400 0 0 0 0\n");
    auto second = sampler.cpu_info();
    EXPECT_DOUBLE_EQ(second["percent"].get<double>(), 50.0);
    EXPECT_DOUBLE_EQ(second["percent_per_core"][0].get<double>(), 0.0);
    EXPECT_DOUBLE_EQ(second["percent_per_core"][1].get<double>(), 100.0);
}

TEST(TelemetrySampler, SystemInfoCountsPhysicalCores) {
    FakeProc proc;
    backends::TelemetrySampler sampler(proc.path(), proc.path() + "/sys");

    auto info = sampler.system_info();
    EXPECT_EQ(info["cpu_count"], 1u);
    EXPECT_EQ(info["boot_time"], "1970-01-02T00:00:00Z");
    EXPECT_FALSE(info["platform"].get<std::string>().empty());
}

TEST(TelemetrySampler, MissingSourceThrows) {
    FakeProc proc;
    proc.remove("meminfo");
    backends::TelemetrySampler sampler(proc.path(), proc.path() + "/sys");

    EXPECT_THROW(sampler.memory_info(), std::runtime_error);
}

TEST(TelemetrySampler, DiskInfoSkipsVirtualAndUnreachableMounts) {
    FakeProc proc;
    fs::create_directories(fs::path(proc.path()) / "self");
    proc.write("filesystems", "nodev\tproc\nnodev\ttmpfs\n\text4\n");
    proc.write("self/mounts", "proc /proc proc rw,nosuid 0 0\n"
                              "/dev/sda1 " + proc.path() + " ext4 rw,relatime 0 0\n"
                              "tmpfs /run tmpfs rw 0 0\n"
                              "/dev/sdb1 /nonexistent/taskbridge-mount ext4 rw 0 0\n");
    backends::TelemetrySampler sampler(proc.path(), proc.path() + "/sys");

    auto disks = sampler.disk_info();
    ASSERT_EQ(disks.size(), 1u);
    EXPECT_EQ(disks[0]["device"], "/dev/sda1");
    EXPECT_EQ(disks[0]["mountpoint"], proc.path());
    EXPECT_EQ(disks[0]["fstype"], "ext4");
    EXPECT_GT(disks[0]["total"].get<uint64_t>(), 0u);
    EXPECT_LE(disks[0]["used"].get<uint64_t>(), disks[0]["total"].get<uint64_t>());
    EXPECT_GE(disks[0]["percent"].get<double>(), 0.0);
    EXPECT_LE(disks[0]["percent"].get<double>(), 100.0);
}

TEST(TelemetrySampler, ProcessesAreRankedByCpuOrMemory) {
    FakeProc proc;
    const uint64_t hz = static_cast<uint64_t>(::sysconf(_SC_CLK_TCK));
    proc.write("uptime", "1000.00 3000.00\n");
    // 20 s of CPU over 1000 s alive, and 1 s over 500 s alive.
    proc.write_process(1, "init", 10 * hz, 10 * hz, 0, 10);
    proc.write_process(42, "my (server)", 1 * hz, 0, 500 * hz, 50);
    backends::TelemetrySampler sampler(proc.path(), proc.path() + "/sys");

    auto by_cpu = sampler.processes(backends::TelemetrySampler::ProcessOrder::Cpu, 10);
    ASSERT_EQ(by_cpu.size(), 2u);
    EXPECT_EQ(by_cpu[0]["pid"], 1);
    EXPECT_EQ(by_cpu[0]["name"], "init");
    EXPECT_DOUBLE_EQ(by_cpu[0]["cpu_percent"].get<double>(), 2.0);
    EXPECT_EQ(by_cpu[1]["pid"], 42);
    EXPECT_EQ(by_cpu[1]["name"], "my (server)");
    EXPECT_DOUBLE_EQ(by_cpu[1]["cpu_percent"].get<double>(), 0.2);

    auto by_memory = sampler.processes(backends::TelemetrySampler::ProcessOrder::Memory, 1);
    ASSERT_EQ(by_memory.size(), 1u);
    EXPECT_EQ(by_memory[0]["pid"], 42);
    EXPECT_GT(by_memory[0]["memory_percent"].get<double>(), 0.0);
}

TEST(TelemetryService, ProcessListParamsAreValidated) {
    FakeProc proc;
    proc.write("uptime", "100.00 100.00\n");
    proc.write_process(7, "worker", 0, 0, 0, 1);
    backends::TelemetrySampler sampler(proc.path(), proc.path() + "/sys");

    FrameRecorder recorder;
    Notifier notifier(recorder.writer());
    supervisor::PeriodicTask monitor("monitor", notifier);
    config::TelemetryConfig config;
    backends::TelemetryService service(monitor, notifier, sampler, config);
    rpc::Dispatcher dispatcher;
    backends::register_telemetry_methods(dispatcher, service);

    auto ok = dispatcher.handle_frame(R"({"id":1,"method":"getProcesses","params":{"sortBy":"memory","limit":5}})");
    const auto& listed = std::get<Response>(*ok);
    ASSERT_TRUE(listed.result.has_value());
    ASSERT_EQ((*listed.result)["data"].size(), 1u);
    EXPECT_EQ((*listed.result)["data"][0]["name"], "worker");

    auto bad_order = dispatcher.handle_frame(R"({"id":2,"method":"getProcesses","params":{"sortBy":"name"}})");
    ASSERT_TRUE(std::get<Response>(*bad_order).error.has_value());
    EXPECT_EQ(std::get<Response>(*bad_order).error->code, error_code::kInvalidParams);

    auto bad_limit = dispatcher.handle_frame(R"({"id":3,"method":"getProcesses","params":{"limit":0}})");
    ASSERT_TRUE(std::get<Response>(*bad_limit).error.has_value());
    EXPECT_EQ(std::get<Response>(*bad_limit).error->code, error_code::kInvalidParams);
}

TEST(TelemetryService, SnapshotFailureIsAnInternalError) {
    FakeProc proc;
    proc.remove("net/dev");
    backends::TelemetrySampler sampler(proc.path(), proc.path() + "/sys");

    FrameRecorder recorder;
    Notifier notifier(recorder.writer());
    supervisor::PeriodicTask monitor("monitor", notifier);
    config::TelemetryConfig config;
    backends::TelemetryService service(monitor, notifier, sampler, config);
    rpc::Dispatcher dispatcher;
    backends::register_telemetry_methods(dispatcher, service);

    auto reply = dispatcher.handle_frame(R"({"id":1,"method":"getNetworkInfo"})");
    const auto& response = std::get<Response>(*reply);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, error_code::kInternalError);

    auto memory = dispatcher.handle_frame(R"({"id":2,"method":"getMemoryInfo"})");
    EXPECT_EQ((*std::get<Response>(*memory).result)["data"]["total"], 1024000u);
}

TEST(TelemetryService, MonitorStreamsSamplesUntilStopped) {
    FakeProc proc;
    backends::TelemetrySampler sampler(proc.path(), proc.path() + "/sys");

    FrameRecorder recorder;
    Notifier notifier(recorder.writer());
    supervisor::PeriodicTask monitor("monitor", notifier);
    config::TelemetryConfig config;
    config.sample_period = 10ms;
    backends::TelemetryService service(monitor, notifier, sampler, config);
    rpc::Dispatcher dispatcher;
    backends::register_telemetry_methods(dispatcher, service);

    auto started = dispatcher.handle_frame(R"({"id":1,"method":"startMonitor"})");
    EXPECT_EQ(*std::get<Response>(*started).result, (json{{"success", true}}));
    EXPECT_EQ(recorder.notifications("monitor_started").size(), 1u);

    auto again = dispatcher.handle_frame(R"({"id":2,"method":"startMonitor"})");
    EXPECT_EQ(*std::get<Response>(*again).result,
              (json{{"success", false}, {"error", "Monitor already running"}}));

    ASSERT_TRUE(recorder.wait_for([](const FrameRecorder& r) { return r.notifications("monitor_data").size() >= 2; }));
    auto sample = recorder.notifications("monitor_data").front().params["data"];
    EXPECT_TRUE(sample.contains("cpu"));
    EXPECT_TRUE(sample.contains("memory"));
    EXPECT_TRUE(sample.contains("network"));
    EXPECT_TRUE(sample["timestamp"].is_string());

    auto stopped = dispatcher.handle_frame(R"({"id":3,"method":"stopMonitor"})");
    EXPECT_EQ(*std::get<Response>(*stopped).result, (json{{"success", true}}));
    EXPECT_EQ(recorder.notifications("monitor_stopped").size(), 1u);

    auto samples_at_stop = recorder.notifications("monitor_data").size();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(recorder.notifications("monitor_data").size(), samples_at_stop);

    auto stopped_again = dispatcher.handle_frame(R"({"id":4,"method":"stopMonitor"})");
    EXPECT_EQ(*std::get<Response>(*stopped_again).result,
              (json{{"success", false}, {"error", "Monitor not running"}}));
}

TEST(TelemetryService, SamplingFailureInsideMonitorFailsTheTask) {
    FakeProc proc;
    backends::TelemetrySampler sampler(proc.path(), proc.path() + "/sys");

    FrameRecorder recorder;
    Notifier notifier(recorder.writer());
    supervisor::PeriodicTask monitor("monitor", notifier);
    config::TelemetryConfig config;
    config.sample_period = 10ms;
    backends::TelemetryService service(monitor, notifier, sampler, config);

    proc.remove("meminfo");
    service.start_monitor();

    ASSERT_TRUE(recorder.wait_for([](const FrameRecorder& r) { return !r.notifications("error").empty(); }));
    ASSERT_TRUE(recorder.wait_for(
        [&monitor](const FrameRecorder&) { return monitor.state() == supervisor::TaskState::Failed; }));
    EXPECT_TRUE(recorder.notifications("monitor_data").empty());
}
