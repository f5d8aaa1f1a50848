#pragma once

#include "../protocol.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskbridge::backends {

/**
 * Reads host metrics from procfs/sysfs. Every method throws
 * std::runtime_error when a source file is missing or malformed.
 */
class TelemetrySampler {
public:
    explicit TelemetrySampler(std::string proc_root = "/proc", std::string sys_root = "/sys");

    json system_info() const;

    /// Overall and per-core busy percentage since the previous call. The first
    /// call takes two readings `first_interval` apart.
    json cpu_info(std::chrono::milliseconds first_interval = std::chrono::milliseconds(100));

    json memory_info() const;
    json network_info() const;

    /// Usage of every mounted block-device filesystem listed in self/mounts.
    /// Mount points that cannot be stat'ed are skipped.
    json disk_info() const;

    enum class ProcessOrder {
        Cpu,
        Memory,
    };

    /// Top `limit` processes by average CPU share since process start, or by
    /// resident memory share.
    json processes(ProcessOrder order, size_t limit) const;

private:
    struct CpuTimes {
        uint64_t busy = 0;
        uint64_t total = 0;
    };

    std::vector<CpuTimes> read_cpu_times() const; // index 0 is the aggregate line
    json cpu_frequency() const;

    std::string proc_root_;
    std::string sys_root_;

    std::mutex cpu_mutex_;
    std::optional<std::vector<CpuTimes>> previous_cpu_;
};

} // namespace taskbridge::backends
