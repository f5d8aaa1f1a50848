#include "telemetry_sampler.hpp"

#include "../json_codec.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <dirent.h>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace taskbridge::backends {

namespace {

std::ifstream open_source(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot read " + path);
    }
    return in;
}

double percent(uint64_t part, uint64_t whole) {
    if (whole == 0) {
        return 0.0;
    }
    return std::round(1000.0 * static_cast<double>(part) / static_cast<double>(whole)) / 10.0;
}

// "MemTotal:  16316412 kB" -> bytes
std::map<std::string, uint64_t> read_meminfo(const std::string& path) {
    auto in = open_source(path);
    std::map<std::string, uint64_t> values;
    std::string line;
    while (std::getline(in, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::istringstream fields(line.substr(colon + 1));
        uint64_t value = 0;
        std::string unit;
        if (!(fields >> value)) {
            continue;
        }
        fields >> unit;
        values[line.substr(0, colon)] = unit == "kB" ? value * 1024 : value;
    }
    return values;
}

uint64_t require(const std::map<std::string, uint64_t>& values, const std::string& key, const std::string& path) {
    auto it = values.find(key);
    if (it == values.end()) {
        throw std::runtime_error(path + ": missing " + key);
    }
    return it->second;
}

// /proc/self/mounts escapes blanks in paths as octal, e.g. "\040".
std::string unescape_mount_field(const std::string& field) {
    std::string result;
    result.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const std::string digits = field.substr(i + 1, 3);
            if (digits.find_first_not_of("01234567") == std::string::npos) {
                result.push_back(static_cast<char>(std::stoi(digits, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        result.push_back(field[i]);
    }
    return result;
}

// Filesystem types flagged "nodev" in /proc/filesystems (proc, tmpfs, cgroup, ...).
std::set<std::string> read_virtual_filesystems(const std::string& path) {
    std::set<std::string> result;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string flag;
        std::string type;
        if (fields >> flag >> type && flag == "nodev") {
            result.insert(type);
        }
    }
    return result;
}

struct ProcessSample {
    int64_t pid = 0;
    std::string name;
    double cpu_percent = 0.0;
    double memory_percent = 0.0;
};

// Parses <proc>/<pid>/stat; comm may contain blanks and parentheses.
std::optional<ProcessSample> read_process(const std::string& path, int64_t pid, double uptime_s, double ticks_per_s,
                                          double page_size, double mem_total) {
    std::ifstream in(path);
    std::string line;
    if (!in || !std::getline(in, line)) {
        return std::nullopt;
    }
    auto open = line.find('(');
    auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    // Fields from "state" (field 3) onwards.
    std::istringstream fields(line.substr(close + 1));
    std::vector<std::string> rest;
    std::string field;
    while (fields >> field) {
        rest.push_back(field);
    }
    constexpr size_t kUtime = 11;
    constexpr size_t kStime = 12;
    constexpr size_t kStartTime = 19;
    constexpr size_t kRss = 21;
    if (rest.size() <= kRss) {
        return std::nullopt;
    }

    ProcessSample sample;
    sample.pid = pid;
    sample.name = line.substr(open + 1, close - open - 1);
    try {
        double cpu_s = static_cast<double>(std::stoull(rest[kUtime]) + std::stoull(rest[kStime])) / ticks_per_s;
        double alive_s = uptime_s - static_cast<double>(std::stoull(rest[kStartTime])) / ticks_per_s;
        double rss_bytes = static_cast<double>(std::stoll(rest[kRss])) * page_size;
        if (alive_s > 0) {
            sample.cpu_percent = std::round(1000.0 * cpu_s / alive_s) / 10.0;
        }
        if (mem_total > 0 && rss_bytes > 0) {
            sample.memory_percent = std::round(1000.0 * rss_bytes / mem_total) / 10.0;
        }
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    return sample;
}

} // namespace

TelemetrySampler::TelemetrySampler(std::string proc_root, std::string sys_root)
    : proc_root_(std::move(proc_root)), sys_root_(std::move(sys_root)) {}

json TelemetrySampler::system_info() const {
    struct utsname uts {};
    if (uname(&uts) != 0) {
        throw std::runtime_error("uname failed");
    }

    long logical = sysconf(_SC_NPROCESSORS_ONLN);

    // Physical cores are distinct (physical id, core id) pairs.
    std::set<std::pair<std::string, std::string>> cores;
    {
        std::ifstream cpuinfo(proc_root_ + "/cpuinfo");
        std::string line;
        std::string physical_id = "0";
        while (std::getline(cpuinfo, line)) {
            auto colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string key = line.substr(0, line.find_last_not_of(" \t", colon - 1) + 1);
            std::string value = colon + 2 <= line.size() ? line.substr(colon + 2) : std::string();
            if (key == "physical id") {
                physical_id = value;
            } else if (key == "core id") {
                cores.emplace(physical_id, value);
            }
        }
    }

    json boot_time = nullptr;
    {
        auto stat = open_source(proc_root_ + "/stat");
        std::string label;
        std::string line;
        while (std::getline(stat, line)) {
            std::istringstream fields(line);
            int64_t seconds = 0;
            if (fields >> label && label == "btime" && fields >> seconds) {
                boot_time = codec::to_iso(std::chrono::system_clock::time_point(std::chrono::seconds(seconds)));
                break;
            }
        }
    }

    return json{
        {"platform", uts.sysname},
        {"platform_release", uts.release},
        {"platform_version", uts.version},
        {"architecture", uts.machine},
        {"hostname", uts.nodename},
        {"cpu_count", cores.empty() ? json(logical) : json(cores.size())},
        {"cpu_count_logical", logical},
        {"boot_time", boot_time},
    };
}

std::vector<TelemetrySampler::CpuTimes> TelemetrySampler::read_cpu_times() const {
    const std::string path = proc_root_ + "/stat";
    auto in = open_source(path);

    std::vector<CpuTimes> result;
    std::string line;
    while (std::getline(in, line)) {
        if (line.compare(0, 3, "cpu") != 0) {
            continue;
        }
        std::istringstream fields(line);
        std::string label;
        fields >> label;

        // user nice system idle iowait irq softirq steal
        uint64_t values[8] = {0};
        int count = 0;
        while (count < 8 && fields >> values[count]) {
            ++count;
        }
        if (count < 4) {
            throw std::runtime_error(path + ": malformed line for " + label);
        }

        CpuTimes times;
        for (int i = 0; i < count; ++i) {
            times.total += values[i];
        }
        uint64_t idle = values[3] + (count > 4 ? values[4] : 0);
        times.busy = times.total - idle;
        result.push_back(times);
    }

    if (result.empty()) {
        throw std::runtime_error(path + ": no cpu lines");
    }
    return result;
}

json TelemetrySampler::cpu_frequency() const {
    const std::string base = sys_root_ + "/devices/system/cpu/cpu0/cpufreq/";
    auto read_khz = [&](const std::string& file) -> std::optional<double> {
        std::ifstream in(base + file);
        double khz = 0;
        if (!(in >> khz)) {
            return std::nullopt;
        }
        return khz / 1000.0;
    };

    auto current = read_khz("scaling_cur_freq");
    if (!current) {
        return nullptr;
    }
    return json{
        {"current", *current},
        {"min", read_khz("cpuinfo_min_freq").value_or(0.0)},
        {"max", read_khz("cpuinfo_max_freq").value_or(0.0)},
    };
}

json TelemetrySampler::cpu_info(std::chrono::milliseconds first_interval) {
    std::lock_guard<std::mutex> lock(cpu_mutex_);

    if (!previous_cpu_) {
        previous_cpu_ = read_cpu_times();
        std::this_thread::sleep_for(first_interval);
    }
    auto current = read_cpu_times();
    const auto& previous = *previous_cpu_;

    auto usage = [&](size_t index) {
        if (index >= previous.size()) {
            return 0.0;
        }
        uint64_t total = current[index].total >= previous[index].total ? current[index].total - previous[index].total : 0;
        uint64_t busy = current[index].busy >= previous[index].busy ? current[index].busy - previous[index].busy : 0;
        return percent(busy, total);
    };

    json per_core = json::array();
    for (size_t i = 1; i < current.size(); ++i) {
        per_core.push_back(usage(i));
    }

    json result{
        {"percent", usage(0)},
        {"percent_per_core", per_core},
        {"frequency", cpu_frequency()},
    };
    previous_cpu_ = std::move(current);
    return result;
}

json TelemetrySampler::memory_info() const {
    const std::string path = proc_root_ + "/meminfo";
    auto values = read_meminfo(path);

    uint64_t total = require(values, "MemTotal", path);
    uint64_t available = values.count("MemAvailable") ? values["MemAvailable"] : require(values, "MemFree", path);
    uint64_t used = total >= available ? total - available : 0;
    uint64_t swap_total = values.count("SwapTotal") ? values["SwapTotal"] : 0;
    uint64_t swap_free = values.count("SwapFree") ? values["SwapFree"] : 0;
    uint64_t swap_used = swap_total >= swap_free ? swap_total - swap_free : 0;

    return json{
        {"total", total},
        {"available", available},
        {"used", used},
        {"percent", percent(used, total)},
        {"swap_total", swap_total},
        {"swap_used", swap_used},
        {"swap_percent", percent(swap_used, swap_total)},
    };
}

json TelemetrySampler::network_info() const {
    const std::string path = proc_root_ + "/net/dev";
    auto in = open_source(path);

    uint64_t bytes_recv = 0;
    uint64_t packets_recv = 0;
    uint64_t bytes_sent = 0;
    uint64_t packets_sent = 0;

    std::string line;
    while (std::getline(in, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue; // header lines
        }
        std::istringstream fields(line.substr(colon + 1));
        // rx: bytes packets errs drop fifo frame compressed multicast, then tx: bytes packets ...
        uint64_t v[10] = {0};
        int count = 0;
        while (count < 10 && fields >> v[count]) {
            ++count;
        }
        if (count < 10) {
            throw std::runtime_error(path + ": malformed interface line");
        }
        bytes_recv += v[0];
        packets_recv += v[1];
        bytes_sent += v[8];
        packets_sent += v[9];
    }

    return json{
        {"bytes_sent", bytes_sent},
        {"bytes_recv", bytes_recv},
        {"packets_sent", packets_sent},
        {"packets_recv", packets_recv},
    };
}

json TelemetrySampler::disk_info() const {
    const std::string path = proc_root_ + "/self/mounts";
    auto in = open_source(path);
    const auto virtual_types = read_virtual_filesystems(proc_root_ + "/filesystems");

    json disks = json::array();
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string device;
        std::string mountpoint;
        std::string fstype;
        if (!(fields >> device >> mountpoint >> fstype)) {
            continue;
        }
        if (virtual_types.count(fstype) || device.empty() || device == "none") {
            continue;
        }
        mountpoint = unescape_mount_field(mountpoint);

        struct statvfs fs {};
        if (::statvfs(mountpoint.c_str(), &fs) != 0) {
            continue;
        }
        uint64_t total = static_cast<uint64_t>(fs.f_blocks) * fs.f_frsize;
        uint64_t used = static_cast<uint64_t>(fs.f_blocks - fs.f_bfree) * fs.f_frsize;
        uint64_t free = static_cast<uint64_t>(fs.f_bavail) * fs.f_frsize;

        disks.push_back(json{
            {"device", unescape_mount_field(device)},
            {"mountpoint", mountpoint},
            {"fstype", fstype},
            {"total", total},
            {"used", used},
            {"free", free},
            {"percent", percent(used, used + free)},
        });
    }
    return disks;
}

json TelemetrySampler::processes(ProcessOrder order, size_t limit) const {
    double uptime_s = 0;
    {
        auto uptime = open_source(proc_root_ + "/uptime");
        if (!(uptime >> uptime_s)) {
            throw std::runtime_error(proc_root_ + "/uptime: malformed");
        }
    }
    const std::string meminfo = proc_root_ + "/meminfo";
    const double mem_total = static_cast<double>(require(read_meminfo(meminfo), "MemTotal", meminfo));
    const double ticks_per_s = static_cast<double>(::sysconf(_SC_CLK_TCK));
    const double page_size = static_cast<double>(::sysconf(_SC_PAGESIZE));

    DIR* dir = ::opendir(proc_root_.c_str());
    if (!dir) {
        throw std::runtime_error("cannot list " + proc_root_);
    }
    std::vector<ProcessSample> samples;
    while (dirent* entry = ::readdir(dir)) {
        const std::string name = entry->d_name;
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        // A process may exit between readdir and the read.
        auto sample = read_process(proc_root_ + "/" + name + "/stat", std::stoll(name), uptime_s, ticks_per_s,
                                   page_size, mem_total);
        if (sample) {
            samples.push_back(std::move(*sample));
        }
    }
    ::closedir(dir);

    std::stable_sort(samples.begin(), samples.end(), [](const ProcessSample& a, const ProcessSample& b) {
        return a.pid < b.pid;
    });
    std::stable_sort(samples.begin(), samples.end(), [order](const ProcessSample& a, const ProcessSample& b) {
        return order == ProcessOrder::Cpu ? a.cpu_percent > b.cpu_percent : a.memory_percent > b.memory_percent;
    });
    if (samples.size() > limit) {
        samples.resize(limit);
    }

    json result = json::array();
    for (const auto& sample : samples) {
        result.push_back(json{
            {"pid", sample.pid},
            {"name", sample.name},
            {"cpu_percent", sample.cpu_percent},
            {"memory_percent", sample.memory_percent},
        });
    }
    return result;
}

} // namespace taskbridge::backends
