#include "stats/stats_provider.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

#include <pwd.h>
#include <unistd.h>

namespace cmdterm {

namespace fs = std::filesystem;

namespace {

struct CpuTimes {
    std::uint64_t total{0};
    std::uint64_t idle{0};
};

struct ProcessSample {
    int pid{0};
    std::string name;
    std::uint64_t ticks{0};
    unsigned uid{0};
};

[[nodiscard]] CpuTimes read_cpu_times(const std::string &proc_root) {
    std::ifstream file(proc_root + "/stat");
    if (!file.is_open()) {
        throw std::runtime_error("cannot read " + proc_root + "/stat");
    }

    std::string label;
    file >> label;
    if (label != "cpu") {
        throw std::runtime_error("unexpected format in " + proc_root + "/stat");
    }

    CpuTimes times;
    std::uint64_t value = 0;
    for (int field = 0; field < 8 && file >> value; ++field) {
        times.total += value;
        // idle and iowait
        if (field == 3 || field == 4) {
            times.idle += value;
        }
    }

    return times;
}

[[nodiscard]] std::optional<int> parse_pid(const std::string &name) {
    int pid = 0;
    const char *first = name.data();
    const char *last = name.data() + name.size();
    auto [ptr, ec] = std::from_chars(first, last, pid);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }

    return pid;
}

[[nodiscard]] std::optional<ProcessSample> read_process(const fs::path &dir, int pid) {
    std::ifstream stat_file(dir / "stat");
    std::string line;
    if (!stat_file.is_open() || !std::getline(stat_file, line)) {
        return std::nullopt;
    }

    const auto open = line.find('(');
    const auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    ProcessSample sample;
    sample.pid = pid;
    sample.name = line.substr(open + 1, close - open - 1);

    // Fields after the command name start at field 3 (state); utime and stime
    // are fields 14 and 15.
    std::istringstream rest(line.substr(close + 1));
    std::string field;
    for (int index = 3; index <= 15 && rest >> field; ++index) {
        if (index == 14 || index == 15) {
            std::uint64_t ticks = 0;
            std::from_chars(field.data(), field.data() + field.size(), ticks);
            sample.ticks += ticks;
        }
    }

    std::ifstream status_file(dir / "status");
    while (std::getline(status_file, line)) {
        if (line.starts_with("Uid:")) {
            std::istringstream uid_stream(line.substr(4));
            uid_stream >> sample.uid;
            break;
        }
    }

    return sample;
}

[[nodiscard]] std::vector<ProcessSample> read_processes(const std::string &proc_root) {
    std::vector<ProcessSample> samples;

    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(proc_root, ec)) {
        const auto pid = parse_pid(entry.path().filename().string());
        if (!pid.has_value()) {
            continue;
        }

        // Processes may exit between listing and reading.
        if (auto sample = read_process(entry.path(), *pid); sample.has_value()) {
            samples.push_back(std::move(*sample));
        }
    }

    if (ec) {
        throw std::runtime_error("cannot list " + proc_root + ": " + ec.message());
    }

    return samples;
}

[[nodiscard]] std::string user_name(unsigned uid) {
    if (const passwd *entry = ::getpwuid(uid); entry != nullptr && entry->pw_name != nullptr) {
        return entry->pw_name;
    }

    return std::to_string(uid);
}

} // namespace

ProcStatsProvider::ProcStatsProvider(std::string proc_root, std::chrono::milliseconds sample_interval)
    : proc_root_(std::move(proc_root)), sample_interval_(sample_interval) {}

bool ProcStatsProvider::available() const {
    std::ifstream file(proc_root_ + "/stat");
    return file.is_open();
}

double ProcStatsProvider::cpu_percent() {
    const CpuTimes before = read_cpu_times(proc_root_);
    std::this_thread::sleep_for(sample_interval_);
    const CpuTimes after = read_cpu_times(proc_root_);

    const auto total = after.total - before.total;
    if (total == 0) {
        return 0.0;
    }

    const auto idle = after.idle - before.idle;
    return 100.0 * static_cast<double>(total - idle) / static_cast<double>(total);
}

unsigned ProcStatsProvider::core_count() {
    const long count = ::sysconf(_SC_NPROCESSORS_ONLN);
    if (count > 0) {
        return static_cast<unsigned>(count);
    }

    return std::max(1U, std::thread::hardware_concurrency());
}

MemoryInfo ProcStatsProvider::memory() {
    std::ifstream file(proc_root_ + "/meminfo");
    if (!file.is_open()) {
        throw std::runtime_error("cannot read " + proc_root_ + "/meminfo");
    }

    MemoryInfo info;
    bool have_available = false;
    std::uint64_t free_kb = 0;

    std::string key;
    std::uint64_t value_kb = 0;
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream fields(line);
        if (!(fields >> key >> value_kb)) {
            continue;
        }

        if (key == "MemTotal:") {
            info.total = value_kb * 1024;
        } else if (key == "MemAvailable:") {
            info.available = value_kb * 1024;
            have_available = true;
        } else if (key == "MemFree:") {
            free_kb = value_kb;
        }
    }

    if (info.total == 0) {
        throw std::runtime_error("MemTotal missing from " + proc_root_ + "/meminfo");
    }

    if (!have_available) {
        info.available = free_kb * 1024;
    }

    info.used_percent =
        100.0 * static_cast<double>(info.total - std::min(info.available, info.total)) / static_cast<double>(info.total);
    return info;
}

std::vector<ProcessInfo> ProcStatsProvider::processes(std::size_t limit) {
    const CpuTimes cpu_before = read_cpu_times(proc_root_);
    const auto before = read_processes(proc_root_);
    std::this_thread::sleep_for(sample_interval_);
    const CpuTimes cpu_after = read_cpu_times(proc_root_);
    const auto after = read_processes(proc_root_);

    std::unordered_map<int, std::uint64_t> previous_ticks;
    for (const auto &sample : before) {
        previous_ticks.emplace(sample.pid, sample.ticks);
    }

    const auto elapsed = cpu_after.total - cpu_before.total;
    const double cores = static_cast<double>(core_count());

    std::vector<ProcessInfo> result;
    result.reserve(after.size());
    for (const auto &sample : after) {
        double percent = 0.0;
        if (const auto it = previous_ticks.find(sample.pid); it != previous_ticks.end() && elapsed > 0) {
            const auto used = sample.ticks >= it->second ? sample.ticks - it->second : 0;
            // The system-wide counter sums every core.
            percent = 100.0 * cores * static_cast<double>(used) / static_cast<double>(elapsed);
        }

        result.push_back(ProcessInfo{
            .pid = sample.pid, .user = user_name(sample.uid), .cpu_percent = percent, .name = sample.name});
    }

    std::stable_sort(result.begin(), result.end(), [](const ProcessInfo &lhs, const ProcessInfo &rhs) {
        return lhs.cpu_percent > rhs.cpu_percent;
    });

    if (result.size() > limit) {
        result.resize(limit);
    }

    return result;
}

} // namespace cmdterm
