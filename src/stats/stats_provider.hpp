#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cmdterm {

struct MemoryInfo {
    std::uint64_t total{0};
    std::uint64_t available{0};
    double used_percent{0.0};
};

struct ProcessInfo {
    int pid{0};
    std::string user;
    double cpu_percent{0.0};
    std::string name;
};

// System introspection used by the cpu/mem/ps/top builtins. The registry holds
// a nullable pointer; no provider means the data is unavailable.
class StatsProvider {
  public:
    virtual ~StatsProvider() = default;

    [[nodiscard]] virtual double cpu_percent() = 0;
    [[nodiscard]] virtual unsigned core_count() = 0;
    [[nodiscard]] virtual MemoryInfo memory() = 0;
    // Sorted by CPU usage, highest first, at most `limit` entries.
    [[nodiscard]] virtual std::vector<ProcessInfo> processes(std::size_t limit) = 0;
};

class ProcStatsProvider final : public StatsProvider {
  public:
    explicit ProcStatsProvider(
        std::string proc_root = "/proc",
        std::chrono::milliseconds sample_interval = std::chrono::milliseconds(500));

    [[nodiscard]] double cpu_percent() override;
    [[nodiscard]] unsigned core_count() override;
    [[nodiscard]] MemoryInfo memory() override;
    [[nodiscard]] std::vector<ProcessInfo> processes(std::size_t limit) override;

    // True when the proc filesystem can be read.
    [[nodiscard]] bool available() const;

  private:
    std::string proc_root_;
    std::chrono::milliseconds sample_interval_;
};

} // namespace cmdterm
