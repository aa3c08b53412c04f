#include <format>
#include <string>

#include "builtins/builtin_registry.hpp"
#include "stats/stats_provider.hpp"

namespace cmdterm {

namespace {

[[nodiscard]] ExecutionResult unavailable(std::string_view name) {
    return ExecutionResult{.status = 0, .output = std::format("{}: system statistics are not available", name)};
}

[[nodiscard]] std::string format_memory(const MemoryInfo &info) {
    return std::format(
        "Total: {} bytes\nAvailable: {} bytes\nUsed%: {:.1f}%", info.total, info.available, info.used_percent);
}

[[nodiscard]] std::string format_processes(const std::vector<ProcessInfo> &processes) {
    std::string output = "PID\tUSER\tCPU%\tNAME";
    for (const auto &process : processes) {
        output += std::format("\n{}\t{}\t{:.1f}\t{}", process.pid, process.user, process.cpu_percent, process.name);
    }

    return output;
}

} // namespace

ExecutionResult BuiltinRegistry::builtin_cpu(const Args & /*args*/) const {
    if (stats_provider_ == nullptr) {
        return unavailable("cpu");
    }

    const double percent = stats_provider_->cpu_percent();
    return ExecutionResult{
        .status = 0, .output = std::format("CPU percent: {:.1f}%\nCores: {}", percent, stats_provider_->core_count())};
}

ExecutionResult BuiltinRegistry::builtin_mem(const Args & /*args*/) const {
    if (stats_provider_ == nullptr) {
        return unavailable("mem");
    }

    return ExecutionResult{.status = 0, .output = format_memory(stats_provider_->memory())};
}

ExecutionResult BuiltinRegistry::builtin_ps(const Args & /*args*/) const {
    if (stats_provider_ == nullptr) {
        return unavailable("ps");
    }

    return ExecutionResult{.status = 0, .output = format_processes(stats_provider_->processes(kProcessLimit))};
}

ExecutionResult BuiltinRegistry::builtin_top(const Args & /*args*/) const {
    if (stats_provider_ == nullptr) {
        return unavailable("top");
    }

    const auto processes = format_processes(stats_provider_->processes(kProcessLimit));
    return ExecutionResult{.status = 0, .output = processes + "\n\n" + format_memory(stats_provider_->memory())};
}

} // namespace cmdterm
