#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <stdlib.h>

#include "stats/stats_provider.hpp"

using cmdterm::ProcStatsProvider;

namespace {

namespace fs = std::filesystem;

constexpr std::chrono::milliseconds kShortInterval(1);

class FakeProcRoot {
  public:
    FakeProcRoot() {
        std::string pattern = "/tmp/cmdterm_proc_XXXXXX";
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');

        char *created = mkdtemp(buffer.data());
        assert(created != nullptr);
        path_ = created;
    }

    ~FakeProcRoot() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    FakeProcRoot(const FakeProcRoot &) = delete;
    FakeProcRoot &operator=(const FakeProcRoot &) = delete;

    void write(const std::string &relative, const std::string &content) const {
        const fs::path target = fs::path(path_) / relative;
        fs::create_directories(target.parent_path());
        std::ofstream file(target);
        assert(file.is_open());
        file << content;
    }

    void add_process(int pid, const std::string &name, unsigned uid) const {
        const std::string dir = std::to_string(pid);
        write(dir + "/stat",
              std::to_string(pid) + " (" + name + ") S 1 1 1 0 -1 4194560 100 0 0 0 7 3 0 0 20 0 1 0 10 0 0\n");
        write(dir + "/status", "Name:\t" + name + "\nUid:\t" + std::to_string(uid) + "\t" + std::to_string(uid) + "\n");
    }

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

void test_availability_depends_on_proc_stat() {
    FakeProcRoot root;
    ProcStatsProvider provider(root.path(), kShortInterval);
    assert(!provider.available());

    root.write("stat", "cpu  10 0 10 80 0 0 0 0 0 0\n");
    assert(provider.available());
}

void test_cpu_percent_is_zero_without_elapsed_time() {
    FakeProcRoot root;
    root.write("stat", "cpu  10 0 10 80 0 0 0 0 0 0\ncpu0 10 0 10 80 0 0 0 0 0 0\n");

    ProcStatsProvider provider(root.path(), kShortInterval);
    assert(provider.cpu_percent() == 0.0);
    assert(provider.core_count() >= 1);
}

void test_malformed_stat_throws() {
    FakeProcRoot root;
    root.write("stat", "intr 1 2 3\n");

    ProcStatsProvider provider(root.path(), kShortInterval);
    bool threw = false;
    try {
        (void)provider.cpu_percent();
    } catch (const std::runtime_error &) {
        threw = true;
    }
    assert(threw);
}

void test_memory_uses_mem_available() {
    FakeProcRoot root;
    root.write("meminfo", "MemTotal:        1000 kB\nMemFree:          100 kB\nMemAvailable:     250 kB\n");

    ProcStatsProvider provider(root.path(), kShortInterval);
    const auto info = provider.memory();
    assert(info.total == 1000 * 1024);
    assert(info.available == 250 * 1024);
    assert(info.used_percent == 75.0);
}

void test_memory_falls_back_to_mem_free() {
    FakeProcRoot root;
    root.write("meminfo", "MemTotal:        1000 kB\nMemFree:          500 kB\n");

    ProcStatsProvider provider(root.path(), kShortInterval);
    const auto info = provider.memory();
    assert(info.available == 500 * 1024);
    assert(info.used_percent == 50.0);
}

void test_memory_without_meminfo_throws() {
    FakeProcRoot root;
    ProcStatsProvider provider(root.path(), kShortInterval);

    bool threw = false;
    try {
        (void)provider.memory();
    } catch (const std::runtime_error &) {
        threw = true;
    }
    assert(threw);
}

void test_processes_are_listed_and_limited() {
    FakeProcRoot root;
    root.write("stat", "cpu  10 0 10 80 0 0 0 0 0 0\n");
    root.write("meminfo", "MemTotal: 1000 kB\n");
    root.add_process(1, "init", 0);
    root.add_process(42, "my worker", 0);
    root.add_process(77, "(odd)", 0);
    root.write("self/stat", "not a pid directory\n");

    ProcStatsProvider provider(root.path(), kShortInterval);

    const auto all = provider.processes(20);
    assert(all.size() == 3);

    std::set<std::string> names;
    for (const auto &process : all) {
        names.insert(process.name);
        assert(process.cpu_percent == 0.0);
        assert(!process.user.empty());
    }
    assert(names == (std::set<std::string>{"init", "my worker", "(odd)"}));

    assert(provider.processes(2).size() == 2);
    assert(provider.processes(0).empty());
}

void test_live_proc_when_present() {
    ProcStatsProvider provider("/proc", kShortInterval);
    if (!provider.available()) {
        return;
    }

    const double percent = provider.cpu_percent();
    assert(percent >= 0.0 && percent <= 100.0);

    const auto info = provider.memory();
    assert(info.total > 0);
    assert(info.used_percent >= 0.0 && info.used_percent <= 100.0);

    const auto processes = provider.processes(5);
    assert(!processes.empty());
    assert(processes.size() <= 5);
    for (std::size_t i = 1; i < processes.size(); ++i) {
        assert(processes[i - 1].cpu_percent >= processes[i].cpu_percent);
    }
}

} // namespace

int main() {
    test_availability_depends_on_proc_stat();
    test_cpu_percent_is_zero_without_elapsed_time();
    test_malformed_stat_throws();
    test_memory_uses_mem_available();
    test_memory_falls_back_to_mem_free();
    test_memory_without_meminfo_throws();
    test_processes_are_listed_and_limited();
    test_live_proc_when_present();
    return 0;
}
