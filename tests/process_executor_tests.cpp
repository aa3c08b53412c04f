#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <sys/resource.h>
#include <unistd.h>

#include "core/path_resolver.hpp"
#include "execution/process_executor.hpp"

using cmdterm::Command;
using cmdterm::ExecutionResult;
using cmdterm::PathResolver;
using cmdterm::ProcessExecutor;

namespace {

namespace fs = std::filesystem;

class EnvVarGuard {
  public:
    explicit EnvVarGuard(const char *name) : name_(name) {
        const char *value = std::getenv(name_.c_str());
        if (value != nullptr) {
            had_value_ = true;
            value_ = value;
        }
    }

    ~EnvVarGuard() {
        if (had_value_) {
            setenv(name_.c_str(), value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

  private:
    std::string name_;
    bool had_value_{false};
    std::string value_;
};

std::string make_temp_dir() {
    std::string pattern = "/tmp/cmdterm_process_executor_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    char *created = mkdtemp(buffer.data());
    assert(created != nullptr);
    return fs::canonical(created).string();
}

void make_executable_script(const fs::path &path, std::string_view body) {
    std::ofstream file(path);
    assert(file.is_open());
    file << body;
    file.close();

    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec |
                        fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace,
                    ec);
    assert(!ec);
}

void prepend_to_path(const std::string &dir) {
    const char *current_path = std::getenv("PATH");
    const std::string path_env = current_path != nullptr ? dir + ":" + std::string(current_path) : dir;
    setenv("PATH", path_env.c_str(), 1);
}

void test_missing_command_returns_127() {
    PathResolver resolver;
    ProcessExecutor executor(resolver);

    const auto result = executor.run(Command{.name = "doesnotexist123", .args = {}}, "/");
    assert(result.status == 127);
    assert(result.output == "doesnotexist123: command not found");
    assert(result.output.ends_with("command not found"));

    const auto relative = executor.run(Command{.name = "./nothing_here", .args = {}}, "/tmp");
    assert(relative.status == 127);
}

void test_captures_stdout_and_exit_code() {
    EnvVarGuard path_guard("PATH");

    const std::string dir = make_temp_dir();
    make_executable_script(fs::path(dir) / "ext_echo", "#!/bin/sh\necho \"external:$1:$2\"\nexit 3\n");
    prepend_to_path(dir);

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    const auto result = executor.run(Command{.name = "ext_echo", .args = {"a b", "$HOME"}}, "/");
    assert(result.status == 3);
    // Arguments reach the program verbatim; no shell expands them.
    assert(result.output == "external:a b:$HOME\n");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_stderr_is_appended_after_a_line_break() {
    EnvVarGuard path_guard("PATH");

    const std::string dir = make_temp_dir();
    make_executable_script(fs::path(dir) / "both_streams", "#!/bin/sh\necho out\necho err >&2\n");
    make_executable_script(fs::path(dir) / "only_err", "#!/bin/sh\necho err >&2\nexit 1\n");
    prepend_to_path(dir);

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    const auto both = executor.run(Command{.name = "both_streams", .args = {}}, "/");
    assert(both.status == 0);
    assert(both.output == "out\n\nerr\n");

    const auto only_err = executor.run(Command{.name = "only_err", .args = {}}, "/");
    assert(only_err.status == 1);
    assert(only_err.output == "\nerr\n");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_runs_in_session_working_directory() {
    const std::string dir = make_temp_dir();
    make_executable_script(fs::path(dir) / "where.sh", "#!/bin/sh\npwd\n");

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    const auto result = executor.run(Command{.name = "./where.sh", .args = {}}, dir);
    assert(result.status == 0);
    assert(result.output == dir + "\n");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_large_output_on_both_streams_does_not_block() {
    EnvVarGuard path_guard("PATH");

    const std::string dir = make_temp_dir();
    make_executable_script(
        fs::path(dir) / "chatty",
        "#!/bin/sh\n"
        "i=0\n"
        "while [ $i -lt 20000 ]; do\n"
        "  echo 'stderr line padding padding padding' >&2\n"
        "  echo 'stdout line'\n"
        "  i=$((i + 1))\n"
        "done\n");
    prepend_to_path(dir);

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    const auto result = executor.run(Command{.name = "chatty", .args = {}}, "/");
    assert(result.status == 0);
    assert(result.output.size() == 20000 * std::string("stdout line\n").size() + 1 +
                                       20000 * std::string("stderr line padding padding padding\n").size());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_signal_termination_maps_to_128_plus_signal() {
    EnvVarGuard path_guard("PATH");

    const std::string dir = make_temp_dir();
    make_executable_script(fs::path(dir) / "self_kill", "#!/bin/sh\nkill -TERM $$\n");
    prepend_to_path(dir);

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    const auto result = executor.run(Command{.name = "self_kill", .args = {}}, "/");
    assert(result.status == 128 + 15);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_missing_interpreter_reports_not_found() {
    EnvVarGuard path_guard("PATH");

    const std::string dir = make_temp_dir();
    make_executable_script(fs::path(dir) / "broken_exec", "#!/definitely/missing/interpreter\n");
    prepend_to_path(dir);

    PathResolver resolver;
    ProcessExecutor executor(resolver);

    const auto result = executor.run(Command{.name = "broken_exec", .args = {"arg"}}, "/");
    assert(result.status == 127);
    assert(result.output == "broken_exec: command not found");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_pipe_failure_is_reported_as_status_1() {
    PathResolver resolver;
    ProcessExecutor executor(resolver);

    struct rlimit old_nofile {};
    assert(getrlimit(RLIMIT_NOFILE, &old_nofile) == 0);
    struct rlimit constrained_nofile = old_nofile;
    constrained_nofile.rlim_cur = 3;
    assert(setrlimit(RLIMIT_NOFILE, &constrained_nofile) == 0);

    const ExecutionResult result = executor.run(Command{.name = "/bin/sh", .args = {"-c", "true"}}, "/");

    assert(setrlimit(RLIMIT_NOFILE, &old_nofile) == 0);

    assert(result.status == 1);
    assert(result.output.starts_with("Error running external command: pipe failed"));
}

} // namespace

int main() {
    test_missing_command_returns_127();
    test_captures_stdout_and_exit_code();
    test_stderr_is_appended_after_a_line_break();
    test_runs_in_session_working_directory();
    test_large_output_on_both_streams_does_not_block();
    test_signal_termination_maps_to_128_plus_signal();
    test_missing_interpreter_reports_not_found();
    test_pipe_failure_is_reported_as_status_1();

    return 0;
}
