#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

#include <readline/readline.h>

#define private public
#include "line_editing/completion.hpp"
#undef private

#include "builtins/builtin_registry.hpp"
#include "core/path_resolver.hpp"
#include "core/session.hpp"

using cmdterm::BuiltinRegistry;
using cmdterm::CompletionEngine;
using cmdterm::PathResolver;
using cmdterm::Session;

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
    std::string pattern = "/tmp/cmdterm_completion_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    char *created = mkdtemp(buffer.data());
    assert(created != nullptr);
    return created;
}

void make_file(const fs::path &path, bool executable) {
    std::ofstream file(path);
    assert(file.is_open());
    file << "#!/bin/sh\nexit 0\n";
    file.close();

    if (!executable) {
        return;
    }

    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec |
                        fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace,
                    ec);
    assert(!ec);
}

void free_completion_matches(char **matches) {
    if (matches == nullptr) {
        return;
    }

    for (std::size_t i = 0; matches[i] != nullptr; ++i) {
        std::free(matches[i]);
    }
    std::free(matches);
}

BuiltinRegistry make_registry() {
    return BuiltinRegistry(nullptr, {});
}

void test_collect_matches_by_position() {
    EnvVarGuard path_guard("PATH");

    const std::string bin_dir = make_temp_dir();
    const std::string work_dir = make_temp_dir();
    make_file(fs::path(bin_dir) / "ca_custom_exe", true);
    make_file(fs::path(bin_dir) / "ca_not_executable", false);
    make_file(fs::path(work_dir) / "ca_local.txt", false);

    setenv("PATH", bin_dir.c_str(), 1);

    PathResolver resolver;
    const BuiltinRegistry registry = make_registry();
    const Session session(work_dir);
    CompletionEngine engine(registry, resolver, session);

    const auto command_matches = engine.collect_matches("ca", true);
    assert(command_matches.contains("cat"));
    assert(command_matches.contains("ca_custom_exe"));
    assert(command_matches.contains("ca_local.txt"));
    assert(!command_matches.contains("ca_not_executable"));
    assert(!command_matches.contains("cd"));

    const auto argument_matches = engine.collect_matches("ca", false);
    assert(argument_matches.contains("cat"));
    assert(argument_matches.contains("ca_local.txt"));
    assert(!argument_matches.contains("ca_custom_exe"));

    assert(engine.collect_matches("zzz_nothing", true).empty());

    std::error_code ec;
    fs::remove_all(bin_dir, ec);
    fs::remove_all(work_dir, ec);
}

void test_generator_walks_all_matches() {
    EnvVarGuard path_guard("PATH");

    const std::string bin_dir = make_temp_dir();
    make_file(fs::path(bin_dir) / "ec_custom_exe", true);
    setenv("PATH", bin_dir.c_str(), 1);

    PathResolver resolver;
    const BuiltinRegistry registry = make_registry();
    const Session session(bin_dir);
    CompletionEngine engine(registry, resolver, session);

    CompletionEngine::instance_ = nullptr;
    assert(CompletionEngine::generator_callback("ec", 0) == nullptr);

    engine.install();

    std::set<std::string> seen;
    char *first = CompletionEngine::generator_callback("ec", 0);
    assert(first != nullptr);
    seen.insert(first);
    std::free(first);

    for (;;) {
        char *next = CompletionEngine::generator_callback("ec", 1);
        if (next == nullptr) {
            break;
        }
        seen.insert(next);
        std::free(next);
    }

    assert(seen.contains("echo"));
    assert(seen.contains("ec_custom_exe"));

    std::error_code ec;
    fs::remove_all(bin_dir, ec);
}

void test_completion_callback_marks_attempt_over() {
    EnvVarGuard path_guard("PATH");

    const std::string bin_dir = make_temp_dir();
    const std::string work_dir = make_temp_dir();
    make_file(fs::path(bin_dir) / "ca_custom_exe", true);
    setenv("PATH", bin_dir.c_str(), 1);

    PathResolver resolver;
    const BuiltinRegistry registry = make_registry();
    const Session session(work_dir);
    CompletionEngine engine(registry, resolver, session);

    engine.install();

    rl_attempted_completion_over = 0;
    char **command_position = CompletionEngine::completion_callback("ca_", 0, 3);
    assert(rl_attempted_completion_over == 1);
    assert(command_position != nullptr);
    free_completion_matches(command_position);

    // Executables are only offered for the command word.
    rl_attempted_completion_over = 0;
    char **argument_position = CompletionEngine::completion_callback("ca_", 4, 7);
    assert(rl_attempted_completion_over == 1);
    assert(argument_position == nullptr);

    std::error_code ec;
    fs::remove_all(bin_dir, ec);
    fs::remove_all(work_dir, ec);
}

} // namespace

int main() {
    test_collect_matches_by_position();
    test_generator_walks_all_matches();
    test_completion_callback_marks_attempt_over();
    return 0;
}
