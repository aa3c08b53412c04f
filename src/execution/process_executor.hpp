#pragma once

#include <string>
#include <sys/types.h>

#include "core/command.hpp"

namespace cmdterm {

class PathResolver;

// Runs a program directly (no shell) in a given working directory and
// collects everything it writes to stdout and stderr. Blocks until the child
// exits.
class ProcessExecutor {
  public:
    explicit ProcessExecutor(const PathResolver &path_resolver);

    [[nodiscard]] ExecutionResult run(const Command &command, const std::string &working_directory) const;

  private:
    const PathResolver &path_resolver_;

    [[noreturn]] static void exec_in_child(
        const Command &command, const std::string &working_directory, int stdout_fd, int stderr_fd) noexcept;

    [[nodiscard]] static int wait_for_process(pid_t pid);
    [[nodiscard]] static int wait_status_to_exit_code(int status);
};

} // namespace cmdterm
