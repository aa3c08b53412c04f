#include "execution/process_executor.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <stdexcept>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/path_resolver.hpp"

namespace cmdterm {

namespace {

class Pipe {
  public:
    Pipe() {
        if (::pipe2(fds_.data(), O_CLOEXEC) == -1) {
            throw std::runtime_error(std::format("pipe failed: {}", std::strerror(errno)));
        }
    }

    Pipe(const Pipe &) = delete;
    Pipe &operator=(const Pipe &) = delete;

    ~Pipe() {
        close_read();
        close_write();
    }

    [[nodiscard]] int read_end() const noexcept { return fds_[0]; }
    [[nodiscard]] int write_end() const noexcept { return fds_[1]; }

    void close_read() noexcept { close_fd(fds_[0]); }
    void close_write() noexcept { close_fd(fds_[1]); }

  private:
    std::array<int, 2> fds_{-1, -1};

    static void close_fd(int &fd) noexcept {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }
};

[[nodiscard]] std::vector<char *> build_argv(const Command &command) {
    std::vector<char *> argv;
    argv.reserve(command.args.size() + 2);

    argv.push_back(const_cast<char *>(command.name.c_str()));
    for (const auto &arg : command.args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    return argv;
}

// Reads both pipes until the child closes them. Reading one stream to the end
// before the other can deadlock once the child fills the second pipe.
[[nodiscard]] bool drain(const Pipe &out_pipe, const Pipe &err_pipe, std::string &out, std::string &err) {
    std::array<pollfd, 2> fds{
        pollfd{.fd = out_pipe.read_end(), .events = POLLIN, .revents = 0},
        pollfd{.fd = err_pipe.read_end(), .events = POLLIN, .revents = 0},
    };
    std::array<std::string *, 2> sinks{&out, &err};
    std::array<char, 4096> buffer{};

    int open_streams = 2;
    while (open_streams > 0) {
        if (::poll(fds.data(), fds.size(), -1) == -1) {
            if (errno == EINTR) {
                continue;
            }

            return false;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd == -1 || fds[i].revents == 0) {
                continue;
            }

            const ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<std::size_t>(n));
                continue;
            }

            if (n == -1 && errno == EINTR) {
                continue;
            }

            fds[i].fd = -1;
            --open_streams;
        }
    }

    return true;
}

} // namespace

ProcessExecutor::ProcessExecutor(const PathResolver &path_resolver) : path_resolver_(path_resolver) {}

ExecutionResult ProcessExecutor::run(const Command &command, const std::string &working_directory) const {
    if (path_resolver_.find_command_path(command.name, working_directory).empty()) {
        return ExecutionResult{
            .status = kCommandNotFoundStatus, .output = std::format("{}: command not found", command.name)};
    }

    std::string out;
    std::string err;
    int status = 0;

    try {
        Pipe out_pipe;
        Pipe err_pipe;

        const pid_t pid = ::fork();
        if (pid == -1) {
            throw std::runtime_error(std::format("fork failed: {}", std::strerror(errno)));
        }

        if (pid == 0) {
            exec_in_child(command, working_directory, out_pipe.write_end(), err_pipe.write_end());
        }

        out_pipe.close_write();
        err_pipe.close_write();

        const bool drained = drain(out_pipe, err_pipe, out, err);
        const int poll_error = errno;
        out_pipe.close_read();
        err_pipe.close_read();

        status = wait_for_process(pid);
        if (!drained) {
            throw std::runtime_error(std::format("poll failed: {}", std::strerror(poll_error)));
        }
    } catch (const std::runtime_error &e) {
        return ExecutionResult{.status = 1, .output = std::format("Error running external command: {}", e.what())};
    }

    if (status == kCommandNotFoundStatus && out.empty() && err.ends_with(": command not found\n")) {
        err.pop_back();
        return ExecutionResult{.status = status, .output = std::move(err)};
    }

    if (!err.empty()) {
        out += '\n';
        out += err;
    }

    return ExecutionResult{.status = status, .output = std::move(out)};
}

void ProcessExecutor::exec_in_child(
    const Command &command, const std::string &working_directory, int stdout_fd, int stderr_fd) noexcept {
    if (::dup2(stdout_fd, STDOUT_FILENO) == -1 || ::dup2(stderr_fd, STDERR_FILENO) == -1) {
        _exit(1);
    }

    if (::chdir(working_directory.c_str()) != 0) {
        const std::string message = std::format("{}: {}\n", working_directory, std::strerror(errno));
        [[maybe_unused]] const auto written = ::write(STDERR_FILENO, message.data(), message.size());
        _exit(1);
    }

    auto argv = build_argv(command);
    ::execvp(command.name.c_str(), argv.data());

    const int error = errno;
    const std::string message = error == ENOENT ? std::format("{}: command not found\n", command.name)
                                                : std::format("{}: {}\n", command.name, std::strerror(error));
    [[maybe_unused]] const auto written = ::write(STDERR_FILENO, message.data(), message.size());
    _exit(error == ENOENT ? kCommandNotFoundStatus : 126);
}

int ProcessExecutor::wait_for_process(pid_t pid) {
    int status = 0;

    while (::waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
            continue;
        }

        throw std::runtime_error(std::format("waitpid failed: {}", std::strerror(errno)));
    }

    return wait_status_to_exit_code(status);
}

int ProcessExecutor::wait_status_to_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }

    return 1;
}

} // namespace cmdterm
