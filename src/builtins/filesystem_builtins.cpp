#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "builtins/builtin_registry.hpp"
#include "core/path_resolver.hpp"
#include "core/session.hpp"

namespace cmdterm {

namespace fs = std::filesystem;

namespace {

// Collects per-operand failures without stopping the batch.
class Report {
  public:
    void fail(std::string message) {
        if (!text_.empty()) {
            text_.push_back('\n');
        }
        text_ += message;
        failed_ = true;
    }

    [[nodiscard]] ExecutionResult result() && {
        return ExecutionResult{.status = failed_ ? 1 : 0, .output = std::move(text_)};
    }

  private:
    std::string text_;
    bool failed_{false};
};

[[nodiscard]] std::string errno_message(int error) { return std::generic_category().message(error); }

[[nodiscard]] std::string error_text(std::errc error) { return std::make_error_code(error).message(); }

[[nodiscard]] bool path_exists(const fs::path &path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

[[nodiscard]] bool is_real_directory(const fs::path &path) {
    std::error_code ec;
    return fs::is_directory(fs::symlink_status(path, ec));
}

[[nodiscard]] bool is_directory(const fs::path &path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

// True when `target` is `directory` itself or lies below it once symlinks and
// `..` are resolved.
[[nodiscard]] bool is_inside(const fs::path &target, const fs::path &directory) {
    std::error_code ec;
    const fs::path base = fs::canonical(directory, ec);
    if (ec) {
        return false;
    }

    const fs::path candidate = fs::weakly_canonical(target, ec);
    if (ec) {
        return false;
    }

    const auto [base_end, candidate_end] = std::mismatch(base.begin(), base.end(), candidate.begin(), candidate.end());
    return base_end == base.end();
}

// Copies modification time onto `target` after a file copy.
void preserve_timestamp(const fs::path &source, const fs::path &target) {
    std::error_code ec;
    const auto time = fs::last_write_time(source, ec);
    if (!ec) {
        fs::last_write_time(target, time, ec);
    }
}

} // namespace

ExecutionResult BuiltinRegistry::builtin_ls(const Args &args, const Session &session) const {
    const std::string operand = args.empty() ? "." : args.front();
    const fs::path path = PathResolver::resolve(operand, session.working_directory());

    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return ExecutionResult{
            .status = 1,
            .output = std::format(
                "ls: cannot access '{}': {}", operand, ec ? ec.message() : error_text(std::errc::no_such_file_or_directory))};
    }

    if (!fs::is_directory(status)) {
        return ExecutionResult{.status = 0, .output = path.filename().string()};
    }

    std::vector<std::string> names;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }

    if (ec) {
        return ExecutionResult{
            .status = 1, .output = std::format("ls: cannot open directory '{}': {}", operand, ec.message())};
    }

    std::sort(names.begin(), names.end());

    Report report;
    std::string listing;
    for (const auto &name : names) {
        std::error_code entry_ec;
        const bool directory = fs::is_directory(path / name, entry_ec);

        if (entry_ec && entry_ec != std::errc::no_such_file_or_directory) {
            report.fail(std::format("ls: cannot access '{}': {}", name, entry_ec.message()));
        }

        if (!listing.empty()) {
            listing.push_back('\n');
        }
        listing += directory ? name + "/" : name;
    }

    auto result = std::move(report).result();
    result.output = result.output.empty() ? std::move(listing) : listing + "\n" + result.output;
    return result;
}

ExecutionResult BuiltinRegistry::builtin_mkdir(const Args &args, const Session &session) const {
    if (args.empty()) {
        throw BuiltinError("missing operand");
    }

    Report report;
    for (const auto &operand : args) {
        const fs::path path = PathResolver::resolve(operand, session.working_directory());

        if (path_exists(path)) {
            report.fail(std::format(
                "mkdir: cannot create directory '{}': {}", operand, error_text(std::errc::file_exists)));
            continue;
        }

        std::error_code ec;
        fs::create_directories(path, ec);
        if (ec) {
            report.fail(std::format("mkdir: cannot create directory '{}': {}", operand, ec.message()));
        }
    }

    return std::move(report).result();
}

ExecutionResult BuiltinRegistry::builtin_rm(const Args &args, const Session &session) const {
    if (args.empty()) {
        throw BuiltinError("missing operand");
    }

    Report report;
    for (const auto &operand : args) {
        const fs::path path = PathResolver::resolve(operand, session.working_directory());

        if (!path_exists(path)) {
            report.fail(std::format(
                "rm: cannot remove '{}': {}", operand, error_text(std::errc::no_such_file_or_directory)));
            continue;
        }

        // Symlinks to directories are removed like files.
        if (is_real_directory(path)) {
            report.fail(std::format("rm: cannot remove '{}': {}", operand, error_text(std::errc::is_a_directory)));
            continue;
        }

        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            report.fail(std::format("rm: cannot remove '{}': {}", operand, ec.message()));
        }
    }

    return std::move(report).result();
}

ExecutionResult BuiltinRegistry::builtin_rmdir(const Args &args, const Session &session) const {
    if (args.empty()) {
        throw BuiltinError("missing operand");
    }

    Report report;
    for (const auto &operand : args) {
        const fs::path path = PathResolver::resolve(operand, session.working_directory());

        if (::rmdir(path.c_str()) != 0) {
            report.fail(std::format("rmdir: failed to remove '{}': {}", operand, errno_message(errno)));
        }
    }

    return std::move(report).result();
}

ExecutionResult BuiltinRegistry::builtin_cat(const Args &args, const Session &session) const {
    if (args.empty()) {
        throw BuiltinError("missing operand");
    }

    // Unreadable files are reported inline; the status stays 0.
    std::string output;
    bool first = true;

    for (const auto &operand : args) {
        const fs::path path = PathResolver::resolve(operand, session.working_directory());

        if (!first) {
            output.push_back('\n');
        }
        first = false;

        if (is_directory(path)) {
            output += std::format("cat: {}: {}", operand, error_text(std::errc::is_a_directory));
            continue;
        }

        errno = 0;
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            const int error = errno != 0 ? errno : ENOENT;
            output += std::format("cat: {}: {}", operand, errno_message(error));
            continue;
        }

        output.append(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        if (file.bad()) {
            output += std::format("cat: {}: read error", operand);
        }
    }

    return ExecutionResult{.status = 0, .output = std::move(output)};
}

ExecutionResult BuiltinRegistry::builtin_touch(const Args &args, const Session &session) const {
    if (args.empty()) {
        throw BuiltinError("missing operand");
    }

    // Stops at the first failure.
    for (const auto &operand : args) {
        const fs::path path = PathResolver::resolve(operand, session.working_directory());

        const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_NOCTTY | O_NONBLOCK | O_CLOEXEC, 0666);
        if (fd == -1) {
            if (errno != EISDIR) {
                return ExecutionResult{
                    .status = 1, .output = std::format("touch: cannot touch '{}': {}", operand, errno_message(errno))};
            }
        } else {
            ::close(fd);
        }

        if (::utimensat(AT_FDCWD, path.c_str(), nullptr, 0) != 0) {
            return ExecutionResult{
                .status = 1, .output = std::format("touch: cannot touch '{}': {}", operand, errno_message(errno))};
        }
    }

    return ExecutionResult{};
}

ExecutionResult BuiltinRegistry::builtin_mv(const Args &args, const Session &session) const {
    if (args.size() < 2) {
        throw BuiltinError("missing file operand");
    }

    const Args sources(args.begin(), args.end() - 1);
    const fs::path destination = PathResolver::resolve(args.back(), session.working_directory());
    const bool into_directory = is_directory(destination);

    if (sources.size() > 1 && !into_directory) {
        return ExecutionResult{.status = 1, .output = std::format("mv: target '{}' is not a directory", args.back())};
    }

    Report report;
    for (const auto &operand : sources) {
        const fs::path source = PathResolver::resolve(operand, session.working_directory());

        if (!path_exists(source)) {
            report.fail(
                std::format("mv: cannot stat '{}': {}", operand, error_text(std::errc::no_such_file_or_directory)));
            continue;
        }

        const fs::path target = into_directory ? destination / source.filename() : destination;

        std::error_code ec;
        fs::rename(source, target, ec);
        if (ec) {
            report.fail(std::format("mv: cannot move '{}' to '{}': {}", operand, target.string(), ec.message()));
        }
    }

    return std::move(report).result();
}

ExecutionResult BuiltinRegistry::builtin_cp(const Args &args, const Session &session) const {
    if (args.size() < 2) {
        throw BuiltinError("missing file operand");
    }

    const Args sources(args.begin(), args.end() - 1);
    const fs::path destination = PathResolver::resolve(args.back(), session.working_directory());
    const bool into_directory = is_directory(destination);

    if (sources.size() > 1 && !into_directory) {
        return ExecutionResult{.status = 1, .output = std::format("cp: target '{}' is not a directory", args.back())};
    }

    Report report;
    for (const auto &operand : sources) {
        const fs::path source = PathResolver::resolve(operand, session.working_directory());
        const fs::path target = into_directory ? destination / source.filename() : destination;

        std::error_code ec;
        const auto status = fs::status(source, ec);
        if (ec || !fs::exists(status)) {
            report.fail(std::format(
                "cp: cannot stat '{}': {}", operand, ec ? ec.message() : error_text(std::errc::no_such_file_or_directory)));
            continue;
        }

        if (fs::is_directory(status)) {
            if (is_inside(target, source)) {
                report.fail(std::format(
                    "cp: cannot copy a directory, '{}', into itself, '{}'", operand, target.string()));
                continue;
            }

            if (path_exists(target)) {
                report.fail(std::format(
                    "cp: cannot copy '{}' to '{}': {}", operand, target.string(), error_text(std::errc::file_exists)));
                continue;
            }

            fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
        } else {
            fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
            if (!ec) {
                preserve_timestamp(source, target);
            }
        }

        if (ec) {
            report.fail(std::format("cp: cannot copy '{}' to '{}': {}", operand, target.string(), ec.message()));
        }
    }

    return std::move(report).result();
}

} // namespace cmdterm
