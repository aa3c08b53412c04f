#include "core/path_resolver.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>

#include <pwd.h>
#include <unistd.h>

namespace cmdterm {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] std::string home_of_user(const std::string &user) {
    const passwd *entry = ::getpwnam(user.c_str());
    return entry != nullptr && entry->pw_dir != nullptr ? std::string(entry->pw_dir) : std::string();
}

[[nodiscard]] std::string expand_home(std::string_view path) {
    if (!path.starts_with('~')) {
        return std::string(path);
    }

    const auto slash = path.find('/');
    const std::string_view user = path.substr(1, slash == std::string_view::npos ? path.size() - 1 : slash - 1);
    const std::string_view rest = slash == std::string_view::npos ? std::string_view() : path.substr(slash);

    const std::string home = user.empty() ? PathResolver::home_directory() : home_of_user(std::string(user));
    if (home.empty()) {
        return std::string(path);
    }

    return home + std::string(rest);
}

} // namespace

std::string PathResolver::home_directory() {
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return home;
    }

    const passwd *entry = ::getpwuid(::getuid());
    return entry != nullptr && entry->pw_dir != nullptr ? std::string(entry->pw_dir) : std::string("/");
}

std::string PathResolver::resolve(std::string_view path, std::string_view working_directory) {
    fs::path resolved(expand_home(path));
    if (!resolved.is_absolute()) {
        resolved = fs::path(working_directory) / resolved;
    }

    std::string normalized = resolved.lexically_normal().string();
    while (normalized.size() > 1 && normalized.ends_with('/')) {
        normalized.pop_back();
    }

    return normalized;
}

void PathResolver::scan_path_executables(
    std::string_view prefix,
    const std::function<bool(std::string_view filename, std::string_view full_path)> &callback) const {
    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return;
    }

    std::stringstream path_stream(path_env);
    std::string dir;

    while (std::getline(path_stream, dir, ':')) {
        std::error_code ec;
        for (const auto &entry : fs::directory_iterator(dir, ec)) {
            if (ec) {
                break;
            }

            if (!entry.is_regular_file(ec) || ec) {
                continue;
            }

            const std::string filename = entry.path().filename().string();
            if (!filename.starts_with(prefix)) {
                continue;
            }

            if (::access(entry.path().c_str(), X_OK) != 0) {
                continue;
            }

            if (callback(filename, entry.path().string())) {
                return;
            }
        }
    }
}

std::string PathResolver::find_command_path(std::string_view command, std::string_view working_directory) const {
    if (command.empty()) {
        return {};
    }

    if (command.find('/') != std::string_view::npos) {
        const std::string candidate = resolve(command, working_directory);
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }

        return {};
    }

    std::string resolved_path;

    scan_path_executables(command, [&](std::string_view filename, std::string_view full_path) {
        if (filename == command) {
            resolved_path = full_path;
            return true;
        }

        return false;
    });

    return resolved_path;
}

std::set<std::string> PathResolver::executable_candidates(std::string_view prefix) const {
    std::set<std::string> candidates;

    scan_path_executables(prefix, [&](std::string_view filename, std::string_view /*full_path*/) {
        candidates.emplace(filename);
        return false;
    });

    return candidates;
}

} // namespace cmdterm
