#include "core/session.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace cmdterm {

namespace fs = std::filesystem;

Session::Session(std::string working_directory) : working_directory_(std::move(working_directory)) {
    std::error_code ec;
    if (!fs::is_directory(working_directory_, ec)) {
        throw std::invalid_argument("not a directory: " + working_directory_);
    }
}

Session Session::from_current_directory() { return Session(fs::current_path().string()); }

bool Session::change_directory(const std::string &directory) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec) || ::access(directory.c_str(), R_OK | X_OK) != 0) {
        return false;
    }

    auto canonical = fs::canonical(directory, ec);
    if (ec) {
        return false;
    }

    working_directory_ = canonical.string();
    return true;
}

void Session::record(std::string line) { history_.push_back(std::move(line)); }

std::span<const std::string> Session::recent_history() const noexcept {
    const std::span<const std::string> all(history_);
    return all.size() > kHistoryWindow ? all.last(kHistoryWindow) : all;
}

} // namespace cmdterm
