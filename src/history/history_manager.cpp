#include "history/history_manager.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <system_error>
#include <utility>

#include <readline/history.h>

#include "core/session.hpp"

namespace cmdterm {

namespace fs = std::filesystem;

HistoryManager::HistoryManager(std::string history_file) : history_file_(std::move(history_file)) {}

bool HistoryManager::load(Session &session, std::ostream &diagnostics) const {
    using_history();
    stifle_history(static_cast<int>(kHistoryWindow));

    std::error_code ec;
    if (!fs::exists(history_file_, ec)) {
        return true;
    }

    std::ifstream file(history_file_);
    if (!file.is_open()) {
        diagnostics << "cmdterm: warning: could not load history from " << history_file_ << ": "
                    << std::strerror(errno) << std::endl;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        // Blank lines are never recorded, so a blank line here is not history.
        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());
        session.record(std::move(line));
    }

    return true;
}

bool HistoryManager::save(const Session &session, std::ostream &diagnostics) const {
    std::ofstream file(history_file_, std::ios::trunc);
    if (!file.is_open()) {
        diagnostics << "cmdterm: warning: could not save history to " << history_file_ << ": "
                    << std::strerror(errno) << std::endl;
        return false;
    }

    for (const auto &entry : session.recent_history()) {
        file << entry << '\n';
    }

    file.flush();
    if (!file) {
        diagnostics << "cmdterm: warning: could not save history to " << history_file_ << std::endl;
        return false;
    }

    return true;
}

void HistoryManager::record_input(const std::string &input) const {
    if (input.empty()) {
        return;
    }

    if (history_length == 0) {
        add_history(input.c_str());
        return;
    }

    const HIST_ENTRY *last_entry = history_get(history_base + history_length - 1);
    if (last_entry == nullptr || std::strcmp(input.c_str(), last_entry->line) != 0) {
        add_history(input.c_str());
    }
}

} // namespace cmdterm
