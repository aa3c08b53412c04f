#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace cmdterm {

inline constexpr std::size_t kHistoryWindow = 1000;

class Session {
  public:
    explicit Session(std::string working_directory);

    // Starts in the process working directory.
    static Session from_current_directory();

    [[nodiscard]] const std::string &working_directory() const noexcept { return working_directory_; }

    // Switches to `directory` if it is an existing, accessible directory. The
    // stored path is canonical. Returns false and leaves the session unchanged
    // otherwise.
    bool change_directory(const std::string &directory);

    void record(std::string line);
    [[nodiscard]] const std::vector<std::string> &history() const noexcept { return history_; }
    // Most recent `kHistoryWindow` entries, oldest first.
    [[nodiscard]] std::span<const std::string> recent_history() const noexcept;

  private:
    std::string working_directory_;
    std::vector<std::string> history_;
};

} // namespace cmdterm
