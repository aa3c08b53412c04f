#pragma once

#include <iosfwd>
#include <string>

namespace cmdterm {

class Session;

// Persists session history as newline-delimited lines and mirrors it into
// readline's in-memory history for recall.
class HistoryManager {
  public:
    explicit HistoryManager(std::string history_file);

    // Missing file is not an error. Warnings go to `diagnostics`.
    bool load(Session &session, std::ostream &diagnostics) const;
    // Keeps the most recent kHistoryWindow entries.
    bool save(const Session &session, std::ostream &diagnostics) const;

    void record_input(const std::string &input) const;

    [[nodiscard]] const std::string &history_file() const noexcept { return history_file_; }

  private:
    std::string history_file_;
};

} // namespace cmdterm
