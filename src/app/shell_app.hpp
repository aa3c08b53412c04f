#pragma once

#include <iosfwd>
#include <memory>
#include <string>

#include "app/app_config.hpp"
#include "core/session.hpp"
#include "execution/execution_engine.hpp"
#include "history/history_manager.hpp"
#include "line_editing/completion.hpp"
#include "line_editing/line_source.hpp"
#include "stats/stats_provider.hpp"

namespace cmdterm {

class ShellApp {
  public:
    explicit ShellApp(AppConfig config);

    int run();

    // Drives the read/execute/print loop until the input ends or a builtin
    // asks to terminate. Returns the status of the last executed line.
    int run_loop(LineSource &source, std::ostream &out);
    int run_command(const std::string &line, std::ostream &out);

    [[nodiscard]] const Session &session() const noexcept { return session_; }

  private:
    AppConfig config_;
    std::unique_ptr<ProcStatsProvider> stats_provider_;
    ExecutionEngine engine_;
    Session session_;
    HistoryManager history_manager_;
    CompletionEngine completion_engine_;

    [[nodiscard]] std::string prompt() const;
};

} // namespace cmdterm
