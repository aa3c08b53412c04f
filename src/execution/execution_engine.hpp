#pragma once

#include <string>

#include "builtins/builtin_registry.hpp"
#include "core/chain_splitter.hpp"
#include "core/command.hpp"
#include "core/path_resolver.hpp"
#include "core/tokenizer.hpp"
#include "execution/process_executor.hpp"

namespace cmdterm {

class Session;
class StatsProvider;

class ExecutionEngine {
  public:
    explicit ExecutionEngine(StatsProvider *stats_provider = nullptr);

    ExecutionEngine(const ExecutionEngine &) = delete;
    ExecutionEngine &operator=(const ExecutionEngine &) = delete;

    // Records `line` in the session history, then evaluates it link by link.
    // A blank line is a no-op returning (0, "").
    [[nodiscard]] Outcome execute(const std::string &line, Session &session);

    // Evaluates one sub-command without touching history.
    [[nodiscard]] Outcome execute_command(const std::string &text, Session &session);

    [[nodiscard]] const BuiltinRegistry &builtins() const noexcept { return builtin_registry_; }
    [[nodiscard]] const PathResolver &path_resolver() const noexcept { return path_resolver_; }

  private:
    PathResolver path_resolver_;
    ChainSplitter chain_splitter_;
    Tokenizer tokenizer_;
    BuiltinRegistry builtin_registry_;
    ProcessExecutor process_executor_;

    [[nodiscard]] Outcome evaluate_chain(const CommandChain &chain, Session &session);
};

} // namespace cmdterm
