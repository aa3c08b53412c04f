#include "execution/execution_engine.hpp"

#include <format>
#include <utility>

#include "core/session.hpp"

namespace cmdterm {

ExecutionEngine::ExecutionEngine(StatsProvider *stats_provider)
    : path_resolver_(),
      chain_splitter_(),
      tokenizer_(),
      builtin_registry_(
          stats_provider, [this](const std::string &line, Session &session) { return execute(line, session); }),
      process_executor_(path_resolver_) {}

Outcome ExecutionEngine::execute(const std::string &line, Session &session) {
    if (trim(line).empty()) {
        return ExecutionResult{};
    }

    session.record(line);
    return evaluate_chain(chain_splitter_.split(line), session);
}

Outcome ExecutionEngine::evaluate_chain(const CommandChain &chain, Session &session) {
    Outcome last = ExecutionResult{};

    for (const auto &link : chain.links) {
        last = execute_command(link.text, session);

        if (is_termination(last)) {
            return last;
        }

        if (link.joiner == Joiner::And && std::get<ExecutionResult>(last).status != 0) {
            break;
        }
    }

    return last;
}

Outcome ExecutionEngine::execute_command(const std::string &text, Session &session) {
    auto command = tokenizer_.parse_command(text);
    if (!command.has_value()) {
        return ExecutionResult{.status = 1, .output = std::format("Error parsing command: {}", command.error().message)};
    }

    if (!command->has_value()) {
        return ExecutionResult{};
    }

    const Command &parsed = **command;
    if (builtin_registry_.is_builtin(parsed.name)) {
        return builtin_registry_.execute(parsed, session);
    }

    // An empty name falls through to the executor and is reported as not found.
    return process_executor_.run(parsed, session.working_directory());
}

} // namespace cmdterm
