#pragma once

#include <string>
#include <variant>
#include <vector>

namespace cmdterm {

enum class Joiner {
    None,
    Sequence,
    And,
};

// One sub-command of an input line and the operator that follows it.
struct ChainLink {
    std::string text;
    Joiner joiner{Joiner::None};
};

struct CommandChain {
    std::vector<ChainLink> links;

    [[nodiscard]] bool empty() const noexcept { return links.empty(); }
};

struct Command {
    std::string name;
    std::vector<std::string> args;
};

struct ExecutionResult {
    int status{0};
    std::string output;
};

inline constexpr int kCommandNotFoundStatus = 127;

struct TerminationSignal {};

using Outcome = std::variant<ExecutionResult, TerminationSignal>;

[[nodiscard]] inline bool is_termination(const Outcome &outcome) noexcept {
    return std::holds_alternative<TerminationSignal>(outcome);
}

} // namespace cmdterm
