#include "builtins/builtin_registry.hpp"

#include <array>
#include <format>
#include <string>
#include <utility>

#include "core/path_resolver.hpp"
#include "core/session.hpp"

namespace cmdterm {

namespace {

struct BuiltinEntry {
    std::string_view name;
    BuiltinKind kind;
};

constexpr std::array kBuiltins{
    BuiltinEntry{"ls", BuiltinKind::Ls},
    BuiltinEntry{"cls", BuiltinKind::Cls},
    BuiltinEntry{"pwd", BuiltinKind::Pwd},
    BuiltinEntry{"cd", BuiltinKind::Cd},
    BuiltinEntry{"mkdir", BuiltinKind::Mkdir},
    BuiltinEntry{"rm", BuiltinKind::Rm},
    BuiltinEntry{"rmdir", BuiltinKind::Rmdir},
    BuiltinEntry{"cat", BuiltinKind::Cat},
    BuiltinEntry{"echo", BuiltinKind::Echo},
    BuiltinEntry{"touch", BuiltinKind::Touch},
    BuiltinEntry{"mv", BuiltinKind::Mv},
    BuiltinEntry{"cp", BuiltinKind::Cp},
    BuiltinEntry{"help", BuiltinKind::Help},
    BuiltinEntry{"exit", BuiltinKind::Exit},
    BuiltinEntry{"quit", BuiltinKind::Exit},
    BuiltinEntry{"cpu", BuiltinKind::Cpu},
    BuiltinEntry{"mem", BuiltinKind::Mem},
    BuiltinEntry{"ps", BuiltinKind::Ps},
    BuiltinEntry{"top", BuiltinKind::Top},
    BuiltinEntry{"history", BuiltinKind::History},
    BuiltinEntry{"nlp", BuiltinKind::Nlp},
};

constexpr std::string_view kClearScreen = "\x1b[2J\x1b[H";

} // namespace

BuiltinRegistry::BuiltinRegistry(StatsProvider *stats_provider, LineExecutor line_executor)
    : stats_provider_(stats_provider), line_executor_(std::move(line_executor)) {}

std::optional<BuiltinKind> BuiltinRegistry::lookup(std::string_view command) {
    for (const auto &entry : kBuiltins) {
        if (entry.name == command) {
            return entry.kind;
        }
    }

    return std::nullopt;
}

bool BuiltinRegistry::is_builtin(std::string_view command) const { return lookup(command).has_value(); }

std::set<std::string> BuiltinRegistry::names() const {
    std::set<std::string> result;
    for (const auto &entry : kBuiltins) {
        result.emplace(entry.name);
    }

    return result;
}

Outcome BuiltinRegistry::execute(const Command &command, Session &session) const {
    const auto kind = lookup(command.name);
    if (!kind.has_value()) {
        return ExecutionResult{.status = 1, .output = std::format("{}: not a builtin", command.name)};
    }

    try {
        return dispatch(*kind, command.args, session);
    } catch (const std::exception &e) {
        return ExecutionResult{
            .status = 1, .output = std::format("Error executing builtin '{}': {}", command.name, e.what())};
    }
}

Outcome BuiltinRegistry::dispatch(BuiltinKind kind, const Args &args, Session &session) const {
    switch (kind) {
    case BuiltinKind::Ls:
        return builtin_ls(args, session);
    case BuiltinKind::Cls:
        return builtin_cls(args);
    case BuiltinKind::Pwd:
        return builtin_pwd(args, session);
    case BuiltinKind::Cd:
        return builtin_cd(args, session);
    case BuiltinKind::Mkdir:
        return builtin_mkdir(args, session);
    case BuiltinKind::Rm:
        return builtin_rm(args, session);
    case BuiltinKind::Rmdir:
        return builtin_rmdir(args, session);
    case BuiltinKind::Cat:
        return builtin_cat(args, session);
    case BuiltinKind::Echo:
        return builtin_echo(args);
    case BuiltinKind::Touch:
        return builtin_touch(args, session);
    case BuiltinKind::Mv:
        return builtin_mv(args, session);
    case BuiltinKind::Cp:
        return builtin_cp(args, session);
    case BuiltinKind::Help:
        return builtin_help(args);
    case BuiltinKind::Exit:
        return TerminationSignal{};
    case BuiltinKind::Cpu:
        return builtin_cpu(args);
    case BuiltinKind::Mem:
        return builtin_mem(args);
    case BuiltinKind::Ps:
        return builtin_ps(args);
    case BuiltinKind::Top:
        return builtin_top(args);
    case BuiltinKind::History:
        return builtin_history(args, session);
    case BuiltinKind::Nlp:
        return builtin_nlp(args, session);
    }

    throw BuiltinError("unknown builtin");
}

ExecutionResult BuiltinRegistry::builtin_cls(const Args & /*args*/) const {
    return ExecutionResult{.status = 0, .output = std::string(kClearScreen)};
}

ExecutionResult BuiltinRegistry::builtin_pwd(const Args & /*args*/, const Session &session) const {
    return ExecutionResult{.status = 0, .output = session.working_directory()};
}

ExecutionResult BuiltinRegistry::builtin_cd(const Args &args, Session &session) const {
    const std::string target = args.empty() ? PathResolver::home_directory()
                                            : PathResolver::resolve(args.front(), session.working_directory());

    if (!session.change_directory(target)) {
        return ExecutionResult{.status = 1, .output = std::format("cd: no such directory: {}", target)};
    }

    return ExecutionResult{};
}

ExecutionResult BuiltinRegistry::builtin_echo(const Args &args) const {
    std::string output;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            output.push_back(' ');
        }

        output += args[i];
    }

    return ExecutionResult{.status = 0, .output = std::move(output)};
}

ExecutionResult BuiltinRegistry::builtin_help(const Args & /*args*/) const {
    std::string listing;
    for (const auto &name : names()) {
        if (!listing.empty()) {
            listing.push_back(' ');
        }

        listing += name;
    }

    return ExecutionResult{
        .status = 0,
        .output = std::format("Built-in commands:\n{}\n\nYou can also run system commands.", listing)};
}

ExecutionResult BuiltinRegistry::builtin_history(const Args & /*args*/, const Session &session) const {
    std::string output;
    std::size_t index = 1;

    for (const auto &entry : session.recent_history()) {
        if (!output.empty()) {
            output.push_back('\n');
        }

        output += std::format("{}  {}", index++, entry);
    }

    return ExecutionResult{.status = 0, .output = std::move(output)};
}

Outcome BuiltinRegistry::builtin_nlp(const Args &args, Session &session) const {
    std::string text;
    for (const auto &arg : args) {
        if (!text.empty()) {
            text.push_back(' ');
        }

        text += arg;
    }

    const std::string command = translator_.translate(text);
    if (command.empty()) {
        return ExecutionResult{.status = 0, .output = "Could not interpret natural language command."};
    }

    if (!line_executor_) {
        throw BuiltinError("no command executor available");
    }

    auto outcome = line_executor_(command, session);
    if (is_termination(outcome)) {
        return outcome;
    }

    auto &result = std::get<ExecutionResult>(outcome);
    if (result.output.empty()) {
        result.output = std::format("Executed: {}", command);
    }

    return outcome;
}

} // namespace cmdterm
