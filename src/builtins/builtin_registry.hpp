#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "core/command.hpp"
#include "translation/nl_translator.hpp"

namespace cmdterm {

class Session;
class StatsProvider;

enum class BuiltinKind {
    Ls,
    Cls,
    Pwd,
    Cd,
    Mkdir,
    Rm,
    Rmdir,
    Cat,
    Echo,
    Touch,
    Mv,
    Cp,
    Help,
    Exit,
    Cpu,
    Mem,
    Ps,
    Top,
    History,
    Nlp,
};

// Thrown by a builtin when the whole operation fails; reported by the registry
// as status 1.
class BuiltinError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class BuiltinRegistry {
  public:
    using Args = std::vector<std::string>;
    // Runs a full input line; used by `nlp` to execute its translation.
    using LineExecutor = std::function<Outcome(const std::string &line, Session &session)>;

    static constexpr std::size_t kProcessLimit = 20;

    BuiltinRegistry(StatsProvider *stats_provider, LineExecutor line_executor);

    [[nodiscard]] static std::optional<BuiltinKind> lookup(std::string_view command);
    [[nodiscard]] bool is_builtin(std::string_view command) const;

    // Never throws for builtin failures: they come back as status 1 with
    // "Error executing builtin '<name>': <details>".
    [[nodiscard]] Outcome execute(const Command &command, Session &session) const;

    [[nodiscard]] std::set<std::string> names() const;

  private:
    StatsProvider *stats_provider_;
    LineExecutor line_executor_;
    NlTranslator translator_;

    [[nodiscard]] Outcome dispatch(BuiltinKind kind, const Args &args, Session &session) const;

    [[nodiscard]] ExecutionResult builtin_ls(const Args &args, const Session &session) const;
    [[nodiscard]] ExecutionResult builtin_cls(const Args &args) const;
    [[nodiscard]] ExecutionResult builtin_pwd(const Args &args, const Session &session) const;
    [[nodiscard]] ExecutionResult builtin_cd(const Args &args, Session &session) const;
    [[nodiscard]] ExecutionResult builtin_mkdir(const Args &args, const Session &session) const;
    [[nodiscard]] ExecutionResult builtin_rm(const Args &args, const Session &session) const;
    [[nodiscard]] ExecutionResult builtin_rmdir(const Args &args, const Session &session) const;
    [[nodiscard]] ExecutionResult builtin_cat(const Args &args, const Session &session) const;
    [[nodiscard]] ExecutionResult builtin_echo(const Args &args) const;
    [[nodiscard]] ExecutionResult builtin_touch(const Args &args, const Session &session) const;
    [[nodiscard]] ExecutionResult builtin_mv(const Args &args, const Session &session) const;
    [[nodiscard]] ExecutionResult builtin_cp(const Args &args, const Session &session) const;
    [[nodiscard]] ExecutionResult builtin_help(const Args &args) const;
    [[nodiscard]] ExecutionResult builtin_history(const Args &args, const Session &session) const;
    [[nodiscard]] Outcome builtin_nlp(const Args &args, Session &session) const;

    [[nodiscard]] ExecutionResult builtin_cpu(const Args &args) const;
    [[nodiscard]] ExecutionResult builtin_mem(const Args &args) const;
    [[nodiscard]] ExecutionResult builtin_ps(const Args &args) const;
    [[nodiscard]] ExecutionResult builtin_top(const Args &args) const;
};

} // namespace cmdterm
