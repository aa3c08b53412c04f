#pragma once

#include <set>
#include <string>

namespace cmdterm {

class BuiltinRegistry;
class PathResolver;
class Session;

class CompletionEngine {
  public:
    CompletionEngine(const BuiltinRegistry &builtin_registry, const PathResolver &path_resolver, const Session &session);

    void install();

    // Builtin names and entries of the working directory starting with
    // `prefix`; PATH executables as well when completing the command word.
    [[nodiscard]] std::set<std::string> collect_matches(const std::string &prefix, bool command_position) const;

  private:
    const BuiltinRegistry &builtin_registry_;
    const PathResolver &path_resolver_;
    const Session &session_;

    static CompletionEngine *instance_;

    static char **completion_callback(const char *text, int start, int end);
    static char *generator_callback(const char *text, int state);
};

} // namespace cmdterm
