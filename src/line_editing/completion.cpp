#include "line_editing/completion.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

#include <readline/readline.h>

#include "builtins/builtin_registry.hpp"
#include "core/path_resolver.hpp"
#include "core/session.hpp"

namespace cmdterm {

namespace fs = std::filesystem;

namespace {

bool completing_command_word = false;

} // namespace

CompletionEngine *CompletionEngine::instance_ = nullptr;

CompletionEngine::CompletionEngine(
    const BuiltinRegistry &builtin_registry, const PathResolver &path_resolver, const Session &session)
    : builtin_registry_(builtin_registry), path_resolver_(path_resolver), session_(session) {}

void CompletionEngine::install() {
    instance_ = this;
    rl_attempted_completion_function = &CompletionEngine::completion_callback;
}

char **CompletionEngine::completion_callback(const char *text, int start, int /*end*/) {
    rl_attempted_completion_over = 1;

    if (instance_ == nullptr) {
        return nullptr;
    }

    completing_command_word = start == 0;
    return rl_completion_matches(text, &CompletionEngine::generator_callback);
}

char *CompletionEngine::generator_callback(const char *text, int state) {
    static std::set<std::string> matches;
    static std::set<std::string>::iterator iterator;

    if (instance_ == nullptr) {
        return nullptr;
    }

    if (state == 0) {
        matches = instance_->collect_matches(text, completing_command_word);
        iterator = matches.begin();
    }

    if (iterator == matches.end()) {
        return nullptr;
    }

    return ::strdup((iterator++)->c_str());
}

std::set<std::string> CompletionEngine::collect_matches(const std::string &prefix, bool command_position) const {
    std::set<std::string> matches;

    if (command_position) {
        matches = path_resolver_.executable_candidates(prefix);
    }

    for (const auto &builtin : builtin_registry_.names()) {
        if (builtin.starts_with(prefix)) {
            matches.insert(builtin);
        }
    }

    std::error_code ec;
    for (fs::directory_iterator it(session_.working_directory(), ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.starts_with(prefix)) {
            matches.insert(name);
        }
    }

    return matches;
}

} // namespace cmdterm
