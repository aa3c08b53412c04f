#include "app/app_config.hpp"

#include <cstdlib>
#include <format>
#include <string_view>

#include <unistd.h>

#include "core/path_resolver.hpp"

namespace cmdterm {

std::string default_history_file() {
    if (const char *histfile = std::getenv("HISTFILE"); histfile != nullptr && *histfile != '\0') {
        return histfile;
    }

    return PathResolver::home_directory() + "/.cmdterm_history";
}

std::expected<AppConfig, std::string> load_config(std::span<const char *const> args) {
    AppConfig config;
    config.history_file = default_history_file();
    config.interactive = ::isatty(STDIN_FILENO) == 1;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            continue;
        }

        if (arg == "-c") {
            if (i + 1 >= args.size()) {
                return std::unexpected(std::string("option -c requires an argument"));
            }

            config.command = args[++i];
            continue;
        }

        return std::unexpected(std::format("unknown option: {}", arg));
    }

    return config;
}

std::string usage(const std::string &program) {
    return std::format(
        "Usage: {} [-c <command line>]\n"
        "\n"
        "Interactive command interpreter. Reads lines from the terminal, or from\n"
        "standard input when it is not a terminal.\n"
        "\n"
        "  -c <line>   execute <line> and exit with its status\n"
        "  -h, --help  show this message\n"
        "\n"
        "History is kept in $HISTFILE, or ~/.cmdterm_history when unset.",
        program);
}

} // namespace cmdterm
