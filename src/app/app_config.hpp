#pragma once

#include <expected>
#include <optional>
#include <span>
#include <string>

namespace cmdterm {

struct AppConfig {
    std::string history_file;
    bool interactive{false};
    // Set by `-c <line>`: run one line and exit with its status.
    std::optional<std::string> command;
    bool show_help{false};
};

[[nodiscard]] std::string default_history_file();

// Reads the environment (HISTFILE, HOME, whether stdin is a terminal) and the
// command-line arguments, excluding the program name.
[[nodiscard]] std::expected<AppConfig, std::string> load_config(std::span<const char *const> args);

[[nodiscard]] std::string usage(const std::string &program);

} // namespace cmdterm
