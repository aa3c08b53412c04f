#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/command.hpp"

namespace cmdterm {

struct ParseError {
    std::string message;
};

class Tokenizer {
  public:
    [[nodiscard]] std::expected<std::vector<std::string>, ParseError> tokenize(std::string_view input) const;
    // No words yields an empty optional. An empty first word such as `""` is
    // still a command, with an empty name.
    [[nodiscard]] std::expected<std::optional<Command>, ParseError> parse_command(std::string_view input) const;
};

} // namespace cmdterm
