#include "core/tokenizer.hpp"

#include <cctype>
#include <iterator>
#include <string>
#include <utility>

namespace cmdterm {

namespace {

[[nodiscard]] bool escapable_in_double_quotes(char c) noexcept {
    return c == '\\' || c == '"' || c == '$' || c == '`' || c == '\n';
}

} // namespace

std::expected<std::vector<std::string>, ParseError> Tokenizer::tokenize(std::string_view input) const {
    std::vector<std::string> tokens;
    std::string token;

    bool single_quoted = false;
    bool double_quoted = false;
    bool escaped = false;
    // A quoted empty string ("" or '') still yields a token.
    bool token_started = false;

    auto flush_token = [&]() {
        if (token_started) {
            tokens.push_back(std::move(token));
            token.clear();
            token_started = false;
        }
    };

    for (const char current : input) {
        if (escaped) {
            if (double_quoted && !escapable_in_double_quotes(current)) {
                token.push_back('\\');
            }
            token.push_back(current);
            token_started = true;
            escaped = false;
            continue;
        }

        if (current == '\\' && !single_quoted) {
            escaped = true;
            continue;
        }

        if (current == '\'' && !double_quoted) {
            single_quoted = !single_quoted;
            token_started = true;
            continue;
        }

        if (current == '"' && !single_quoted) {
            double_quoted = !double_quoted;
            token_started = true;
            continue;
        }

        if (!single_quoted && !double_quoted && std::isspace(static_cast<unsigned char>(current))) {
            flush_token();
            continue;
        }

        token.push_back(current);
        token_started = true;
    }

    if (escaped) {
        return std::unexpected(ParseError{"No escaped character"});
    }

    if (single_quoted || double_quoted) {
        return std::unexpected(ParseError{"No closing quotation"});
    }

    flush_token();
    return tokens;
}

std::expected<std::optional<Command>, ParseError> Tokenizer::parse_command(std::string_view input) const {
    auto tokens = tokenize(input);
    if (!tokens.has_value()) {
        return std::unexpected(std::move(tokens.error()));
    }

    if (tokens->empty()) {
        return std::nullopt;
    }

    Command command;

    command.name = std::move(tokens->front());
    command.args.assign(
        std::make_move_iterator(tokens->begin() + 1), std::make_move_iterator(tokens->end()));
    return command;
}

} // namespace cmdterm
