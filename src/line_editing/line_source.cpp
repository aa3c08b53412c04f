#include "line_editing/line_source.hpp"

#include <cstdlib>
#include <istream>
#include <utility>

#include <readline/readline.h>

namespace cmdterm {

ReadlineLineSource::ReadlineLineSource(PromptProvider prompt) : prompt_(std::move(prompt)) {}

std::optional<std::string> ReadlineLineSource::next_line() {
    const std::string prompt = prompt_ ? prompt_() : std::string("$ ");

    char *line = readline(prompt.c_str());
    if (line == nullptr) {
        return std::nullopt;
    }

    std::string input(line);
    std::free(line);
    return input;
}

StreamLineSource::StreamLineSource(std::istream &in) : in_(in) {}

std::optional<std::string> StreamLineSource::next_line() {
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }

    if (line.ends_with('\r')) {
        line.pop_back();
    }

    return line;
}

} // namespace cmdterm
