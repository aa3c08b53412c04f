#include "translation/nl_translator.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <regex>

#include "core/chain_splitter.hpp"

namespace cmdterm {

namespace {

const std::regex kCreateFolder(R"(create (a )?(folder|directory) called (\w[\w.-]*))");
const std::regex kMoveInto(R"(move (.+) into (?:the )?folder called (\w[\w.-]*)|move (.+) into (\w[\w.-]*))");
const std::regex kMoveSource(R"(move ([\w.-]+) into)");
const std::regex kMoveTo(R"(move ([\w.-]+) to ([\w./-]+))");
const std::regex kDelete(R"(delete (file )?([\w.-]+))");

[[nodiscard]] std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

} // namespace

std::string NlTranslator::translate(std::string_view text) const {
    const std::string input = lower(trim(text));
    std::smatch match;

    if (std::regex_search(input, match, kCreateFolder)) {
        const std::string name = match[3].str();

        if (std::regex_search(input, kMoveInto)) {
            std::smatch source;
            if (std::regex_search(input, source, kMoveSource)) {
                return std::format("mkdir {} && mv {} {}", name, source[1].str(), name);
            }
        }

        return std::format("mkdir {}", name);
    }

    if (std::regex_search(input, match, kMoveTo)) {
        return std::format("mv {} {}", match[1].str(), match[2].str());
    }

    if (std::regex_search(input, match, kDelete)) {
        return std::format("rm {}", match[2].str());
    }

    return {};
}

} // namespace cmdterm
