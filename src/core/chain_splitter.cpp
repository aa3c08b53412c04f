#include "core/chain_splitter.hpp"

#include <cctype>
#include <utility>

namespace cmdterm {

std::string trim(std::string_view text) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    std::size_t begin = 0;
    while (begin < text.size() && is_space(text[begin])) {
        ++begin;
    }

    std::size_t end = text.size();
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }

    return std::string(text.substr(begin, end - begin));
}

CommandChain ChainSplitter::split(std::string_view line) const {
    CommandChain chain;
    std::string current;

    bool single_quoted = false;
    bool double_quoted = false;
    bool escaped = false;

    auto close_link = [&](Joiner joiner) {
        auto text = trim(current);
        current.clear();

        if (!text.empty()) {
            chain.links.push_back(ChainLink{.text = std::move(text), .joiner = joiner});
        } else if (!chain.links.empty() && joiner != Joiner::None) {
            // An empty link is dropped; the operator that closed it replaces the
            // joiner of the previous link.
            chain.links.back().joiner = joiner;
        }
    };

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];

        if (escaped) {
            current.push_back(c);
            escaped = false;
            continue;
        }

        if (c == '\\' && !single_quoted) {
            current.push_back(c);
            escaped = true;
            continue;
        }

        if (c == '\'' && !double_quoted) {
            single_quoted = !single_quoted;
        } else if (c == '"' && !single_quoted) {
            double_quoted = !double_quoted;
        }

        if (!single_quoted && !double_quoted) {
            if (c == '&' && i + 1 < line.size() && line[i + 1] == '&') {
                close_link(Joiner::And);
                ++i;
                continue;
            }

            if (c == ';') {
                close_link(Joiner::Sequence);
                continue;
            }
        }

        current.push_back(c);
    }

    close_link(Joiner::None);

    if (!chain.links.empty()) {
        chain.links.back().joiner = Joiner::None;
    }

    return chain;
}

} // namespace cmdterm
