#pragma once

#include <string>
#include <string_view>

namespace cmdterm {

// Maps a handful of English phrasings to command lines. Returns an empty
// string when nothing matches.
class NlTranslator {
  public:
    [[nodiscard]] std::string translate(std::string_view text) const;
};

} // namespace cmdterm
