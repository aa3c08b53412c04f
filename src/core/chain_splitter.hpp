#pragma once

#include <string>
#include <string_view>

#include "core/command.hpp"

namespace cmdterm {

// Splits a raw line on the `;` and `&&` operators. Operators inside quotes or
// escaped with a backslash are part of the sub-command text.
class ChainSplitter {
  public:
    [[nodiscard]] CommandChain split(std::string_view line) const;
};

[[nodiscard]] std::string trim(std::string_view text);

} // namespace cmdterm
