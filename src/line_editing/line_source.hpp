#pragma once

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace cmdterm {

// Supplies raw input lines to the interpreter loop. An empty optional means
// the input has ended.
class LineSource {
  public:
    virtual ~LineSource() = default;

    [[nodiscard]] virtual std::optional<std::string> next_line() = 0;
};

class ReadlineLineSource final : public LineSource {
  public:
    using PromptProvider = std::function<std::string()>;

    explicit ReadlineLineSource(PromptProvider prompt);

    [[nodiscard]] std::optional<std::string> next_line() override;

  private:
    PromptProvider prompt_;
};

class StreamLineSource final : public LineSource {
  public:
    explicit StreamLineSource(std::istream &in);

    [[nodiscard]] std::optional<std::string> next_line() override;

  private:
    std::istream &in_;
};

} // namespace cmdterm
