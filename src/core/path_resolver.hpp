#pragma once

#include <functional>
#include <set>
#include <string>
#include <string_view>

namespace cmdterm {

class PathResolver {
  public:
    // Expands a leading `~`, anchors relative paths at `working_directory` and
    // collapses `.`/`..` segments. No filesystem access beyond the home lookup.
    [[nodiscard]] static std::string resolve(std::string_view path, std::string_view working_directory);
    [[nodiscard]] static std::string home_directory();

    [[nodiscard]] std::string find_command_path(std::string_view command, std::string_view working_directory) const;
    [[nodiscard]] std::set<std::string> executable_candidates(std::string_view prefix) const;

  private:
    void scan_path_executables(
        std::string_view prefix,
        const std::function<bool(std::string_view filename, std::string_view full_path)> &callback) const;
};

} // namespace cmdterm
