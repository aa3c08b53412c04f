#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "app/app_config.hpp"
#include "app/shell_app.hpp"

int main(int argc, char *argv[]) {
    const std::string program = argc > 0 ? argv[0] : "cmdterm";
    const std::vector<const char *> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto config = cmdterm::load_config(args);
    if (!config.has_value()) {
        std::cerr << "cmdterm: " << config.error() << '\n' << cmdterm::usage(program) << std::endl;
        return 2;
    }

    if (config->show_help) {
        std::cout << cmdterm::usage(program) << std::endl;
        return 0;
    }

    try {
        cmdterm::ShellApp app(std::move(*config));
        return app.run();
    } catch (const std::exception &e) {
        std::cerr << "cmdterm: " << e.what() << std::endl;
        return 1;
    }
}
