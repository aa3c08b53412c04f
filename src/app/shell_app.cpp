#include "app/shell_app.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <variant>

#include <sys/utsname.h>

namespace cmdterm {

namespace {

[[nodiscard]] std::unique_ptr<ProcStatsProvider> make_stats_provider() {
    auto provider = std::make_unique<ProcStatsProvider>();
    if (!provider->available()) {
        return nullptr;
    }

    return provider;
}

[[nodiscard]] std::string banner() {
    utsname info{};
    if (::uname(&info) != 0) {
        return "cmdterm - type 'help' for commands";
    }

    return std::string("cmdterm - ") + info.sysname + " " + info.release + " - type 'help' for commands";
}

} // namespace

ShellApp::ShellApp(AppConfig config)
    : config_(std::move(config)),
      stats_provider_(make_stats_provider()),
      engine_(stats_provider_.get()),
      session_(Session::from_current_directory()),
      history_manager_(config_.history_file),
      completion_engine_(engine_.builtins(), engine_.path_resolver(), session_) {}

int ShellApp::run() {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    if (config_.command.has_value()) {
        return run_command(*config_.command, std::cout);
    }

    history_manager_.load(session_, std::cerr);

    int status = 0;
    if (config_.interactive) {
        completion_engine_.install();
        std::cout << banner() << std::endl;

        ReadlineLineSource source([this] { return prompt(); });
        status = run_loop(source, std::cout);
    } else {
        StreamLineSource source(std::cin);
        status = run_loop(source, std::cout);
    }

    history_manager_.save(session_, std::cerr);
    return status;
}

int ShellApp::run_loop(LineSource &source, std::ostream &out) {
    int last_status = 0;

    while (true) {
        const auto line = source.next_line();
        if (!line.has_value()) {
            if (config_.interactive) {
                out << "\nReceived EOF. Exiting." << std::endl;
            }
            break;
        }

        if (config_.interactive) {
            history_manager_.record_input(*line);
        }

        const Outcome outcome = engine_.execute(*line, session_);
        if (is_termination(outcome)) {
            if (config_.interactive) {
                out << "Exiting cmdterm. History saved." << std::endl;
            }
            break;
        }

        const auto &result = std::get<ExecutionResult>(outcome);
        if (!result.output.empty()) {
            out << result.output << std::endl;
        }
        last_status = result.status;
    }

    return last_status;
}

int ShellApp::run_command(const std::string &line, std::ostream &out) {
    const Outcome outcome = engine_.execute(line, session_);
    if (is_termination(outcome)) {
        return 0;
    }

    const auto &result = std::get<ExecutionResult>(outcome);
    if (!result.output.empty()) {
        out << result.output << std::endl;
    }

    return result.status;
}

std::string ShellApp::prompt() const {
    const std::string name = std::filesystem::path(session_.working_directory()).filename().string();
    return name.empty() ? std::string("$ ") : name + "$ ";
}

} // namespace cmdterm
