#include "apco/command.hpp"

namespace apco {

const char* action_to_string(Action action) {
    switch (action) {
        case Action::Build: return "build";
        case Action::Run: return "run";
        case Action::Up: return "up";
        default: return "up";
    }
}

std::optional<Action> parse_action(const std::string& s) {
    if (s == "build") return Action::Build;
    if (s == "run") return Action::Run;
    if (s == "up") return Action::Up;
    return std::nullopt;
}

std::vector<std::string> synthesize_command(const Service& service, const CommandOptions& options) {
    std::vector<std::string> argv{options.binary};

    if (options.action == Action::Build) {
        argv.insert(argv.end(), {"build", "-F", service.sif_file, service.def_file});
        return argv;
    }

    argv.push_back(service.command.empty() ? "run" : "exec");

    if (options.writable_tmpfs) {
        argv.push_back("--writable-tmpfs");
    }
    for (const auto& volume : service.volumes) {
        argv.push_back("--bind");
        argv.push_back(volume.second);
    }
    for (const auto& [name, value] : service.environment) {
        argv.push_back("--env");
        argv.push_back(name + "=" + value);
    }

    argv.push_back(service.run_image());

    const auto& trailing = (options.action == Action::Run && !options.run_args.empty())
                               ? options.run_args
                               : service.command;
    argv.insert(argv.end(), trailing.begin(), trailing.end());
    return argv;
}

} // namespace apco
