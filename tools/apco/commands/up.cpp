/**
 * apptainer-compose CLI - up command
 *
 * Run services as configured, building any that are not built yet.
 */

#include "../pipeline.hpp"
#include <CLI/CLI.hpp>

namespace apco::cli::commands {

namespace {

struct UpOptions {
    std::vector<std::string> services;
    bool writable_tmpfs = false;
};

int cmd_up(const GlobalOptions& opts, const UpOptions& up_opts) {
    PlanRequest request;
    request.action = Action::Up;
    request.services = up_opts.services;
    request.writable_tmpfs = up_opts.writable_tmpfs;
    return run_pipeline(opts, request);
}

} // anonymous namespace

void setup_up(CLI::App* app, GlobalOptions& opts) {
    static UpOptions up_opts;

    app->add_flag("--writable-tmpfs", up_opts.writable_tmpfs,
                  "Use a writable temporary overlay for the container");
    app->add_option("services", up_opts.services, "Services to start (default: all)");

    app->callback([&opts]() {
        std::exit(cmd_up(opts, up_opts));
    });
}

} // namespace apco::cli::commands
