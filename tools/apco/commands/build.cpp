/**
 * apptainer-compose CLI - build command
 *
 * Translate each service's Dockerfile into a definition file and build it.
 */

#include "../pipeline.hpp"
#include <CLI/CLI.hpp>

namespace apco::cli::commands {

namespace {

struct BuildOptions {
    std::vector<std::string> services;
};

int cmd_build(const GlobalOptions& opts, const BuildOptions& build_opts) {
    PlanRequest request;
    request.action = Action::Build;
    request.services = build_opts.services;
    return run_pipeline(opts, request);
}

} // anonymous namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    static BuildOptions build_opts;

    app->add_option("services", build_opts.services, "Services to build (default: all)");

    app->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts));
    });
}

} // namespace apco::cli::commands
