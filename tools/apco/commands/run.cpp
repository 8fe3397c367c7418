/**
 * apptainer-compose CLI - run command
 *
 * Run one service with ad-hoc arguments.
 */

#include "../pipeline.hpp"
#include <CLI/CLI.hpp>

namespace apco::cli::commands {

void setup_run(CLI::App* app, GlobalOptions& opts) {
    static bool writable_tmpfs = false;

    app->add_flag("--writable-tmpfs", writable_tmpfs,
                  "Use a writable temporary overlay for the container");

    // Parsing stops at the service name; everything from there on is passed
    // through untouched, container flags included
    app->prefix_command();
    app->footer("Usage: run [--writable-tmpfs] SERVICE [ARGS...]");

    app->callback([&opts, app]() {
        auto request = make_run_request(app->remaining(), writable_tmpfs);
        if (!request) {
            print_error("run requires a service name", opts.json, nullptr, ErrorKind::MissingField);
            std::exit(1);
        }
        std::exit(run_pipeline(opts, *request));
    });
}

} // namespace apco::cli::commands
