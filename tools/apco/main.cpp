/**
 * apptainer-compose CLI - Entry Point
 *
 * Run compose services and Dockerfile builds with Apptainer.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace apco::cli::commands {
    void setup_build(CLI::App* app, GlobalOptions& opts);
    void setup_run(CLI::App* app, GlobalOptions& opts);
    void setup_up(CLI::App* app, GlobalOptions& opts);
    void setup_config(CLI::App* app, GlobalOptions& opts);
    void setup_convert(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace apco::cli;

    CLI::App app{"apptainer-compose - run compose services with Apptainer"};
    app.set_version_flag("-V,--version", APCO_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("-f,--file", opts.file, "Compose file (default: compose.yaml)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");
    app.add_flag("--dry-run", opts.dry_run, "Print commands without running them");
    app.add_flag("--strict", opts.strict, "Treat every warning as an error");

    // Logging is configured once the global flags are known, before any
    // subcommand callback runs
    app.parse_complete_callback([&opts]() { init_logging(opts); });

    // Commands
    auto* build_cmd = app.add_subcommand("build", "Build services that have a build directive");
    commands::setup_build(build_cmd, opts);

    auto* run_cmd = app.add_subcommand("run", "Run a service with ad-hoc arguments");
    commands::setup_run(run_cmd, opts);

    auto* up_cmd = app.add_subcommand("up", "Run services, building them first if needed");
    commands::setup_up(up_cmd, opts);

    auto* config_cmd = app.add_subcommand("config", "Print the resolved services as JSON");
    commands::setup_config(config_cmd, opts);

    auto* convert_cmd = app.add_subcommand("convert", "Translate a Dockerfile into a definition file");
    commands::setup_convert(convert_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
