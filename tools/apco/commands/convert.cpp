/**
 * apptainer-compose CLI - convert command
 *
 * Translate a single Dockerfile into a definition file.
 */

#include "../common.hpp"
#include <apco/dockerfile.hpp>
#include <apco/recipe_writer.hpp>
#include <CLI/CLI.hpp>

namespace apco::cli::commands {

namespace {

struct ConvertOptions {
    std::string dockerfile;
    std::string output;   // -o, stdout when empty
    std::string context;  // --context
};

int cmd_convert(const GlobalOptions& opts, const ConvertOptions& convert_opts) {
    WarningCollector collector = make_warning_collector(opts);

    DockerfileParseOptions parse_opts;
    parse_opts.context_dir = convert_opts.context;
    auto parsed = parse_dockerfile(convert_opts.dockerfile, parse_opts);
    collector.emit_all(parsed.warnings);
    print_warnings(collector, opts.json);
    if (!parsed.ok) {
        print_error(parsed.error, opts.json, &collector, parsed.kind);
        return 1;
    }
    if (collector.has_errors()) {
        print_error("warnings escalated to errors by policy", opts.json, &collector);
        return 1;
    }

    auto rendered = render_recipe(parsed.recipe);
    if (!rendered.ok) {
        print_error(rendered.error, opts.json, &collector, rendered.kind);
        return 1;
    }

    if (!convert_opts.output.empty() && !opts.dry_run) {
        auto written = atomic_write_file(convert_opts.output, rendered.content);
        if (!written.ok) {
            print_error("failed to write " + convert_opts.output + ": " + written.error,
                        opts.json, &collector, ErrorKind::Io);
            return 1;
        }
        spdlog::info("Wrote {}", convert_opts.output);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["stages"] = parsed.recipe.stages.size();
        if (convert_opts.output.empty()) {
            j["content"] = rendered.content;
        } else {
            j["output"] = convert_opts.output;
        }
        j["warnings"] = warnings_to_json(collector.get_warnings());
        output_json(j);
    } else if (convert_opts.output.empty() || opts.dry_run) {
        std::cout << rendered.content;
    }
    return 0;
}

} // anonymous namespace

void setup_convert(CLI::App* app, GlobalOptions& opts) {
    static ConvertOptions convert_opts;

    app->add_option("dockerfile", convert_opts.dockerfile, "Dockerfile to translate")
        ->required()
        ->check(CLI::ExistingFile);
    app->add_option("-o,--output", convert_opts.output, "Definition file to write (default: stdout)");
    app->add_option("--context", convert_opts.context,
                    "Build context directory (default: the Dockerfile's directory)");

    app->callback([&opts]() {
        std::exit(cmd_convert(opts, convert_opts));
    });
}

} // namespace apco::cli::commands
