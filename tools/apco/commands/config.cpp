/**
 * apptainer-compose CLI - config command
 *
 * Print the resolved services (after extends) as JSON.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace apco::cli::commands {

namespace {

nlohmann::json service_to_json(const Service& service) {
    nlohmann::json j;
    j["name"] = service.name;
    if (!service.image.empty()) j["image"] = service.image;
    if (service.has_build()) {
        j["build"] = service.build;
        j["def_file"] = service.def_file;
        j["sif_file"] = service.sif_file;
    }
    if (!service.command.empty()) j["command"] = service.command;

    nlohmann::json volumes = nlohmann::json::array();
    for (const auto& [container, spec] : service.volumes) {
        volumes.push_back({{"target", container}, {"bind", spec}});
    }
    j["volumes"] = volumes;

    nlohmann::json environment = nlohmann::json::object();
    for (const auto& [name, value] : service.environment) {
        environment[name] = value;
    }
    j["environment"] = environment;
    return j;
}

int cmd_config(const GlobalOptions& opts) {
    std::string compose_path = resolve_compose_file(opts.file);
    WarningCollector collector = make_warning_collector(opts);

    auto parsed = parse_compose_file(compose_path);
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

    nlohmann::json services = nlohmann::json::array();
    for (const auto& service : parsed.services) {
        services.push_back(service_to_json(service));
    }

    nlohmann::json j;
    j["file"] = compose_path;
    j["services"] = services;
    if (opts.json) {
        j["ok"] = true;
        j["warnings"] = warnings_to_json(collector.get_warnings());
    }
    output_json(j);
    return 0;
}

} // anonymous namespace

void setup_config(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_config(opts));
    });
}

} // namespace apco::cli::commands
