/**
 * apptainer-compose CLI - compose -> plan -> execute
 */

#include "pipeline.hpp"

#include <apco/exec.hpp>

namespace apco::cli {

namespace {

int finish(const GlobalOptions& opts, const WarningCollector& collector,
           const nlohmann::json& commands, int exit_code) {
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = exit_code == 0;
        j["exit_code"] = exit_code;
        j["commands"] = commands;
        j["warnings"] = warnings_to_json(collector.get_warnings());
        output_json(j);
    }
    return exit_code;
}

} // namespace

int run_pipeline(const GlobalOptions& opts, PlanRequest request) {
    std::string compose_path = resolve_compose_file(opts.file);
    spdlog::debug("Using compose file {}", compose_path);

    WarningCollector collector = make_warning_collector(opts);

    auto parsed = parse_compose_file(compose_path);
    collector.emit_all(parsed.warnings);
    if (!parsed.ok) {
        print_warnings(collector, opts.json);
        print_error(parsed.error, opts.json, &collector, parsed.kind);
        return 1;
    }

    request.binary = resolve_runtime_binary();
    spdlog::debug("Planning {} for {} service(s)", action_to_string(request.action),
                  request.services.empty() ? parsed.services.size() : request.services.size());
    auto plan = build_plan(parsed.services, request);
    collector.emit_all(plan.warnings);
    print_warnings(collector, opts.json);
    if (!plan.ok) {
        print_error(plan.error, opts.json, &collector, plan.kind);
        return 1;
    }
    if (collector.has_errors()) {
        print_error("warnings escalated to errors by policy", opts.json, &collector);
        return 1;
    }

    nlohmann::json commands = nlohmann::json::array();

    for (const auto& step : plan.steps) {
        // Definition files are written in dry-run mode too
        if (step.kind == PlanStep::Kind::WriteDefinition) {
            auto written = atomic_write_file(step.path, step.content);
            if (!written.ok) {
                print_error("failed to write " + step.path + ": " + written.error, opts.json,
                            &collector, ErrorKind::Io);
                return 1;
            }
            spdlog::info("Wrote {}", step.path);
            continue;
        }

        commands.push_back(nlohmann::json(step.argv));
        std::string line = exec::format_command_line(step.argv);

        if (opts.dry_run) {
            if (!opts.json) {
                std::cout << line << std::endl;
            }
            continue;
        }

        if (!opts.quiet) {
            spdlog::info("{}", line);
        }
        auto result = exec::run_and_wait(step.argv);
        if (!result.ok) {
            print_error(result.error, opts.json, &collector, ErrorKind::Exec);
            return result.exit_code > 0 ? result.exit_code : 1;
        }
        if (result.exit_code != 0) {
            spdlog::debug("{} exited with status {}", step.argv.front(), result.exit_code);
            return finish(opts, collector, commands, result.exit_code);
        }
    }

    return finish(opts, collector, commands, 0);
}

std::optional<PlanRequest> make_run_request(const std::vector<std::string>& remaining,
                                            bool writable_tmpfs) {
    auto it = remaining.begin();
    if (it != remaining.end() && *it == "--") ++it;
    if (it == remaining.end() || it->empty()) {
        return std::nullopt;
    }

    PlanRequest request;
    request.action = Action::Run;
    request.services = {*it++};
    request.writable_tmpfs = writable_tmpfs;
    if (it != remaining.end() && *it == "--") ++it;
    request.run_args.assign(it, remaining.end());
    return request;
}

} // namespace apco::cli
