#include "apco/plan.hpp"
#include "apco/dockerfile.hpp"
#include "apco/path_utils.hpp"
#include "apco/platform.hpp"
#include "apco/recipe_writer.hpp"

#include <spdlog/spdlog.h>

namespace apco {

namespace {

bool fail(PlanResult& result, ErrorKind kind, const std::string& message) {
    result.kind = kind;
    result.error = message;
    result.steps.clear();
    return false;
}

bool select_services(const std::vector<Service>& services, const PlanRequest& request,
                     std::vector<const Service*>& selected, PlanResult& result) {
    if (request.action == Action::Run && request.services.size() != 1) {
        return fail(result, ErrorKind::MissingField, "run requires exactly one service name");
    }

    if (request.services.empty()) {
        for (const auto& service : services) {
            selected.push_back(&service);
        }
        return true;
    }

    for (const auto& name : request.services) {
        const Service* found = nullptr;
        for (const auto& service : services) {
            if (service.name == name) {
                found = &service;
                break;
            }
        }
        if (!found) {
            return fail(result, ErrorKind::MissingReference, "no such service: " + name);
        }
        selected.push_back(found);
    }
    return true;
}

bool add_build_steps(const Service& service, const PlanRequest& request, PlanResult& result) {
    std::string dockerfile = dockerfile_path(service);
    if (!is_regular_file(dockerfile)) {
        return fail(result, ErrorKind::MissingReference,
                    "service '" + service.name + "': Dockerfile not found: " + dockerfile);
    }

    DockerfileParseOptions options;
    options.context_dir = service.build;
    auto parsed = parse_dockerfile(dockerfile, options);
    result.warnings.insert(result.warnings.end(), parsed.warnings.begin(), parsed.warnings.end());
    if (!parsed.ok) {
        return fail(result, parsed.kind, parsed.error);
    }

    auto rendered = render_recipe(parsed.recipe);
    if (!rendered.ok) {
        return fail(result, rendered.kind, rendered.error);
    }

    PlanStep write;
    write.kind = PlanStep::Kind::WriteDefinition;
    write.service = service.name;
    write.path = service.def_file;
    write.content = std::move(rendered.content);
    result.steps.push_back(std::move(write));

    CommandOptions cmd;
    cmd.action = Action::Build;
    cmd.binary = request.binary;

    PlanStep build;
    build.kind = PlanStep::Kind::Execute;
    build.service = service.name;
    build.argv = synthesize_command(service, cmd);
    result.steps.push_back(std::move(build));
    return true;
}

bool add_run_step(const Service& service, const PlanRequest& request, PlanResult& result) {
    if (service.image.empty() && !service.has_build()) {
        return fail(result, ErrorKind::MissingField,
                    "service '" + service.name + "' has neither image nor build");
    }

    CommandOptions cmd;
    cmd.action = request.action;
    cmd.writable_tmpfs = request.writable_tmpfs;
    cmd.run_args = request.run_args;
    cmd.binary = request.binary;

    PlanStep step;
    step.kind = PlanStep::Kind::Execute;
    step.service = service.name;
    step.argv = synthesize_command(service, cmd);
    result.steps.push_back(std::move(step));
    return true;
}

} // namespace

std::string dockerfile_path(const Service& service) {
    return rebase_path(service.build, "Dockerfile");
}

PlanResult build_plan(const std::vector<Service>& services, const PlanRequest& request) {
    PlanResult result;

    std::vector<const Service*> selected;
    if (!select_services(services, request, selected, result)) {
        return result;
    }

    for (const Service* service : selected) {
        if (request.action == Action::Build) {
            if (!service->has_build()) {
                spdlog::info("Skipping {}: uses image {}", service->name, service->image);
                continue;
            }
            if (!add_build_steps(*service, request, result)) return result;
            continue;
        }

        if (request.action == Action::Up && service->has_build() &&
            !path_exists(service->sif_file)) {
            spdlog::debug("{} not built yet, adding build steps", service->sif_file);
            if (!add_build_steps(*service, request, result)) return result;
        }
        if (!add_run_step(*service, request, result)) return result;
    }

    result.ok = true;
    return result;
}

} // namespace apco
