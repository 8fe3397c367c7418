#include "apco/service.hpp"
#include "apco/path_utils.hpp"

namespace apco {

namespace {

void set_ordered(std::vector<std::pair<std::string, std::string>>& entries,
                 const std::string& key, const std::string& value) {
    for (auto& entry : entries) {
        if (entry.first == key) {
            entry.second = value;
            return;
        }
    }
    entries.emplace_back(key, value);
}

} // namespace

void Service::set_volume(const std::string& container_path, const std::string& bind_spec) {
    set_ordered(volumes, container_path, bind_spec);
}

void Service::set_environment(const std::string& var, const std::string& value) {
    set_ordered(environment, var, value);
}

Service merge_service(const Service& parent, const Service& child) {
    Service merged = parent;

    if (!child.name.empty()) merged.name = child.name;
    if (!child.image.empty()) merged.image = child.image;
    if (!child.build.empty()) merged.build = child.build;
    if (!child.def_file.empty()) merged.def_file = child.def_file;
    if (!child.sif_file.empty()) merged.sif_file = child.sif_file;
    if (!child.command.empty()) merged.command = child.command;
    if (!child.volumes.empty()) merged.volumes = child.volumes;
    if (!child.environment.empty()) merged.environment = child.environment;

    return merged;
}

void rebase_service_paths(Service& service, const std::string& dir) {
    for (std::string* path : {&service.build, &service.def_file, &service.sif_file}) {
        if (!path->empty() && !is_absolute_path(*path)) {
            *path = rebase_path(dir, *path);
        }
    }

    for (auto& [container, spec] : service.volumes) {
        auto colon = spec.find(':');
        std::string host = spec.substr(0, colon);
        if (is_absolute_path(host)) {
            continue;
        }
        spec = rebase_path(dir, host) + spec.substr(colon);
    }
}

} // namespace apco
