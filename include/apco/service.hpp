#pragma once

#include <string>
#include <utility>
#include <vector>

namespace apco {

// Scheme prepended to compose image references
inline constexpr const char* kImageScheme = "docker://";

// ============================================================================
// Compose Service
// ============================================================================

struct Service {
    std::string name;

    std::string image;     // "docker://..." reference, empty if not set
    std::string build;     // Build context directory, empty if not set
    std::string def_file;  // Generated definition file, set with build
    std::string sif_file;  // Built image artifact, set with build

    std::vector<std::string> command;  // Explicit exec command tokens

    // Container path -> bind specification "host:container", in first
    // declaration order; assigning an existing container path replaces it
    std::vector<std::pair<std::string, std::string>> volumes;

    // Variable -> value, stored pre-quoted ('value' or empty)
    std::vector<std::pair<std::string, std::string>> environment;

    bool has_build() const { return !build.empty(); }

    void set_volume(const std::string& container_path, const std::string& bind_spec);
    void set_environment(const std::string& name, const std::string& value);

    // Image reference used at run time: the artifact when a build directive
    // exists, else the plain image reference
    const std::string& run_image() const { return has_build() ? sif_file : image; }
};

/**
 * Overlay the truthy fields of child onto parent.
 *
 * Merge precedence, field by field (child wins when non-empty):
 *   name, image, build, def_file, sif_file, command  - scalar replace
 *   volumes, environment                            - whole-map replace
 *
 * Any field added to Service must be listed here explicitly.
 */
Service merge_service(const Service& parent, const Service& child);

/**
 * Rewrite the build directory, definition file, artifact file and every
 * relative volume host path of service to be relative to dir.
 * A build of "." becomes dir itself. Absolute host paths are kept.
 */
void rebase_service_paths(Service& service, const std::string& dir);

} // namespace apco
