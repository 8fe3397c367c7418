#pragma once

#include "apco/service.hpp"
#include "apco/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace apco {

// ============================================================================
// Compose Document Parsing
// ============================================================================

// Default compose file name and the alternatives probed when it is absent
inline constexpr const char* kDefaultComposeFile = "compose.yaml";
inline const std::vector<std::string> kComposeFileFallbacks = {
    "compose.yml", "docker-compose.yaml", "docker-compose.yml"};

struct ComposeParseResult {
    bool ok = false;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    std::vector<Service> services;  // Document order
    std::vector<WarningObject> warnings;

    const Service* find_service(const std::string& name) const;
};

struct ComposeParseOptions {
    // Resolve extends only for this service; the other services are checked
    // for grammar but keep their extends unresolved
    std::optional<std::string> only_service;
};

class ExtendsResolver;

// Parse a compose file, resolving extends through a fresh resolver
ComposeParseResult parse_compose_file(const std::string& path);

// Parse a compose file, sharing a resolver (cache and cycle guard)
ComposeParseResult parse_compose_file(const std::string& path,
                                      ExtendsResolver& resolver,
                                      const ComposeParseOptions& options = {});

// Parse compose text; source_path names the document in diagnostics and
// anchors relative extends paths
ComposeParseResult parse_compose_string(const std::string& text,
                                        const std::string& source_path);

// ============================================================================
// Extends Resolution
// ============================================================================

inline constexpr size_t kMaxExtendsDepth = 32;

struct ServiceLookup {
    bool ok = false;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    Service service;
    std::vector<WarningObject> warnings;
};

/**
 * Resolves extends references by parsing the referenced file.
 *
 * Each (file, service) pair is resolved at most once per resolver. The
 * services whose bodies are being parsed form a stack; a reference back
 * into that stack, or a chain deeper than max_depth, fails with
 * ErrorKind::ExtendsCycle.
 */
class ExtendsResolver {
public:
    explicit ExtendsResolver(size_t max_depth = kMaxExtendsDepth) : max_depth_(max_depth) {}

    // Marks a service body as being parsed for as long as it lives
    class Scope {
    public:
        Scope(ExtendsResolver& resolver, std::string key);
        ~Scope();
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ExtendsResolver& resolver_;
    };

    Scope enter(const std::string& path, const std::string& service);

    // Look up service in the compose file at path, fully resolved. Its paths
    // are relative to the directory of that file
    ServiceLookup resolve(const std::string& path, const std::string& service);

    size_t depth() const { return stack_.size(); }

    static std::string make_key(const std::string& path, const std::string& service);

private:
    size_t max_depth_;
    std::vector<std::string> stack_;
    std::unordered_map<std::string, Service> cache_;
};

} // namespace apco
