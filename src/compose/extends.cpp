#include "apco/compose.hpp"
#include "apco/platform.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace apco {

ExtendsResolver::Scope::Scope(ExtendsResolver& resolver, std::string key)
    : resolver_(resolver) {
    resolver_.stack_.push_back(std::move(key));
}

ExtendsResolver::Scope::~Scope() {
    resolver_.stack_.pop_back();
}

ExtendsResolver::Scope ExtendsResolver::enter(const std::string& path, const std::string& service) {
    return Scope(*this, make_key(path, service));
}

std::string ExtendsResolver::make_key(const std::string& path, const std::string& service) {
    return absolute_path(path) + "#" + service;
}

ServiceLookup ExtendsResolver::resolve(const std::string& path, const std::string& service) {
    ServiceLookup lookup;
    std::string key = make_key(path, service);

    auto cached = cache_.find(key);
    if (cached != cache_.end()) {
        lookup.ok = true;
        lookup.service = cached->second;
        return lookup;
    }

    if (std::find(stack_.begin(), stack_.end(), key) != stack_.end()) {
        std::string chain;
        for (const auto& entry : stack_) {
            chain += entry + " -> ";
        }
        lookup.kind = ErrorKind::ExtendsCycle;
        lookup.error = "extends cycle: " + chain + key;
        return lookup;
    }

    if (stack_.size() >= max_depth_) {
        lookup.kind = ErrorKind::ExtendsCycle;
        lookup.error = "extends chain deeper than " + std::to_string(max_depth_) +
                       " at " + key;
        return lookup;
    }

    if (!is_regular_file(path)) {
        lookup.kind = ErrorKind::MissingReference;
        lookup.error = "extends file not found: " + path;
        return lookup;
    }

    spdlog::debug("Resolving extends {} from {}", service, path);

    ComposeParseOptions options;
    options.only_service = service;
    auto parsed = parse_compose_file(path, *this, options);
    lookup.warnings = std::move(parsed.warnings);

    if (!parsed.ok) {
        lookup.kind = parsed.kind;
        lookup.error = parsed.error;
        return lookup;
    }

    const Service* found = parsed.find_service(service);
    if (!found) {
        lookup.kind = ErrorKind::MissingReference;
        lookup.error = "service '" + service + "' not found in " + path;
        return lookup;
    }

    cache_[key] = *found;
    lookup.ok = true;
    lookup.service = *found;
    return lookup;
}

} // namespace apco
