#pragma once

#include "apco/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace apco {

// Prefix of environment variables that override a warning's action,
// e.g. APCO_OVERRIDE_WARNINGS_COPY_WILDCARD=ignore
inline constexpr const char* kWarningOverridePrefix = "APCO_OVERRIDE_WARNINGS_";

// ============================================================================
// Warning Collector
// ============================================================================

class WarningCollector {
public:
    WarningCollector() = default;

    // Emit a warning with fields
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Emit a warning with no fields
    void emit(Warning warning);

    // Emit a warning by key string (for warnings forwarded from a parse result)
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Re-emit warnings collected elsewhere under this collector's policy
    void emit_all(const std::vector<WarningObject>& warnings);

    // Apply override to warning policy
    void apply_override(const std::string& warning_key, WarningAction action);

    // Read APCO_OVERRIDE_WARNINGS_<KEY> entries from an environment map.
    // Returns the names of variables whose value was not a valid action.
    std::vector<std::string> apply_env_overrides(
        const std::unordered_map<std::string, std::string>& env);

    // Action used for keys without an override (--strict sets Error)
    void set_default_action(WarningAction action) { default_action_ = action; }

    // Get all emitted warnings after policy application
    // Warnings with action "ignore" are excluded
    std::vector<WarningObject> get_warnings() const;

    // Check if any warning was upgraded to error
    bool has_errors() const;

    // Check if any effective warnings remain (excluding ignored)
    bool has_effective_warnings() const;

    // Clear all collected warnings
    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::vector<CollectedWarning> warnings_;
    std::unordered_map<std::string, WarningAction> overrides_;
    WarningAction default_action_ = WarningAction::Warn;

    WarningAction get_effective_action(const std::string& key) const;
};

// Render "Warning [key]: field=value ..." with fields in sorted order
std::string format_warning(const WarningObject& warning);

// ============================================================================
// Convenience functions for building warning fields
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> unsupported_key(
    const std::string& key,
    const std::string& service,
    const std::string& source_path) {
    return {{"key", key}, {"service", service}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> unsupported_section(
    const std::string& key,
    const std::string& source_path) {
    return {{"key", key}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> arg_without_default(
    const std::string& name,
    const std::string& source_path) {
    return {{"arg", name}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> copy_source(
    const std::string& source,
    const std::string& source_path) {
    return {{"source", source}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> ignored_flag(
    const std::string& instruction,
    const std::string& flag) {
    return {{"instruction", instruction}, {"flag", flag}};
}

} // namespace warnings

} // namespace apco
