#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace apco {

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    unsupported_key,        // Service key recognized but not translated (networks)
    unsupported_section,    // Top-level compose key other than services
    arg_without_default,    // ARG with no default value cannot be substituted
    copy_wildcard,          // COPY/ADD source uses a glob
    copy_source_missing,    // COPY/ADD source not found under the build context
    scratch_base,           // FROM scratch
    ignored_flag,           // Instruction flag with no definition-file equivalent
    unknown_instruction,    // Dockerfile instruction copied verbatim into %post
    healthcheck_disabled,   // HEALTHCHECK NONE
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::unsupported_key: return "unsupported_key";
        case Warning::unsupported_section: return "unsupported_section";
        case Warning::arg_without_default: return "arg_without_default";
        case Warning::copy_wildcard: return "copy_wildcard";
        case Warning::copy_source_missing: return "copy_source_missing";
        case Warning::scratch_base: return "scratch_base";
        case Warning::ignored_flag: return "ignored_flag";
        case Warning::unknown_instruction: return "unknown_instruction";
        case Warning::healthcheck_disabled: return "healthcheck_disabled";
        default: return "unknown";
    }
}

// Parse warning key string to enum (returns nullopt for unknown keys)
std::optional<Warning> parse_warning_key(const std::string& key);

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

// Warning object as reported by parsers and the CLI
struct WarningObject {
    std::string key;
    std::string action;  // "warn" or "error" ("ignore" is filtered out)
    std::unordered_map<std::string, std::string> fields;
};

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind {
    None,
    Grammar,           // Disallowed character, wrong key/value shape, unknown key
    MissingReference,  // extends target or COPY --from stage not found
    MissingField,      // Build stage without FROM, service without image or build
    ExtendsCycle,      // extends chain loops back on itself or is too deep
    Io,                // File could not be read or written
    Exec,              // External process could not be started
};

inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::Grammar: return "grammar";
        case ErrorKind::MissingReference: return "missing_reference";
        case ErrorKind::MissingField: return "missing_field";
        case ErrorKind::ExtendsCycle: return "extends_cycle";
        case ErrorKind::Io: return "io";
        case ErrorKind::Exec: return "exec";
        default: return "none";
    }
}

} // namespace apco
