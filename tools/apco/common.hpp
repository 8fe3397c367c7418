/**
 * apptainer-compose CLI - Common utilities and types
 */

#pragma once

#include <apco/platform.hpp>
#include <apco/types.hpp>
#include <apco/warnings.hpp>
#include <apco/command.hpp>
#include <apco/compose.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace apco::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string file;      // -f, --file
    bool json = false;     // --json
    bool verbose = false;  // -v, --verbose
    bool quiet = false;    // -q, --quiet
    bool dry_run = false;  // --dry-run
    bool strict = false;   // --strict
};

/**
 * Resolve the compose file.
 * Priority: -f flag > COMPOSE_FILE env > compose.yaml (or an existing
 * fallback name when compose.yaml is absent)
 */
inline std::string resolve_compose_file(const std::string& flag_value) {
    if (!flag_value.empty()) {
        return flag_value;
    }

    auto env_file = get_env("COMPOSE_FILE");
    if (env_file && !env_file->empty()) {
        return *env_file;
    }

    if (!path_exists(kDefaultComposeFile)) {
        for (const auto& fallback : kComposeFileFallbacks) {
            if (path_exists(fallback)) {
                return fallback;
            }
        }
    }
    return kDefaultComposeFile;
}

// Runtime binary: APCO_APPTAINER env > apptainer
inline std::string resolve_runtime_binary() {
    auto env_binary = get_env("APCO_APPTAINER");
    if (env_binary && !env_binary->empty()) {
        return *env_binary;
    }
    return kDefaultRuntimeBinary;
}

/**
 * Console logging goes to stderr so that stdout carries only command
 * output (JSON, rendered definition files).
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::stderr_color_mt("apco");
    logger->set_pattern("%^%v%$");
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet || opts.json) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Warning collector configured from the environment and --strict.
 * Invalid override values are reported and otherwise ignored.
 */
inline WarningCollector make_warning_collector(const GlobalOptions& opts) {
    WarningCollector collector;
    if (opts.strict) {
        collector.set_default_action(WarningAction::Error);
    }
    for (const auto& name : collector.apply_env_overrides(get_all_env())) {
        spdlog::warn("Ignoring {}: expected warn, ignore or error", name);
    }
    return collector;
}

inline nlohmann::json warnings_to_json(const std::vector<WarningObject>& warnings) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : warnings) {
        nlohmann::json j;
        j["key"] = w.key;
        j["action"] = w.action;
        j["fields"] = w.fields;
        arr.push_back(j);
    }
    return arr;
}

/**
 * Report collected warnings. In text mode each is logged; in JSON mode
 * they are left for the JSON document.
 */
inline void print_warnings(const WarningCollector& collector, bool json_mode) {
    if (json_mode) return;
    for (const auto& w : collector.get_warnings()) {
        if (w.action == "error") {
            spdlog::error("{} (escalated to error by policy)", format_warning(w));
        } else {
            spdlog::warn("{}", format_warning(w));
        }
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode,
                        const WarningCollector* collector = nullptr,
                        ErrorKind kind = ErrorKind::None) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (kind != ErrorKind::None) {
            j["kind"] = error_kind_to_string(kind);
        }
        if (collector && collector->has_effective_warnings()) {
            j["warnings"] = warnings_to_json(collector->get_warnings());
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace apco::cli
