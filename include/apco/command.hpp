#pragma once

#include "apco/service.hpp"

#include <optional>
#include <string>
#include <vector>

namespace apco {

// ============================================================================
// Command Synthesis
// ============================================================================

inline constexpr const char* kDefaultRuntimeBinary = "apptainer";

enum class Action {
    Build,  // Build the service's definition file into its artifact
    Run,    // Ad-hoc run of one service with explicit arguments
    Up,     // Run a service as configured
};

const char* action_to_string(Action action);
std::optional<Action> parse_action(const std::string& s);

struct CommandOptions {
    Action action = Action::Up;
    bool writable_tmpfs = false;
    std::vector<std::string> run_args;  // Action::Run only
    std::string binary = kDefaultRuntimeBinary;
};

/**
 * Literal argument vector for the runtime binary.
 *
 *   Build:  <binary> build -F <sif> <def>
 *   Run/Up: <binary> exec|run [--writable-tmpfs] [--bind <spec>]...
 *           [--env K=V]... <image> [args...]
 *
 * exec is chosen when the service has an explicit command. The trailing
 * arguments are run_args for an ad-hoc run (the service command when
 * run_args is empty) and the service command otherwise.
 */
std::vector<std::string> synthesize_command(const Service& service, const CommandOptions& options);

} // namespace apco
