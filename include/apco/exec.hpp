#pragma once

#include <string>
#include <vector>

namespace apco {
namespace exec {

// ============================================================================
// EXECUTION RESULT
// ============================================================================

struct ExecResult {
    bool ok = false;     // Process was started and reaped
    int exit_code = -1;  // Exit status, 128 + signal for a signalled child
    std::string error;
};

/**
 * Run argv[0] (looked up on PATH) with the remaining arguments, inheriting
 * the current environment, working directory and standard streams, and
 * wait for it to finish.
 *
 * A binary that cannot be executed yields ok == false with the reason in
 * error; the child's own exit status is never mistaken for a start failure.
 */
ExecResult run_and_wait(const std::vector<std::string>& argv);

// Join argv for display, quoting arguments that contain whitespace
std::string format_command_line(const std::vector<std::string>& argv);

} // namespace exec
} // namespace apco
