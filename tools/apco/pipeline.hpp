/**
 * apptainer-compose CLI - compose -> plan -> execute
 */

#pragma once

#include "common.hpp"

#include <apco/plan.hpp>

namespace apco::cli {

/**
 * Parse the compose file, plan the request and carry out the plan.
 *
 * Nothing is written or executed unless parsing and planning succeed and
 * no warning is escalated to an error. With --dry-run definition files are
 * still written but commands are only printed. Returns the CLI exit
 * status: 1 for translation failures, otherwise the first non-zero exit
 * status of an executed command (0 when all succeed).
 */
int run_pipeline(const GlobalOptions& opts, PlanRequest request);

/**
 * Build a run request from the unparsed tail of the run command line:
 * the service name, then the container arguments in the order given.
 * A "--" before or after the service name is dropped. Returns nullopt
 * when no service is named.
 */
std::optional<PlanRequest> make_run_request(const std::vector<std::string>& remaining,
                                            bool writable_tmpfs);

} // namespace apco::cli
