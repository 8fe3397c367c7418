#pragma once

#include "apco/command.hpp"
#include "apco/service.hpp"
#include "apco/types.hpp"

#include <string>
#include <vector>

namespace apco {

// ============================================================================
// Execution Plan
// ============================================================================

struct PlanStep {
    enum class Kind {
        WriteDefinition,  // Write content to path
        Execute,          // Run argv and wait
    };

    Kind kind = Kind::Execute;
    std::string service;
    std::string path;
    std::string content;
    std::vector<std::string> argv;
};

struct PlanRequest {
    Action action = Action::Up;
    std::vector<std::string> services;  // Selection; empty means all (build/up)
    bool writable_tmpfs = false;
    std::vector<std::string> run_args;
    std::string binary = kDefaultRuntimeBinary;
};

struct PlanResult {
    bool ok = false;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    std::vector<PlanStep> steps;
    std::vector<WarningObject> warnings;
};

/**
 * Translate the requested action over resolved services into ordered steps.
 *
 * Every Dockerfile involved is parsed and rendered here, so a plan that
 * comes back ok has nothing left that can fail before execution except
 * I/O and the external processes themselves.
 */
PlanResult build_plan(const std::vector<Service>& services, const PlanRequest& request);

// <build>/Dockerfile
std::string dockerfile_path(const Service& service);

} // namespace apco
