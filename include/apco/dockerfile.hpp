#pragma once

#include "apco/recipe.hpp"
#include "apco/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace apco {

// ============================================================================
// Dockerfile Parsing
// ============================================================================

// Name of the stage that exists before the first FROM names one
inline constexpr const char* kDefaultStageName = "apco-base";

struct DockerfileParseOptions {
    // Directory COPY/ADD sources are relative to. Empty means the directory
    // of the Dockerfile (or no rebasing for in-memory text).
    std::string context_dir;
};

struct RecipeParseResult {
    bool ok = false;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    Recipe recipe;
    std::vector<WarningObject> warnings;
};

RecipeParseResult parse_dockerfile(const std::string& path,
                                   const DockerfileParseOptions& options = {});

// source_name is used in diagnostics only
RecipeParseResult parse_dockerfile_string(const std::string& text,
                                          const std::string& source_name,
                                          const DockerfileParseOptions& options = {});

// Instruction keyword at the start of a line, uppercased ("" if none)
std::string instruction_keyword(const std::string& line);

/**
 * Split ENV text into KEY=VALUE assignments. Quoted spans are kept whole.
 * When the first token has no '=' the legacy form applies and the whole
 * remainder is the value ("KEY some value" -> "KEY=some value").
 * "KEY= VALUE" takes the next token as the value.
 */
std::vector<std::string> parse_env_assignments(const std::string& text);

// Replace $NAME and ${NAME} for every known build argument
std::string substitute_args(const std::string& text,
                            const std::vector<std::pair<std::string, std::string>>& args);

} // namespace apco
