#pragma once

#include "apco/recipe.hpp"
#include "apco/types.hpp"

#include <string>

namespace apco {

// ============================================================================
// Definition File Output
// ============================================================================

struct RecipeWriteResult {
    bool ok = false;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    std::string content;  // Rendered definition file
};

/**
 * Render every stage of recipe as Apptainer definition-file text.
 *
 * Fails with ErrorKind::MissingField, producing no content, when any stage
 * has no base image.
 */
RecipeWriteResult render_recipe(const Recipe& recipe);

// Render and atomically write to path; nothing is written on failure
RecipeWriteResult write_recipe_file(const Recipe& recipe, const std::string& path);

// "USER name" lines become "su - name # USER name"; others are unchanged
std::string rewrite_user_line(const std::string& line);

// Startup command of the final stage: entrypoint then cmd, with an exec
// prefix and "$@" passthrough added when missing
std::string build_runscript(const BuildStage& stage);

} // namespace apco
