#include "apco/recipe_writer.hpp"
#include "apco/platform.hpp"
#include "apco/string_utils.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace apco {

namespace {

void write_section(std::ostringstream& out, const std::string& header,
                   const std::vector<std::string>& lines) {
    if (lines.empty()) return;
    out << "%" << header << "\n";
    for (const auto& line : lines) {
        out << rewrite_user_line(line) << "\n";
    }
}

void write_files(std::ostringstream& out, const std::string& header,
                 const std::vector<FilePair>& files) {
    if (files.empty()) return;
    out << "%" << header << "\n";
    for (const auto& f : files) {
        out << f.source << " " << f.destination << "\n";
    }
}

void write_stage(std::ostringstream& out, const BuildStage& stage, bool last) {
    out << "Bootstrap: docker\n";
    out << "From: " << *stage.from_header << "\n";
    out << "Stage: " << stage.name << "\n\n";

    write_files(out, "files", stage.files);
    for (const auto& [source_stage, files] : stage.stage_files) {
        write_files(out, "files from " + source_stage, files);
    }

    if (!stage.labels.empty()) {
        out << "%labels\n";
        for (const auto& label : stage.labels) {
            out << label.key << " " << label.value << "\n";
        }
    }

    write_section(out, "post", stage.install);

    if (!stage.environment.empty()) {
        out << "%environment\n";
        for (const auto& assignment : stage.environment) {
            out << "export " << assignment << "\n";
        }
    }

    if (!last) return;

    std::vector<std::string> runscript;
    if (stage.workdir) {
        runscript.push_back("cd " + *stage.workdir);
    }
    runscript.push_back(build_runscript(stage));
    write_section(out, "runscript", runscript);
    write_section(out, "startscript", runscript);

    if (stage.test) {
        write_section(out, "test", {*stage.test});
    }
}

} // namespace

std::string rewrite_user_line(const std::string& line) {
    if (line.size() < 5 || to_upper(line.substr(0, 4)) != "USER" ||
        (line[4] != ' ' && line[4] != '\t')) {
        return line;
    }
    std::string name = trim(line.substr(5));
    return "su - " + name + " # " + line;
}

std::string build_runscript(const BuildStage& stage) {
    std::vector<std::string> parts;
    if (stage.entrypoint.is_set()) parts.push_back(stage.entrypoint.joined());
    if (stage.cmd.is_set()) parts.push_back(stage.cmd.joined());

    std::string script = trim(join(parts, " "));
    if (!starts_with(script, "exec")) {
        script = script.empty() ? "exec" : "exec " + script;
    }
    if (script.find("$@") == std::string::npos) {
        script += " \"$@\"";
    }
    return script;
}

RecipeWriteResult render_recipe(const Recipe& recipe) {
    RecipeWriteResult result;

    if (recipe.stages.empty()) {
        result.kind = ErrorKind::MissingField;
        result.error = recipe.source_path + ": no build stage";
        return result;
    }
    for (const auto& stage : recipe.stages) {
        if (!stage.from_header) {
            result.kind = ErrorKind::MissingField;
            result.error = recipe.source_path + ": stage '" + stage.name + "' has no FROM";
            return result;
        }
    }

    std::ostringstream out;
    for (size_t i = 0; i < recipe.stages.size(); ++i) {
        if (i > 0) out << "\n";
        write_stage(out, recipe.stages[i], i + 1 == recipe.stages.size());
    }

    result.ok = true;
    result.content = out.str();
    return result;
}

RecipeWriteResult write_recipe_file(const Recipe& recipe, const std::string& path) {
    auto result = render_recipe(recipe);
    if (!result.ok) {
        return result;
    }

    auto written = atomic_write_file(path, result.content);
    if (!written.ok) {
        result.ok = false;
        result.kind = ErrorKind::Io;
        result.error = "failed to write " + path + ": " + written.error;
        return result;
    }

    spdlog::debug("Wrote definition file {}", path);
    return result;
}

} // namespace apco
