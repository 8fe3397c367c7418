#include "apco/recipe.hpp"
#include "apco/string_utils.hpp"

namespace apco {

std::string ExecForm::joined() const {
    switch (kind) {
        case Kind::List: return join(tokens, " ");
        case Kind::Shell: return text;
        default: return "";
    }
}

ExecForm ExecForm::list(std::vector<std::string> tokens) {
    ExecForm form;
    form.kind = Kind::List;
    form.tokens = std::move(tokens);
    return form;
}

ExecForm ExecForm::shell(std::string text) {
    ExecForm form;
    form.kind = Kind::Shell;
    form.text = std::move(text);
    return form;
}

void BuildStage::add_stage_file(const std::string& stage, FilePair pair) {
    for (auto& entry : stage_files) {
        if (entry.first == stage) {
            entry.second.push_back(std::move(pair));
            return;
        }
    }
    stage_files.emplace_back(stage, std::vector<FilePair>{std::move(pair)});
}

BuildStage* Recipe::find_stage(const std::string& name) {
    for (auto& stage : stages) {
        if (stage.name == name) return &stage;
    }
    return nullptr;
}

const BuildStage* Recipe::find_stage(const std::string& name) const {
    for (const auto& stage : stages) {
        if (stage.name == name) return &stage;
    }
    return nullptr;
}

} // namespace apco
