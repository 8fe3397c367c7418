#include "apco/dockerfile.hpp"
#include "apco/line_reader.hpp"
#include "apco/path_utils.hpp"
#include "apco/platform.hpp"
#include "apco/string_utils.hpp"
#include "apco/warnings.hpp"

#include <cctype>
#include <cstddef>
#include <set>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace apco {

namespace {

const std::set<std::string> kInstructions = {
    "FROM",  "ARG",   "ENV",       "RUN",        "ADD",     "COPY",       "CMD",
    "ENTRYPOINT", "LABEL", "MAINTAINER", "VOLUME", "EXPOSE", "WORKDIR", "HEALTHCHECK",
    "STOPSIGNAL", "USER", "SHELL", "ONBUILD"};

const std::vector<std::string> kArchiveExtensions = {".tar", ".tgz", ".gz", ".gzip", ".bz2", ".xz"};

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool is_url(const std::string& s) {
    return starts_with(s, "http://") || starts_with(s, "https://");
}

bool is_archive(const std::string& s) {
    for (const auto& ext : kArchiveExtensions) {
        if (ends_with(s, ext)) return true;
    }
    return false;
}

std::string basename_of(const std::string& s) {
    auto slash = s.find_last_of('/');
    return slash == std::string::npos ? s : s.substr(slash + 1);
}

// Text after the first whitespace-delimited word, trimmed
std::string after_first_word(const std::string& s) {
    std::string t = trim(s);
    auto ws = t.find_first_of(" \t");
    return ws == std::string::npos ? std::string() : trim(t.substr(ws));
}

// Legacy "ENV KEY some value" keeps the whole remainder as one shell word.
// $ stays live so references such as $PATH still expand.
std::string quote_legacy_value(const std::string& value) {
    auto words = tokenize_quoted(value);
    if (words.size() <= 1) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\' || c == '`') quoted += '\\';
        quoted += c;
    }
    return quoted + "\"";
}

std::string first_word(const std::string& s) {
    std::string t = trim(s);
    return t.substr(0, t.find_first_of(" \t"));
}

struct Instruction {
    std::string keyword;
    std::string args;  // Text after the keyword, continuations joined
    std::string text;  // Full instruction text
    size_t line = 0;
};

/**
 * Instruction-keyed state machine over Dockerfile lines.
 *
 * The active stage is always the last one in the recipe. A single
 * placeholder stage exists before the first FROM so that leading ARG lines
 * and comments have somewhere to go.
 */
class DockerfileParser {
public:
    DockerfileParser(LineReader& reader, std::string context_dir)
        : reader_(reader), context_dir_(std::move(context_dir)) {
        BuildStage base;
        base.name = kDefaultStageName;
        base.index = 1;
        result_.recipe.source_path = reader_.source_name();
        result_.recipe.stages.push_back(std::move(base));
    }

    RecipeParseResult parse() {
        std::optional<Instruction> pending;
        bool in_run = false;

        while (auto line = reader_.next()) {
            std::string text = trim(line->text);
            bool continued = ends_with(text, "\\");

            if (pending) {
                if (starts_with(text, "#")) continue;
                pending->args += " " + strip_continuation(text);
                pending->text += " " + strip_continuation(text);
                if (!continued) {
                    if (!dispatch(*pending)) return std::move(result_);
                    pending.reset();
                }
                continue;
            }

            if (in_run) {
                if (starts_with(text, "#")) continue;
                active().install.push_back(text);
                in_run = continued;
                continue;
            }

            if (starts_with(text, "#")) {
                active().install.push_back(text);
                continue;
            }

            std::string keyword = instruction_keyword(text);
            if (keyword.empty()) {
                spdlog::debug("{}:{}: appending '{}'", source(), line->number, text);
                active().install.push_back(text);
                continue;
            }

            Instruction inst;
            inst.keyword = keyword;
            inst.line = line->number;

            if (keyword == "RUN") {
                inst.text = text;
                inst.args = after_first_word(text);
                if (!dispatch(inst)) return std::move(result_);
                in_run = continued;
                continue;
            }

            inst.text = strip_continuation(text);
            inst.args = after_first_word(inst.text);
            if (continued) {
                pending = std::move(inst);
                continue;
            }
            if (!dispatch(inst)) return std::move(result_);
        }

        if (pending && !dispatch(*pending)) {
            return std::move(result_);
        }

        result_.ok = true;
        return std::move(result_);
    }

private:
    using Handler = bool (DockerfileParser::*)(const Instruction&);

    LineReader& reader_;
    std::string context_dir_;
    std::vector<std::pair<std::string, std::string>> args_;
    RecipeParseResult result_;

    const std::string& source() const { return reader_.source_name(); }
    BuildStage& active() { return result_.recipe.stages.back(); }

    static std::string strip_continuation(const std::string& text) {
        return ends_with(text, "\\") ? trim(text.substr(0, text.size() - 1)) : text;
    }

    bool fail(ErrorKind kind, const Instruction& inst, const std::string& message) {
        result_.kind = kind;
        result_.error = source() + ":" + std::to_string(inst.line) + ": " + message;
        return false;
    }

    void warn(Warning key, std::unordered_map<std::string, std::string> fields) {
        WarningObject w;
        w.key = warning_to_string(key);
        w.action = action_to_string(WarningAction::Warn);
        w.fields = std::move(fields);
        result_.warnings.push_back(std::move(w));
    }

    bool dispatch(const Instruction& inst) {
        static const std::unordered_map<std::string, Handler> handlers = {
            {"FROM", &DockerfileParser::on_from},
            {"ARG", &DockerfileParser::on_arg},
            {"ENV", &DockerfileParser::on_env},
            {"RUN", &DockerfileParser::on_run},
            {"ADD", &DockerfileParser::on_copy},
            {"COPY", &DockerfileParser::on_copy},
            {"CMD", &DockerfileParser::on_exec_form},
            {"ENTRYPOINT", &DockerfileParser::on_exec_form},
            {"LABEL", &DockerfileParser::on_label},
            {"MAINTAINER", &DockerfileParser::on_maintainer},
            {"VOLUME", &DockerfileParser::on_metadata},
            {"EXPOSE", &DockerfileParser::on_metadata},
            {"STOPSIGNAL", &DockerfileParser::on_metadata},
            {"WORKDIR", &DockerfileParser::on_workdir},
            {"HEALTHCHECK", &DockerfileParser::on_healthcheck},
            {"USER", &DockerfileParser::on_verbatim},
            {"SHELL", &DockerfileParser::on_verbatim},
            {"ONBUILD", &DockerfileParser::on_verbatim},
        };

        spdlog::debug("{}:{}: [{}] {}", source(), inst.line, active().name, inst.text);
        return (this->*handlers.at(inst.keyword))(inst);
    }

    bool on_from(const Instruction& inst) {
        auto tokens = split_whitespace(inst.args);
        while (!tokens.empty() && starts_with(tokens.front(), "--")) {
            warn(Warning::ignored_flag, warnings::ignored_flag("FROM", tokens.front()));
            tokens.erase(tokens.begin());
        }
        if (tokens.empty()) {
            return fail(ErrorKind::Grammar, inst, "FROM requires an image");
        }

        std::optional<std::string> name;
        if (tokens.size() == 3 && to_upper(tokens[1]) == "AS") {
            name = tokens[2];
        } else if (tokens.size() != 1) {
            return fail(ErrorKind::Grammar, inst, "expected 'FROM <image> [AS <name>]'");
        }

        auto& stages = result_.recipe.stages;
        if (stages.size() == 1 && !stages.front().from_header) {
            if (name) {
                spdlog::debug("Stage #1 renamed to {}", *name);
                stages.front().name = *name;
            }
        } else {
            BuildStage stage;
            stage.index = stages.size() + 1;
            stage.name = name ? *name : "stage-" + std::to_string(stage.index);
            if (result_.recipe.find_stage(stage.name)) {
                return fail(ErrorKind::Grammar, inst, "duplicate stage name '" + stage.name + "'");
            }
            spdlog::debug("Stage #{} is now active as {}", stage.index, stage.name);
            stages.push_back(std::move(stage));
        }

        std::string image = substitute_args(tokens.front(), args_);
        if (image == "scratch") {
            warn(Warning::scratch_base, {{"stage", active().name}});
        }
        active().from_header = image;
        return true;
    }

    bool on_arg(const Instruction& inst) {
        auto tokens = tokenize_quoted(inst.args);
        if (tokens.empty()) {
            return fail(ErrorKind::Grammar, inst, "ARG requires a name");
        }

        for (const auto& token : tokens) {
            auto eq = token.find('=');
            if (eq == std::string::npos) {
                warn(Warning::arg_without_default, warnings::arg_without_default(token, source()));
                continue;
            }

            std::string name = token.substr(0, eq);
            std::string value = unquote(token.substr(eq + 1));
            spdlog::debug("ARG {} = {}", name, value);

            bool updated = false;
            for (auto& arg : args_) {
                if (arg.first == name) {
                    arg.second = value;
                    updated = true;
                }
            }
            if (!updated) {
                args_.emplace_back(name, value);
            }
            active().install.push_back(token);
        }
        return true;
    }

    bool on_env(const Instruction& inst) {
        auto assignments = parse_env_assignments(inst.args);
        if (assignments.empty()) {
            return fail(ErrorKind::Grammar, inst, "ENV requires an assignment");
        }
        for (const auto& assignment : assignments) {
            active().install.push_back(assignment);
            active().environment.push_back(assignment);
        }
        return true;
    }

    bool on_run(const Instruction& inst) {
        if (inst.args.empty()) {
            return fail(ErrorKind::Grammar, inst, "RUN requires a command");
        }
        if (starts_with(inst.args, "[")) {
            auto list = parse_string_list(inst.args);
            if (list) {
                active().install.push_back(join(*list, " "));
                return true;
            }
        }
        active().install.push_back(inst.args);
        return true;
    }

    bool on_copy(const Instruction& inst) {
        auto tokens = tokenize_quoted(inst.args);
        std::optional<std::string> from;

        size_t i = 0;
        for (; i < tokens.size() && starts_with(tokens[i], "--"); ++i) {
            if (inst.keyword == "COPY" && starts_with(tokens[i], "--from=")) {
                from = tokens[i].substr(7);
            } else {
                warn(Warning::ignored_flag, warnings::ignored_flag(inst.keyword, tokens[i]));
            }
        }

        std::vector<std::string> rest(tokens.begin() + static_cast<std::ptrdiff_t>(i), tokens.end());
        std::vector<std::string> paths;
        std::string joined_rest = join(rest, " ");
        if (starts_with(joined_rest, "[")) {
            auto list = parse_string_list(joined_rest);
            if (!list) {
                return fail(ErrorKind::Grammar, inst, "malformed " + inst.keyword + " list");
            }
            paths = std::move(*list);
        } else {
            for (const auto& token : rest) {
                paths.push_back(unquote(token));
            }
        }

        if (paths.size() < 2) {
            return fail(ErrorKind::Grammar, inst,
                        inst.keyword + " requires at least one source and a destination");
        }

        std::string dest = paths.back();
        paths.pop_back();

        if (from) {
            auto stage = resolve_source_stage(*from);
            if (!stage) {
                return fail(ErrorKind::MissingReference, inst,
                            "COPY --from names undeclared stage '" + *from + "'");
            }
            for (const auto& src : paths) {
                active().add_stage_file(*stage, {src, dest});
            }
            return true;
        }

        for (const auto& src : paths) {
            if (inst.keyword == "ADD" && is_url(src)) {
                active().install.push_back("curl -L " + src + " -o " +
                                           remove_redundant_slashes(dest + "/" + basename_of(src)));
            } else if (inst.keyword == "ADD" && is_archive(src)) {
                add_own_file(src, dest);
                active().install.push_back("tar -xf " +
                                           remove_redundant_slashes(dest + "/" + basename_of(src)) +
                                           " -C " + dest);
            } else {
                add_own_file(src, dest);
            }
        }
        return true;
    }

    // Name of an earlier stage given by name or 0-based index
    std::optional<std::string> resolve_source_stage(const std::string& ref) {
        const auto& stages = result_.recipe.stages;
        size_t earlier = stages.size() - 1;

        if (is_all_digits(ref)) {
            if (ref.size() > 9) return std::nullopt;
            size_t idx = std::stoul(ref);
            if (idx < earlier) return stages[idx].name;
            return std::nullopt;
        }
        for (size_t i = 0; i < earlier; ++i) {
            if (stages[i].name == ref) return ref;
        }
        return std::nullopt;
    }

    void add_own_file(const std::string& src, const std::string& dest) {
        std::string path = context_dir_.empty() ? src : rebase_path(context_dir_, src);

        if (src.find('*') != std::string::npos) {
            warn(Warning::copy_wildcard, warnings::copy_source(src, source()));
        } else if (!path_exists(path)) {
            warn(Warning::copy_source_missing, warnings::copy_source(path, source()));
        }
        active().files.push_back({path, dest});
    }

    bool on_exec_form(const Instruction& inst) {
        if (inst.args.empty()) {
            return fail(ErrorKind::Grammar, inst, inst.keyword + " requires a command");
        }

        ExecForm form = ExecForm::shell(inst.args);
        if (starts_with(inst.args, "[")) {
            auto list = parse_string_list(inst.args);
            if (list) form = ExecForm::list(std::move(*list));
        }

        if (inst.keyword == "CMD") {
            active().cmd = std::move(form);
        } else {
            active().entrypoint = std::move(form);
        }
        return true;
    }

    bool on_label(const Instruction& inst) {
        auto tokens = tokenize_quoted(inst.args);
        if (tokens.empty()) {
            return fail(ErrorKind::Grammar, inst, "LABEL requires a key");
        }

        if (tokens.front().find('=') == std::string::npos) {
            active().labels.push_back({unquote(tokens.front()), after_first_word(inst.args)});
            return true;
        }

        for (const auto& token : tokens) {
            auto eq = token.find('=');
            if (eq == std::string::npos) {
                return fail(ErrorKind::Grammar, inst, "expected key=value in LABEL, got '" + token + "'");
            }
            active().labels.push_back({unquote(token.substr(0, eq)), unquote(token.substr(eq + 1))});
        }
        return true;
    }

    bool on_maintainer(const Instruction& inst) {
        active().labels.push_back({"maintainer", inst.args});
        return true;
    }

    bool on_metadata(const Instruction& inst) {
        if (inst.keyword == "VOLUME") {
            auto list = starts_with(inst.args, "[") ? parse_string_list(inst.args) : std::nullopt;
            for (const auto& v : list ? *list : split_whitespace(inst.args)) {
                active().volumes.push_back(v);
            }
        } else if (inst.keyword == "EXPOSE") {
            for (const auto& p : split_whitespace(inst.args)) {
                active().ports.push_back(p);
            }
        } else {
            active().stop_signal = inst.args;
        }
        active().install.push_back("# " + inst.text);
        return true;
    }

    bool on_workdir(const Instruction& inst) {
        std::string dir = unquote(inst.args);
        if (dir.empty()) {
            return fail(ErrorKind::Grammar, inst, "WORKDIR requires a path");
        }
        active().install.push_back("mkdir -p " + dir);
        active().install.push_back("cd " + dir);
        active().workdir = dir;
        return true;
    }

    bool on_healthcheck(const Instruction& inst) {
        std::string rest = inst.args;
        while (starts_with(rest, "--")) {
            warn(Warning::ignored_flag, warnings::ignored_flag("HEALTHCHECK", first_word(rest)));
            rest = after_first_word(rest);
        }

        std::string word = to_upper(first_word(rest));
        if (word == "NONE") {
            active().test.reset();
            warn(Warning::healthcheck_disabled, {{"stage", active().name}});
            return true;
        }
        if (word == "CMD") {
            rest = after_first_word(rest);
        }
        if (rest.empty()) {
            return fail(ErrorKind::Grammar, inst, "HEALTHCHECK requires a command");
        }

        if (starts_with(rest, "[")) {
            auto list = parse_string_list(rest);
            if (list) {
                active().test = join(*list, " ");
                return true;
            }
        }
        active().test = rest;
        return true;
    }

    bool on_verbatim(const Instruction& inst) {
        if (inst.keyword != "USER") {
            warn(Warning::unknown_instruction, {{"instruction", inst.keyword}, {"source_path", source()}});
        }
        active().install.push_back(inst.text);
        return true;
    }
};

RecipeParseResult parse_with_reader(LineReader& reader, const std::string& context_dir) {
    DockerfileParser parser(reader, context_dir);
    auto result = parser.parse();
    if (result.ok) {
        spdlog::debug("Parsed {} stage(s) from {}", result.recipe.stages.size(), reader.source_name());
    }
    return result;
}

} // namespace

std::string instruction_keyword(const std::string& line) {
    std::string word = to_upper(first_word(line));
    return kInstructions.count(word) ? word : std::string();
}

std::vector<std::string> parse_env_assignments(const std::string& text) {
    std::vector<std::string> assignments;
    auto tokens = tokenize_quoted(text);
    if (tokens.empty()) {
        return assignments;
    }

    if (tokens.front().find('=') == std::string::npos) {
        std::string value = quote_legacy_value(after_first_word(text));
        assignments.push_back(tokens.front() + "=" + value);
        return assignments;
    }

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        if (ends_with(token, "=") && i + 1 < tokens.size() &&
            tokens[i + 1].find('=') == std::string::npos) {
            assignments.push_back(token + tokens[++i]);
        } else if (token.find('=') != std::string::npos) {
            assignments.push_back(token);
        } else if (i + 1 < tokens.size()) {
            assignments.push_back(token + "=" + tokens[++i]);
        } else {
            assignments.push_back(token + "=");
        }
    }
    return assignments;
}

std::string substitute_args(const std::string& text,
                            const std::vector<std::pair<std::string, std::string>>& args) {
    auto lookup = [&args](const std::string& name) -> const std::string* {
        for (const auto& arg : args) {
            if (arg.first == name) return &arg.second;
        }
        return nullptr;
    };

    std::string out;
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '$' || i + 1 >= text.size()) {
            out += text[i++];
            continue;
        }

        size_t start;
        size_t end;
        size_t next;
        if (text[i + 1] == '{') {
            start = i + 2;
            end = text.find('}', start);
            if (end == std::string::npos) {
                out += text[i++];
                continue;
            }
            next = end + 1;
        } else {
            start = i + 1;
            end = start;
            while (end < text.size() && is_name_char(text[end])) ++end;
            next = end;
        }

        const std::string* value = lookup(text.substr(start, end - start));
        if (end == start || !value) {
            out += text.substr(i, next - i);
        } else {
            out += *value;
        }
        i = next;
    }
    return out;
}

RecipeParseResult parse_dockerfile(const std::string& path, const DockerfileParseOptions& options) {
    LineReader reader(path, LineFilter::Dockerfile);
    if (!reader.is_open()) {
        RecipeParseResult result;
        result.kind = ErrorKind::Io;
        result.error = "cannot read Dockerfile: " + path;
        return result;
    }

    std::string context = options.context_dir;
    if (context.empty()) {
        context = directory_of(path);
    }
    if (context == ".") {
        context.clear();
    }
    return parse_with_reader(reader, context);
}

RecipeParseResult parse_dockerfile_string(const std::string& text,
                                          const std::string& source_name,
                                          const DockerfileParseOptions& options) {
    auto reader = LineReader::from_string(text, source_name, LineFilter::Dockerfile);
    return parse_with_reader(reader, options.context_dir);
}

} // namespace apco
