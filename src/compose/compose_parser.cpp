#include "apco/compose.hpp"
#include "apco/compose_tokenizer.hpp"
#include "apco/line_reader.hpp"
#include "apco/path_utils.hpp"
#include "apco/string_utils.hpp"
#include "apco/warnings.hpp"

#include <set>

#include <spdlog/spdlog.h>

namespace apco {

const Service* ComposeParseResult::find_service(const std::string& name) const {
    for (const auto& service : services) {
        if (service.name == name) {
            return &service;
        }
    }
    return nullptr;
}

namespace {

// Top-level sections skipped without a warning
const std::set<std::string> kSilentSections = {"version", "name"};

/**
 * Depth-aware parser over compose events.
 *
 * Holds one event of lookahead. Every parse_* method is entered with the
 * event that opened its block already consumed and returns with the first
 * event of the next sibling (or the end of input) as current.
 */
class ComposeDocumentParser {
public:
    ComposeDocumentParser(LineReader& reader, ExtendsResolver& resolver,
                          const ComposeParseOptions& options)
        : reader_(reader), tokenizer_(reader), resolver_(resolver), options_(options) {}

    ComposeParseResult parse() {
        if (!advance()) {
            return std::move(result_);
        }
        if (!parse_document()) {
            result_.services.clear();
            return std::move(result_);
        }
        result_.ok = true;
        return std::move(result_);
    }

private:
    LineReader& reader_;
    ComposeTokenizer tokenizer_;
    ExtendsResolver& resolver_;
    const ComposeParseOptions& options_;

    std::optional<ComposeEvent> current_;
    ComposeParseResult result_;

    const std::string& source() const { return reader_.source_name(); }

    bool advance() {
        auto token = tokenizer_.next();
        if (!token.ok) {
            result_.kind = token.kind;
            result_.error = token.error;
            return false;
        }
        current_ = std::move(token.event);
        return true;
    }

    bool fail(ErrorKind kind, size_t line, const std::string& message) {
        result_.kind = kind;
        result_.error = source() + ":" + std::to_string(line) + ": " + message;
        return false;
    }

    bool fail_here(const std::string& message) {
        return fail(ErrorKind::Grammar, current_->line, message);
    }

    void warn(Warning key, std::unordered_map<std::string, std::string> fields) {
        WarningObject w;
        w.key = warning_to_string(key);
        w.action = action_to_string(WarningAction::Warn);
        w.fields = std::move(fields);
        result_.warnings.push_back(std::move(w));
    }

    // Consume every event nested deeper than depth
    bool skip_block(size_t depth) {
        while (current_ && current_->depth > depth) {
            if (!advance()) return false;
        }
        return true;
    }

    bool parse_document() {
        bool seen_services = false;

        while (current_) {
            if (current_->depth != 0) {
                // Body of a filtered x- extension block
                spdlog::debug("{}:{}: skipping orphaned line", source(), current_->line);
                if (!advance()) return false;
                continue;
            }
            if (current_->kind != ComposeEventKind::Key) {
                return fail_here("list item at top level");
            }

            std::string key = current_->key;
            size_t line = current_->line;

            if (key == "services") {
                if (current_->value) {
                    return fail_here("'services' must open a block");
                }
                if (seen_services) {
                    return fail_here("duplicate 'services' section");
                }
                seen_services = true;
                if (!advance() || !parse_services()) return false;
                continue;
            }

            if (kSilentSections.count(key) == 0) {
                spdlog::debug("{}:{}: skipping section '{}'", source(), line, key);
                warn(Warning::unsupported_section, warnings::unsupported_section(key, source()));
            }
            if (!advance() || !skip_block(0)) return false;
        }
        return true;
    }

    bool parse_services() {
        std::set<std::string> names;

        while (current_ && current_->depth >= 1) {
            if (current_->depth != 1 || current_->kind != ComposeEventKind::Key) {
                return fail_here("expected a service name");
            }
            if (current_->value) {
                return fail_here("service '" + current_->key + "' must open a block");
            }
            std::string name = current_->key;
            if (!names.insert(name).second) {
                return fail_here("duplicate service '" + name + "'");
            }

            Service service;
            service.name = name;
            if (!advance() || !parse_service(service)) return false;
            result_.services.push_back(std::move(service));
        }
        return true;
    }

    bool parse_service(Service& service) {
        auto scope = resolver_.enter(source(), service.name);
        bool resolve_extends = !options_.only_service || *options_.only_service == service.name;

        while (current_ && current_->depth >= 2) {
            if (current_->depth != 2 || current_->kind != ComposeEventKind::Key) {
                return fail_here("expected a key of service '" + service.name + "'");
            }

            const std::string key = current_->key;
            const std::optional<std::string> value = current_->value;
            const size_t line = current_->line;

            if (key == "image") {
                if (!value) return fail_here("'image' requires a value");
                std::string image = unquote(*value);
                if (!is_plain_token(image)) return fail_here("invalid image '" + image + "'");
                service.image = image.find("://") == std::string::npos
                                    ? std::string(kImageScheme) + image
                                    : image;
                if (!advance()) return false;
            } else if (key == "build") {
                if (!value) return fail_here("'build' requires a value");
                std::string build = unquote(*value);
                if (!is_plain_token(build)) return fail_here("invalid build path '" + build + "'");
                service.build = build;
                service.def_file = service.name + ".def";
                service.sif_file = service.name + ".sif";
                if (!advance()) return false;
            } else if (key == "command") {
                if (!advance() || !parse_command(service, value, line)) return false;
            } else if (key == "volumes") {
                if (value) return fail_here("'volumes' must open a block");
                if (!advance() || !parse_volumes(service)) return false;
            } else if (key == "environment") {
                if (value) return fail_here("'environment' must open a block");
                if (!advance() || !parse_environment(service)) return false;
            } else if (key == "extends") {
                if (value) return fail_here("'extends' must open a block");
                if (!advance() || !parse_extends(service, line, resolve_extends)) return false;
            } else if (key == "networks") {
                spdlog::debug("{}:{}: ignoring '{}' of service '{}'", source(), line, key,
                              service.name);
                warn(Warning::unsupported_key,
                     warnings::unsupported_key(key, service.name, source()));
                if (!advance() || !skip_block(2)) return false;
            } else {
                return fail_here("unsupported key '" + key + "' in service '" + service.name + "'");
            }
        }
        return true;
    }

    bool parse_command(Service& service, const std::optional<std::string>& value, size_t line) {
        if (value) {
            if (!value->empty() && value->front() == '[') {
                auto list = parse_string_list(*value);
                if (!list) {
                    return fail(ErrorKind::Grammar, line, "malformed command list");
                }
                service.command = std::move(*list);
            } else {
                service.command = split_spaces(unquote(*value));
            }
            return true;
        }

        std::vector<std::string> tokens;
        while (current_ && current_->depth >= 3) {
            if (current_->depth != 3 || current_->kind != ComposeEventKind::Item) {
                return fail_here("expected a command item");
            }
            tokens.push_back(unquote(current_->item));
            if (!advance()) return false;
        }
        if (tokens.empty()) {
            return fail(ErrorKind::Grammar, line, "'command' has no value");
        }
        service.command = std::move(tokens);
        return true;
    }

    bool parse_volumes(Service& service) {
        while (current_ && current_->depth >= 3) {
            if (current_->depth != 3 || current_->kind != ComposeEventKind::Item) {
                return fail_here("expected a volume item");
            }

            std::string entry = unquote(current_->item);
            size_t colons = 0;
            for (char c : entry) {
                if (c == ':') ++colons;
            }
            if (colons != 1 && colons != 2) {
                return fail_here("volume '" + entry + "' must be host:container[:mode]");
            }

            // Drop the mode
            size_t first = entry.find(':');
            size_t second = entry.find(':', first + 1);
            std::string spec = entry.substr(0, second);
            std::string container = spec.substr(first + 1);
            if (first == 0 || container.empty()) {
                return fail_here("volume '" + entry + "' has an empty path");
            }

            service.set_volume(container, spec);
            if (!advance()) return false;
        }
        return true;
    }

    bool parse_environment(Service& service) {
        while (current_ && current_->depth >= 3) {
            if (current_->depth != 3) {
                return fail_here("unexpected indentation in environment");
            }

            if (current_->kind == ComposeEventKind::Key) {
                if (!is_plain_token(current_->key)) {
                    return fail_here("invalid variable name '" + current_->key + "'");
                }
                service.set_environment(current_->key, normalize_env_value(current_->value));
            } else {
                const std::string& item = current_->item;
                auto eq = item.find('=');
                std::string name = item.substr(0, eq);
                if (name.empty() || !is_plain_token(name)) {
                    return fail_here("invalid variable name '" + name + "'");
                }
                std::optional<std::string> v;
                if (eq != std::string::npos && eq + 1 < item.size()) {
                    v = item.substr(eq + 1);
                }
                service.set_environment(name, normalize_env_value(v));
            }
            if (!advance()) return false;
        }
        return true;
    }

    bool parse_extends(Service& service, size_t line, bool resolve) {
        std::optional<std::string> file;
        std::optional<std::string> parent_name;

        while (current_ && current_->depth >= 3) {
            if (current_->depth != 3 || current_->kind != ComposeEventKind::Key) {
                return fail_here("expected 'file' or 'service' in extends");
            }
            if (!current_->value) {
                return fail_here("extends '" + current_->key + "' requires a value");
            }
            if (current_->key == "file") {
                file = unquote(*current_->value);
            } else if (current_->key == "service") {
                parent_name = unquote(*current_->value);
            } else {
                return fail_here("unsupported extends key '" + current_->key + "'");
            }
            if (!advance()) return false;
        }

        if (!file || !parent_name) {
            return fail(ErrorKind::MissingReference, line,
                        "extends of service '" + service.name + "' needs both 'file' and 'service'");
        }
        if (!resolve) {
            return true;
        }

        std::string declaring_dir = directory_of(source());
        std::string parent_path = (is_absolute_path(*file) || declaring_dir == ".")
                                      ? *file
                                      : rebase_path(declaring_dir, *file);

        auto lookup = resolver_.resolve(parent_path, *parent_name);
        for (auto& w : lookup.warnings) {
            result_.warnings.push_back(std::move(w));
        }
        if (!lookup.ok) {
            return fail(lookup.kind, line, lookup.error);
        }

        spdlog::debug("{}:{}: service '{}' extends '{}' from {}", source(), line, service.name,
                      *parent_name, parent_path);

        // The parent comes back relative to its own file; bring it into the
        // frame of the declaring file
        Service merged = merge_service(lookup.service, service);
        std::string parent_dir = directory_of(*file);
        if (parent_dir != ".") {
            rebase_service_paths(merged, parent_dir);
        }
        service = std::move(merged);
        return true;
    }
};

ComposeParseResult parse_with_reader(LineReader& reader, ExtendsResolver& resolver,
                                     const ComposeParseOptions& options) {
    ComposeDocumentParser parser(reader, resolver, options);
    auto result = parser.parse();
    if (result.ok) {
        spdlog::debug("Parsed {} service(s) from {}", result.services.size(), reader.source_name());
    }
    return result;
}

} // namespace

ComposeParseResult parse_compose_file(const std::string& path) {
    ExtendsResolver resolver;
    return parse_compose_file(path, resolver);
}

ComposeParseResult parse_compose_file(const std::string& path,
                                      ExtendsResolver& resolver,
                                      const ComposeParseOptions& options) {
    LineReader reader(path, LineFilter::Compose);
    if (!reader.is_open()) {
        ComposeParseResult result;
        result.kind = ErrorKind::Io;
        result.error = "cannot read compose file: " + path;
        return result;
    }
    return parse_with_reader(reader, resolver, options);
}

ComposeParseResult parse_compose_string(const std::string& text, const std::string& source_path) {
    ExtendsResolver resolver;
    auto reader = LineReader::from_string(text, source_path, LineFilter::Compose);
    return parse_with_reader(reader, resolver, {});
}

} // namespace apco
