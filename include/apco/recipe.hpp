#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace apco {

// ============================================================================
// Recipe Model
// ============================================================================

struct FilePair {
    std::string source;
    std::string destination;
};

struct LabelPair {
    std::string key;
    std::string value;
};

/**
 * CMD / ENTRYPOINT value, decided once at parse time: either the token list
 * of a bracketed array literal or the raw shell-form text.
 */
struct ExecForm {
    enum class Kind {
        Unset,
        List,
        Shell,
    };

    Kind kind = Kind::Unset;
    std::vector<std::string> tokens;  // Kind::List
    std::string text;                 // Kind::Shell

    bool is_set() const { return kind != Kind::Unset; }

    // Tokens joined with single spaces, or the shell text
    std::string joined() const;

    static ExecForm list(std::vector<std::string> tokens);
    static ExecForm shell(std::string text);
};

// One FROM-delimited segment of a Dockerfile
struct BuildStage {
    std::string name;
    size_t index = 0;  // 1-based creation order

    std::optional<std::string> from_header;  // Base image, required by the writer

    std::vector<std::string> install;      // %post lines in order
    std::vector<std::string> environment;  // KEY=VALUE assignments
    std::vector<LabelPair> labels;
    std::vector<FilePair> files;

    // Source stage -> copies from it, in order of first reference
    std::vector<std::pair<std::string, std::vector<FilePair>>> stage_files;

    ExecForm cmd;
    ExecForm entrypoint;
    std::optional<std::string> test;
    std::optional<std::string> workdir;

    // Recorded for reference only
    std::vector<std::string> volumes;
    std::vector<std::string> ports;
    std::optional<std::string> stop_signal;

    void add_stage_file(const std::string& stage, FilePair pair);
};

struct Recipe {
    std::string source_path;
    std::vector<BuildStage> stages;  // Creation order

    BuildStage* find_stage(const std::string& name);
    const BuildStage* find_stage(const std::string& name) const;
};

} // namespace apco
