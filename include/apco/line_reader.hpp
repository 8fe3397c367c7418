#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace apco {

// One line that survived filtering, numbered from 1 in the original file
struct Line {
    size_t number = 0;
    std::string text;
};

enum class LineFilter {
    // Drop blank lines, '#' comment lines and "x-" extension keys
    Compose,
    // Drop blank lines only; comments are meaningful to the Dockerfile parser
    Dockerfile,
};

/**
 * Forward-only reader over the lines of a text document.
 *
 * Lines are read lazily on each call to next(). Kept lines are returned
 * unmodified apart from a trailing '\r'. End of input is reported by an
 * empty optional, and every later call returns the same.
 */
class LineReader {
public:
    // Open a file; check is_open() before reading
    explicit LineReader(const std::string& path, LineFilter filter = LineFilter::Compose);

    // Read from in-memory text; source_name is used in diagnostics only
    static LineReader from_string(const std::string& text,
                                  const std::string& source_name,
                                  LineFilter filter = LineFilter::Compose);

    LineReader(LineReader&&) = default;
    LineReader& operator=(LineReader&&) = default;

    bool is_open() const { return in_ != nullptr && !failed_; }
    const std::string& source_name() const { return source_name_; }

    std::optional<Line> next();

    // True if the filter drops this line
    static bool is_skipped(const std::string& text, LineFilter filter);

private:
    LineReader(std::unique_ptr<std::istream> in, std::string source_name, LineFilter filter);

    std::unique_ptr<std::istream> in_;
    std::string source_name_;
    LineFilter filter_ = LineFilter::Compose;
    size_t line_number_ = 0;
    bool failed_ = false;
    bool finished_ = false;
};

} // namespace apco
