#include "apco/line_reader.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace apco {

LineReader::LineReader(const std::string& path, LineFilter filter)
    : source_name_(path), filter_(filter) {
    auto file = std::make_unique<std::ifstream>(path);
    if (!file->is_open()) {
        failed_ = true;
    }
    in_ = std::move(file);
}

LineReader::LineReader(std::unique_ptr<std::istream> in, std::string source_name, LineFilter filter)
    : in_(std::move(in)), source_name_(std::move(source_name)), filter_(filter) {}

LineReader LineReader::from_string(const std::string& text,
                                   const std::string& source_name,
                                   LineFilter filter) {
    return LineReader(std::make_unique<std::istringstream>(text), source_name, filter);
}

bool LineReader::is_skipped(const std::string& text, LineFilter filter) {
    size_t pos = text.find_first_not_of(" \t\r");
    if (pos == std::string::npos) {
        return true;
    }
    if (filter == LineFilter::Dockerfile) {
        return false;
    }

    // Only leading spaces are skipped when looking for comment/extension markers
    size_t first = text.find_first_not_of(' ');
    if (text[first] == '#') {
        return true;
    }
    return text.compare(first, 2, "x-") == 0;
}

std::optional<Line> LineReader::next() {
    if (!is_open() || finished_) {
        return std::nullopt;
    }

    std::string text;
    while (std::getline(*in_, text)) {
        ++line_number_;
        if (!text.empty() && text.back() == '\r') {
            text.pop_back();
        }
        if (is_skipped(text, filter_)) {
            continue;
        }
        return Line{line_number_, std::move(text)};
    }

    finished_ = true;
    return std::nullopt;
}

} // namespace apco
