#pragma once

#include <string>

namespace apco {

// Collapse doubled separators and "/./" segments until none remain.
// Leading "./" and ".." segments are kept as written.
std::string remove_redundant_slashes(const std::string& path);

// Prefix rel with dir ("<dir>/<rel>") and remove redundant separators.
// rel is returned unchanged when dir is empty.
std::string rebase_path(const std::string& dir, const std::string& rel);

// True for paths starting with '/'
bool is_absolute_path(const std::string& path);

// Directory part of a file path as written, "." for a bare filename
std::string directory_of(const std::string& file_path);

} // namespace apco
