#include "apco/path_utils.hpp"

#include <string>

namespace apco {

namespace {

bool replace_all(std::string& s, const std::string& from, const std::string& to) {
    bool changed = false;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        changed = true;
    }
    return changed;
}

} // namespace

std::string remove_redundant_slashes(const std::string& path) {
    std::string out = path;

    bool changed = true;
    while (changed) {
        changed = replace_all(out, "//", "/");
        changed = replace_all(out, "/./", "/") || changed;
    }

    // "dir/." names the directory itself
    while (out.size() > 2 && out.compare(out.size() - 2, 2, "/.") == 0) {
        out.erase(out.size() - 2);
    }

    return out;
}

std::string rebase_path(const std::string& dir, const std::string& rel) {
    if (dir.empty()) {
        return rel;
    }
    if (rel.empty() || rel == ".") {
        return remove_redundant_slashes(dir);
    }
    return remove_redundant_slashes(dir + "/" + rel);
}

bool is_absolute_path(const std::string& path) {
    return !path.empty() && path[0] == '/';
}

std::string directory_of(const std::string& file_path) {
    auto pos = file_path.rfind('/');
    if (pos == std::string::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return file_path.substr(0, pos);
}

} // namespace apco
