#pragma once

#include <apco/platform.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace apco::test {

namespace fs = std::filesystem;

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("apco_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

// Changes the working directory for the lifetime of the object
class ScopedCwd {
public:
    explicit ScopedCwd(const std::string& dir) : previous_(fs::current_path()) {
        fs::current_path(dir);
    }

    ~ScopedCwd() {
        std::error_code ec;
        fs::current_path(previous_, ec);
    }

private:
    fs::path previous_;
};

inline void write_text(const std::string& path, const std::string& content) {
    fs::path p(path);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path());
    }
    std::ofstream out(path, std::ios::binary);
    out << content;
}

} // namespace apco::test
