#include "apco/platform.hpp"
#include "apco/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <sstream>
#include <unordered_map>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif

namespace apco {

namespace fs = std::filesystem;

namespace {

// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

// Forward slashes only
std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

// Generate a temporary filename next to base
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    return atomic_write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    AtomicWriteResult result;

    // temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = directory_of(path);
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file for " + path + ": " + std::string(strerror(errno));
        return result;
    }

    ssize_t written = write(fd, content.data(), content.size());
    if (written < 0 || static_cast<size_t>(written) != content.size()) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write content to " + path;
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file for " + path;
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file to " + path + ": " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) {
        return to_portable_path(fs::path(path).lexically_normal().string());
    }
    return to_portable_path(abs.lexically_normal().string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

std::unordered_map<std::string, std::string> get_all_env() {
    std::unordered_map<std::string, std::string> env;

    for (char** ep = environ; *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        if (eq != std::string::npos) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }

    return env;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace apco
