#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace apco {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// On failure nothing is left at path (an existing file is untouched).
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// ============================================================================
// File Reading
// ============================================================================

// Read a whole file; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Absolute, lexically normalized form of a path (no filesystem access
// beyond reading the current directory)
std::string absolute_path(const std::string& path);

// Check if a path exists
bool path_exists(const std::string& path);

// Check if a path is a directory
bool is_directory(const std::string& path);

// Check if a path is a regular file
bool is_regular_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get all environment variables as a map
std::unordered_map<std::string, std::string> get_all_env();

// Generate a UUID string
std::string generate_uuid();

} // namespace apco
