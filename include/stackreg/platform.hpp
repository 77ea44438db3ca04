#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace stackreg {

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Environment lookup seam; components that read the environment take one so
// callers can substitute a fixed map
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Lookup bound to the process environment
EnvLookup process_env();

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components; an absolute rel is returned unchanged
std::string join_path(const std::string& base, const std::string& rel);

// Resolve a path against base and normalize it lexically
std::string resolve_path(const std::string& base, const std::string& rel);

// Current working directory
std::string current_directory();

// Check if a path exists
bool path_exists(const std::string& path);

// Create directories recursively
bool create_directories(const std::string& path);

// Read entire file contents, nullopt if the file cannot be opened
std::optional<std::string> read_file(const std::string& path);

} // namespace stackreg
