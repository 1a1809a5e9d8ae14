#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wsk {

// ============================================================================
// File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Read entire file contents
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes
std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

// Resolve rel against base unless rel is already absolute
std::string resolve_path(const std::string& base, const std::string& rel);

bool is_directory(const std::string& path);

bool is_regular_file(const std::string& path);

bool create_directories(const std::string& path);

// Recursively find files with the given file name, sorted by path
std::vector<std::string> find_files_named(const std::string& root, const std::string& filename);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Snapshot of the process environment
std::unordered_map<std::string, std::string> get_all_env();

// Separator used in PATH-style variables
char get_path_separator();

// Current timestamp as RFC3339 string
std::string get_current_timestamp();

// Random version 4 UUID
std::string generate_uuid();

} // namespace wsk
