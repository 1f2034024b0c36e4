#pragma once

#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace llvmsel {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

Platform get_current_platform();

// Name of the configuration-query executable inside an installation's bin/
// ("llvm-config", or "llvm-config.exe" on Windows)
std::string query_executable_name();

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
    std::error_code code;  // errno-derived code of the failing call, if any
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// The temp file lives beside `path`, so the rename never crosses filesystems.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned int mode = 0644);

// Create a directory (and parents) with fsync on parent
AtomicWriteResult atomic_create_directory(const std::string& path);

// Point `link_path` at `target` by creating a temp symlink and renaming it
// over the existing entry. Readers see either the old or the new target.
AtomicWriteResult atomic_update_symlink(const std::string& link_path, const std::string& target);

// True if the error code means the caller lacked privilege (EACCES/EPERM)
bool is_permission_error(const std::error_code& code);

// ============================================================================
// Path Utilities
// ============================================================================

std::string get_parent_directory(const std::string& path);

std::string get_filename(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

// Absolute, lexically normalized form of a path (does not touch the filesystem)
std::string absolute_path(const std::string& path);

bool path_exists(const std::string& path);

bool is_directory(const std::string& path);

bool is_regular_file(const std::string& path);

// Check if a path is a symlink (does not follow it)
bool is_symlink(const std::string& path);

// Read symlink target
std::optional<std::string> read_symlink(const std::string& path);

// Read entire file contents
std::optional<std::string> read_file(const std::string& path);

// List names (not paths) of directory entries
std::vector<std::string> list_directory(const std::string& path);

// Remove a directory recursively; `ec` receives the failure, if any
bool remove_directory(const std::string& path, std::error_code& ec);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Directory containing the running executable, if it can be determined
std::optional<std::string> get_executable_directory();

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

} // namespace llvmsel
