#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lfsget {

class Logger;

// ============================================================================
// Directory Creation
// ============================================================================

struct EnsureDirectoryResult {
    bool ok = false;
    bool created = false;       // true only if a directory was actually made
    std::string error;
    std::string directory;      // absolute directory that was ensured
};

// Make sure a directory exists, creating every missing segment.
// When is_directory is false, path names a file and its parent is ensured.
// Idempotent: a directory that already exists is ok with created == false.
// `created` is informational; callers must not branch on it.
EnsureDirectoryResult ensure_directory(const std::string& path, bool is_directory,
                                       Logger& logger);

// ============================================================================
// Path Utilities
// ============================================================================

std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);

std::string get_filename(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

std::string absolute_path(const std::string& path);

bool path_exists(const std::string& path);

bool is_directory(const std::string& path);

bool is_regular_file(const std::string& path);

// Size of a regular file, nullopt when missing or not a file
std::optional<std::uint64_t> file_size(const std::string& path);

bool remove_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Local time formatted for file names: YYYY-mm-ddTHH-MM-SS
std::string get_file_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace lfsget
