#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace uberpack {

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (archive entry format)
std::string to_portable_path(const std::string& path);

// Resolve path against project_root unless it is already absolute.
// An empty project_root means the current working directory; when that
// cannot be determined the path is returned normalized but relative.
std::string resolve_path(const std::string& project_root, const std::string& path);

struct CurrentDirectoryResult {
    bool ok = false;
    std::string error;
    std::string path;
};

CurrentDirectoryResult current_directory();

// Validate an archive entry name before it is joined under a root directory
struct PathValidation {
    bool safe = false;
    std::string error;
    std::string normalized_path;  // Normalized relative path, forward slashes
};

PathValidation validate_entry_path(const std::string& entry_path);

// ============================================================================
// File Operations
// ============================================================================

struct FileResult {
    bool ok = false;
    std::string error;
};

// Read a whole file as bytes
std::optional<std::string> read_file(const std::string& path);

// Replace a file's content
FileResult write_file(const std::string& path, const std::string& content);

// Last-modified time in seconds since the Unix epoch
std::optional<int64_t> get_last_modified(const std::string& path);

FileResult set_last_modified(const std::string& path, int64_t unix_seconds);

// Create all missing parent directories of path
FileResult ensure_parent_directory(const std::string& path);

// Move a finished file over its destination in one rename
FileResult replace_file(const std::string& from, const std::string& to);

// Remove a file if it exists
void remove_file(const std::string& path);

// ============================================================================
// Temporary Working Directories
// ============================================================================

struct TempDirResult {
    bool ok = false;
    std::string error;
    std::string path;
};

// Create a fresh, uniquely named directory "<prefix><uuid>" under parent.
// An empty parent means the system temporary directory.
TempDirResult create_temp_directory(const std::string& prefix, const std::string& parent = "");

// Owns a directory tree and removes it when destroyed
class ScopedDirectory {
public:
    explicit ScopedDirectory(std::string path) : path_(std::move(path)) {}
    ~ScopedDirectory();

    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Generate a UUID string
std::string generate_uuid();

// Specification version of the Java platform the archive is built for.
// UBERPACK_BUILD_JDK_SPEC wins, then JAVA_VERSION from $JAVA_HOME/release,
// otherwise "unknown".
std::string detect_build_jdk_spec();

// Map a full Java version to its specification version:
// "1.8.0_292" -> "1.8", "17.0.2" -> "17", "21" -> "21"
std::string java_version_to_spec(const std::string& java_version);

} // namespace uberpack
