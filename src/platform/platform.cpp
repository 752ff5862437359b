#include "uberpack/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <sys/types.h>
#include <sys/utime.h>
#include <sys/stat.h>
#else
#include <sys/stat.h>
#include <sys/time.h>
#endif

namespace uberpack {

namespace fs = std::filesystem;

// ============================================================================
// Path Utilities
// ============================================================================

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string resolve_path(const std::string& project_root, const std::string& path) {
    fs::path p(path);
    if (p.is_absolute()) {
        return p.lexically_normal().string();
    }
    fs::path root(project_root);
    if (project_root.empty()) {
        auto cwd = current_directory();
        if (!cwd.ok) {
            return p.lexically_normal().string();
        }
        root = cwd.path;
    }
    return (root / p).lexically_normal().string();
}

CurrentDirectoryResult current_directory() {
    CurrentDirectoryResult result;

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        result.error = "cannot determine current directory: " + ec.message();
        return result;
    }

    result.ok = true;
    result.path = cwd.string();
    return result;
}

PathValidation validate_entry_path(const std::string& entry_path) {
    PathValidation result;

    std::string portable = to_portable_path(entry_path);

    if (portable.empty()) {
        result.error = "empty entry name";
        return result;
    }

    // Reject absolute paths, including drive-letter forms
    if (portable[0] == '/' || (portable.size() > 1 && portable[1] == ':')) {
        result.error = "absolute path not allowed: " + entry_path;
        return result;
    }

    std::string normalized;
    std::istringstream ss(portable);
    std::string comp;
    while (std::getline(ss, comp, '/')) {
        if (comp == "..") {
            result.error = "path traversal not allowed: " + entry_path;
            return result;
        }
        if (comp.empty() || comp == ".") {
            continue;
        }
        if (!normalized.empty()) {
            normalized += '/';
        }
        normalized += comp;
    }

    if (normalized.empty()) {
        result.error = "entry name has no components: " + entry_path;
        return result;
    }

    result.safe = true;
    result.normalized_path = normalized;
    return result;
}

// ============================================================================
// File Operations
// ============================================================================

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return ss.str();
}

FileResult write_file(const std::string& path, const std::string& content) {
    FileResult result;

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        result.error = "failed to open for writing: " + path;
        return result;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        result.error = "failed to write: " + path;
        return result;
    }

    result.ok = true;
    return result;
}

std::optional<int64_t> get_last_modified(const std::string& path) {
#ifdef _WIN32
    struct _stat64 st;
    if (_stat64(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
#else
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
#endif
    return static_cast<int64_t>(st.st_mtime);
}

FileResult set_last_modified(const std::string& path, int64_t unix_seconds) {
    FileResult result;

#ifdef _WIN32
    struct __utimbuf64 times;
    times.actime = unix_seconds;
    times.modtime = unix_seconds;
    if (_utime64(path.c_str(), &times) != 0) {
        result.error = "failed to set modification time: " + path;
        return result;
    }
#else
    struct timeval times[2];
    times[0].tv_sec = static_cast<time_t>(unix_seconds);
    times[0].tv_usec = 0;
    times[1] = times[0];
    if (utimes(path.c_str(), times) != 0) {
        result.error = "failed to set modification time: " + path;
        return result;
    }
#endif

    result.ok = true;
    return result;
}

FileResult ensure_parent_directory(const std::string& path) {
    FileResult result;

    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        result.ok = true;
        return result;
    }

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        result.error = "failed to create directory " + parent.string() + ": " + ec.message();
        return result;
    }
    if (!fs::is_directory(parent, ec)) {
        result.error = "not a directory: " + parent.string();
        return result;
    }

    result.ok = true;
    return result;
}

FileResult replace_file(const std::string& from, const std::string& to) {
    FileResult result;

    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        result.error = "failed to move " + from + " to " + to + ": " + ec.message();
        return result;
    }

    result.ok = true;
    return result;
}

void remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

// ============================================================================
// Temporary Working Directories
// ============================================================================

TempDirResult create_temp_directory(const std::string& prefix, const std::string& parent) {
    TempDirResult result;

    std::error_code ec;
    fs::path base = parent.empty() ? fs::temp_directory_path(ec) : fs::path(parent);
    if (ec) {
        result.error = "no temporary directory: " + ec.message();
        return result;
    }

    fs::create_directories(base, ec);
    if (ec) {
        result.error = "failed to create " + base.string() + ": " + ec.message();
        return result;
    }

    // create_directory reports false when the name is already taken
    for (int attempt = 0; attempt < 8; ++attempt) {
        fs::path candidate = base / (prefix + generate_uuid());
        if (fs::create_directory(candidate, ec)) {
            result.ok = true;
            result.path = candidate.string();
            return result;
        }
        if (ec) {
            result.error = "failed to create " + candidate.string() + ": " + ec.message();
            return result;
        }
    }

    result.error = "could not find an unused temporary directory name under " + base.string();
    return result;
}

ScopedDirectory::~ScopedDirectory() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
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

std::string java_version_to_spec(const std::string& java_version) {
    std::string version = java_version;

    // Strip surrounding quotes as found in the release file
    if (version.size() >= 2 && version.front() == '"' && version.back() == '"') {
        version = version.substr(1, version.size() - 2);
    }

    std::vector<std::string> parts;
    std::string current;
    for (char c : version) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            current += c;
        } else {
            if (!current.empty()) {
                parts.push_back(current);
            }
            current.clear();
            if (c != '.') {
                break;
            }
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }

    if (parts.empty()) {
        return "unknown";
    }
    // Legacy numbering keeps the "1." prefix: 1.8.0_292 maps to 1.8
    if (parts[0] == "1" && parts.size() > 1) {
        return "1." + parts[1];
    }
    return parts[0];
}

std::string detect_build_jdk_spec() {
    if (auto spec = get_env("UBERPACK_BUILD_JDK_SPEC"); spec && !spec->empty()) {
        return *spec;
    }

    auto java_home = get_env("JAVA_HOME");
    if (!java_home || java_home->empty()) {
        return "unknown";
    }

    auto release = read_file((fs::path(*java_home) / "release").string());
    if (!release) {
        return "unknown";
    }

    std::istringstream lines(*release);
    std::string line;
    const std::string key = "JAVA_VERSION=";
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.rfind(key, 0) == 0) {
            return java_version_to_spec(line.substr(key.size()));
        }
    }

    return "unknown";
}

} // namespace uberpack
