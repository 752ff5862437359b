#pragma once

#include "uberpack/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace uberpack {

// ============================================================================
// Manifest Attributes
// ============================================================================

inline constexpr const char* ATTR_MANIFEST_VERSION = "Manifest-Version";
inline constexpr const char* ATTR_CREATED_BY = "Created-By";
inline constexpr const char* ATTR_BUILD_JDK_SPEC = "Build-Jdk-Spec";
inline constexpr const char* ATTR_MAIN_CLASS = "Main-Class";
inline constexpr const char* ATTR_MULTI_RELEASE = "Multi-Release";

inline constexpr const char* MANIFEST_VERSION = "1.0";
inline constexpr const char* MANIFEST_CREATED_BY = "uberpack";

// Manifest line limit in bytes, excluding the line terminator
inline constexpr size_t MANIFEST_LINE_LIMIT = 72;

// Ordered attribute set. Names compare case-insensitively, as the runtime
// reading the manifest does; replacing a value keeps the first spelling and
// position of the name.
class ManifestAttributes {
public:
    void set(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;

    bool contains(const std::string& name) const { return get(name).has_value(); }

    size_t size() const { return attributes_.size(); }

    const std::vector<std::pair<std::string, std::string>>& items() const { return attributes_; }

private:
    std::vector<std::pair<std::string, std::string>> attributes_;
};

// ============================================================================
// Manifest Synthesis
// ============================================================================

// Replace the human-readable word separator: "my-app.core" -> "my_app.core"
std::string normalize_main_class(const std::string& main);

// True if working_dir contains META-INF/versions as a directory
bool has_multi_release_marker(const std::string& working_dir);

struct ManifestInputs {
    std::optional<std::string> main;
    bool multi_release = false;
    std::string build_jdk_spec;
    ManifestOverrides overrides;
};

struct ManifestResult {
    bool ok = false;
    std::string error;
    ManifestAttributes attributes;
};

// Built-in attributes, then derived ones, then caller overrides on top.
// Fails on an override whose name is not a valid attribute name.
ManifestResult synthesize_manifest(const ManifestInputs& inputs);

// ============================================================================
// Manifest Serialization
// ============================================================================

// Valid names are 1-70 characters of [A-Za-z0-9_-]
bool is_valid_attribute_name(const std::string& name);

// Main section text: Manifest-Version first, CRLF line endings, long lines
// continued with a leading space, terminated by an empty line.
std::string serialize_manifest(const ManifestAttributes& attributes);

// Parse a main section back into attributes (continuations are joined)
ManifestResult parse_manifest(const std::string& text);

} // namespace uberpack
