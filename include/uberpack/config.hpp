#pragma once

#include "uberpack/types.hpp"
#include "uberpack/uber.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace uberpack {

// ============================================================================
// Build Defaults
// ============================================================================

// class_dir and uber_file default to these names under target_dir
struct BuildDefaults {
    std::string target_dir = "target";
    std::string class_dir_name = "classes";
    std::string uber_file_name = "app.jar";
};

BuildDefaults get_builtin_defaults();

// ============================================================================
// Basis (resolved library map)
// ============================================================================

struct BasisParseResult {
    bool ok = false;
    std::string error;
    LibraryMap libs;
    std::vector<std::string> warnings;
};

// Parse {"libs": {"<coord>": {"paths": [...], "optional": bool,
// "dependents": [...]}}}. Library order follows the file.
BasisParseResult parse_basis(const std::string& json_str, const std::string& source_path = "");

// ============================================================================
// Build Parameters
// ============================================================================

// Caller-supplied parameters; unset fields fall back to the defaults
struct BuildParams {
    std::optional<std::string> target_dir;
    std::optional<std::string> class_dir;
    std::optional<std::string> uber_file;
    std::optional<std::string> main;
    std::optional<std::string> project_root;
    ManifestOverrides manifest;
    std::unordered_map<std::string, WarningAction> warning_policy;
};

struct ParamsParseResult {
    bool ok = false;
    std::string error;
    BuildParams params;
    std::vector<std::string> warnings;   // "invalid_configuration:<reason>"
};

ParamsParseResult parse_params(const std::string& json_str, const std::string& source_path = "");

// Lay overlay on top of base: set fields replace, manifest entries append
void overlay_params(BuildParams& base, const BuildParams& overlay);

// Defaults first, then the caller's parameters, applied once
UberParams merge_params(const BuildDefaults& defaults, const BuildParams& params, LibraryMap libs);

} // namespace uberpack
