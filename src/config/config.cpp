#include "uberpack/config.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <nlohmann/json.hpp>

namespace uberpack {

namespace {

// Object keys keep file order: library order drives extraction order
using Json = nlohmann::ordered_json;

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    return dir.back() == '/' ? dir + name : dir + "/" + name;
}

std::string describe(const std::string& source_path) {
    return source_path.empty() ? std::string() : source_path + ": ";
}

// Optional string field; present with another type is an error
bool get_string(const Json& j, const std::string& key, std::optional<std::string>& out,
                std::string& error) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        error = "'" + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool get_string_array(const Json& j, const std::string& key, std::vector<std::string>& out,
                      std::string& error) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return true;
    }
    if (!it->is_array()) {
        error = "'" + key + "' must be an array of strings";
        return false;
    }
    for (const auto& elem : *it) {
        if (!elem.is_string()) {
            error = "'" + key + "' must be an array of strings";
            return false;
        }
        out.push_back(elem.get<std::string>());
    }
    return true;
}

// Manifest values are text; numbers and booleans keep their JSON spelling
bool manifest_value_to_text(const Json& value, std::string& out) {
    if (value.is_string()) {
        out = value.get<std::string>();
        return true;
    }
    if (value.is_number() || value.is_boolean()) {
        out = value.dump();
        return true;
    }
    return false;
}

} // namespace

BuildDefaults get_builtin_defaults() {
    return BuildDefaults{};
}

// ============================================================================
// Basis
// ============================================================================

BasisParseResult parse_basis(const std::string& json_str, const std::string& source_path) {
    BasisParseResult result;
    std::string prefix = describe(source_path);

    try {
        auto j = Json::parse(json_str);

        if (!j.is_object()) {
            result.error = prefix + "basis must be a JSON object";
            return result;
        }

        auto libs = j.find("libs");
        if (libs == j.end()) {
            result.error = prefix + "'libs' missing";
            return result;
        }
        if (!libs->is_object()) {
            result.error = prefix + "'libs' must be an object";
            return result;
        }

        for (auto& [coordinate, info] : libs->items()) {
            if (!info.is_object()) {
                result.error = prefix + "library " + coordinate + " must be an object";
                return result;
            }

            LibraryNode node;
            node.coordinate = coordinate;

            std::string error;
            if (!get_string_array(info, "paths", node.paths, error) ||
                !get_string_array(info, "dependents", node.dependents, error)) {
                result.error = prefix + "library " + coordinate + ": " + error;
                return result;
            }

            auto optional = info.find("optional");
            if (optional != info.end() && !optional->is_null()) {
                if (!optional->is_boolean()) {
                    result.error = prefix + "library " + coordinate + ": 'optional' must be a boolean";
                    return result;
                }
                node.optional = optional->get<bool>();
            }

            if (node.paths.empty()) {
                result.warnings.push_back("invalid_configuration:library_without_paths:" + coordinate);
            }

            result.libs.push_back(std::move(node));
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = prefix + std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = prefix + std::string("JSON error: ") + e.what();
        return result;
    }
}

// ============================================================================
// Build Parameters
// ============================================================================

ParamsParseResult parse_params(const std::string& json_str, const std::string& source_path) {
    ParamsParseResult result;
    std::string prefix = describe(source_path);

    try {
        auto j = Json::parse(json_str);

        if (!j.is_object()) {
            result.error = prefix + "params must be a JSON object";
            return result;
        }

        std::string error;
        if (!get_string(j, "target_dir", result.params.target_dir, error) ||
            !get_string(j, "class_dir", result.params.class_dir, error) ||
            !get_string(j, "uber_file", result.params.uber_file, error) ||
            !get_string(j, "main", result.params.main, error) ||
            !get_string(j, "project_root", result.params.project_root, error)) {
            result.error = prefix + error;
            return result;
        }

        // "manifest" section
        auto manifest = j.find("manifest");
        if (manifest != j.end() && !manifest->is_null()) {
            if (!manifest->is_object()) {
                result.error = prefix + "'manifest' must be an object";
                return result;
            }
            for (auto& [name, value] : manifest->items()) {
                std::string text;
                if (!manifest_value_to_text(value, text)) {
                    result.error = prefix + "manifest attribute " + name + " must be a scalar";
                    return result;
                }
                result.params.manifest.emplace_back(name, text);
            }
        }

        // "warnings" section
        auto policy = j.find("warnings");
        if (policy != j.end() && policy->is_object()) {
            for (auto& [key, val] : policy->items()) {
                std::string key_str = to_lower(key);
                if (!parse_warning_key(key_str)) {
                    result.warnings.push_back("invalid_configuration:unknown_warning_key:" + key_str);
                    continue;
                }
                std::optional<WarningAction> action;
                if (val.is_string()) {
                    action = parse_warning_action(val.get<std::string>());
                }
                if (action) {
                    result.params.warning_policy[key_str] = *action;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = prefix + std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = prefix + std::string("JSON error: ") + e.what();
        return result;
    }
}

void overlay_params(BuildParams& base, const BuildParams& overlay) {
    if (overlay.target_dir) base.target_dir = overlay.target_dir;
    if (overlay.class_dir) base.class_dir = overlay.class_dir;
    if (overlay.uber_file) base.uber_file = overlay.uber_file;
    if (overlay.main) base.main = overlay.main;
    if (overlay.project_root) base.project_root = overlay.project_root;

    base.manifest.insert(base.manifest.end(), overlay.manifest.begin(), overlay.manifest.end());
    for (const auto& [key, action] : overlay.warning_policy) {
        base.warning_policy[key] = action;
    }
}

UberParams merge_params(const BuildDefaults& defaults, const BuildParams& params, LibraryMap libs) {
    UberParams merged;
    merged.libs = std::move(libs);
    std::string target_dir = params.target_dir.value_or(defaults.target_dir);
    merged.class_dir = params.class_dir.value_or(join_path(target_dir, defaults.class_dir_name));
    merged.uber_file = params.uber_file.value_or(join_path(target_dir, defaults.uber_file_name));
    merged.main = params.main;
    merged.manifest = params.manifest;
    merged.project_root = params.project_root.value_or("");
    return merged;
}

} // namespace uberpack
