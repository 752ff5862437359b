#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace uberpack {

// ============================================================================
// Library Nodes
// ============================================================================

// Opaque dependency identifier, e.g. "org.clojure/clojure"
using Coordinate = std::string;

// One resolved dependency as handed over by the resolver.
// dependents lists the coordinates that depend on this node directly.
struct LibraryNode {
    Coordinate coordinate;
    std::vector<std::string> paths;       // Directories or archive files, in order
    bool optional = false;
    std::vector<Coordinate> dependents;
};

// Resolved library map. Order is significant: it drives extraction order.
using LibraryMap = std::vector<LibraryNode>;

// Manifest attribute overrides as supplied by the caller, in order
using ManifestOverrides = std::vector<std::pair<std::string, std::string>>;

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    merge_conflict,          // Conflicting entry dropped, first writer kept
    data_readers_merged,     // Reader descriptor merged with an earlier copy
    invalid_configuration,
    unknown_dependent,       // Dependent coordinate not present in the library map
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::merge_conflict: return "merge_conflict";
        case Warning::data_readers_merged: return "data_readers_merged";
        case Warning::invalid_configuration: return "invalid_configuration";
        case Warning::unknown_dependent: return "unknown_dependent";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

} // namespace uberpack
