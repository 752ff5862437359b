#pragma once

#include "uberpack/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace uberpack {

// ============================================================================
// Warning Collector
// ============================================================================

class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    // Emit a warning with fields
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Emit a warning with no fields
    void emit(Warning warning);

    // Emit a warning by key string (for dynamic warning keys)
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Override the policy for one key, e.g. --strict turns merge_conflict into an error
    void apply_override(const std::string& warning_key, WarningAction action);

    // Get all emitted warnings after policy application.
    // Warnings with action "ignore" are excluded.
    std::vector<WarningObject> get_warnings() const;

    // Check if any warning was upgraded to error
    bool has_errors() const;

    // First warning that was upgraded to error, formatted for an error message
    std::string first_error() const;

    bool has_effective_warnings() const;

    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;
    std::unordered_map<std::string, WarningAction> overrides_;

    WarningAction get_effective_action(const std::string& key) const;
};

// Render "key field=value ..." with fields sorted by name
std::string format_warning(const WarningObject& warning);

// ============================================================================
// Merge Conflict Reporting
// ============================================================================

// Receives merge decisions made while exploding sources into the working
// directory. Nothing is reported unless an observer is installed.
class ConflictObserver {
public:
    virtual ~ConflictObserver() = default;

    // A later source carried entry_path and it was dropped in favour of the
    // file already in the working directory.
    virtual void on_conflict_dropped(const std::string& entry_path,
                                     const std::string& source_path) = 0;

    // A reader descriptor from source_path was merged into an earlier copy.
    virtual void on_data_readers_merged(const std::string& entry_path,
                                        const std::string& source_path) {
        (void)entry_path;
        (void)source_path;
    }
};

// Forwards merge decisions to a WarningCollector
class CollectingConflictObserver : public ConflictObserver {
public:
    explicit CollectingConflictObserver(WarningCollector& collector)
        : collector_(collector) {}

    void on_conflict_dropped(const std::string& entry_path,
                             const std::string& source_path) override;

    void on_data_readers_merged(const std::string& entry_path,
                                const std::string& source_path) override;

private:
    WarningCollector& collector_;
};

// ============================================================================
// Convenience functions for warning fields
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> merge_conflict(
    const std::string& entry,
    const std::string& source_path) {
    return {{"entry", entry}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> data_readers_merged(
    const std::string& entry,
    const std::string& source_path) {
    return {{"entry", entry}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> unknown_dependent(
    const std::string& coordinate,
    const std::string& dependent) {
    return {{"coordinate", coordinate}, {"dependent", dependent}};
}

inline std::unordered_map<std::string, std::string> invalid_configuration(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

} // namespace warnings

} // namespace uberpack
