#include "uberpack/warnings.hpp"

#include <algorithm>
#include <cctype>

namespace uberpack {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

// ============================================================================
// WarningCollector Implementation
// ============================================================================

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(Warning warning) {
    emit(warning_to_string(warning), {});
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    WarningAction action = get_effective_action(warning_key);

    // Ignored warnings are still collected but marked
    warnings_.push_back({to_lower(warning_key), std::move(fields), action});
}

void WarningCollector::apply_override(const std::string& warning_key, WarningAction action) {
    overrides_[to_lower(warning_key)] = action;
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

bool WarningCollector::has_errors() const {
    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Error) {
            return true;
        }
    }
    return false;
}

std::string WarningCollector::first_error() const {
    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Error) {
            return format_warning({w.key, action_to_string(w.effective_action), w.fields});
        }
    }
    return "";
}

bool WarningCollector::has_effective_warnings() const {
    for (const auto& w : warnings_) {
        if (w.effective_action != WarningAction::Ignore) {
            return true;
        }
    }
    return false;
}

void WarningCollector::clear() {
    warnings_.clear();
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    std::string lower_key = to_lower(key);

    auto override_it = overrides_.find(lower_key);
    if (override_it != overrides_.end()) {
        return override_it->second;
    }

    auto policy_it = policy_.find(lower_key);
    if (policy_it != policy_.end()) {
        return policy_it->second;
    }

    return WarningAction::Warn;
}

std::string format_warning(const WarningObject& warning) {
    std::vector<std::pair<std::string, std::string>> fields(warning.fields.begin(),
                                                            warning.fields.end());
    std::sort(fields.begin(), fields.end());

    std::string out = warning.key;
    for (const auto& [name, value] : fields) {
        out += " " + name + "=" + value;
    }
    return out;
}

// ============================================================================
// CollectingConflictObserver
// ============================================================================

void CollectingConflictObserver::on_conflict_dropped(const std::string& entry_path,
                                                     const std::string& source_path) {
    collector_.emit(Warning::merge_conflict, warnings::merge_conflict(entry_path, source_path));
}

void CollectingConflictObserver::on_data_readers_merged(const std::string& entry_path,
                                                        const std::string& source_path) {
    collector_.emit(Warning::data_readers_merged,
                    warnings::data_readers_merged(entry_path, source_path));
}

} // namespace uberpack
