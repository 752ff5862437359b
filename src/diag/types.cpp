#include "uberpack/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace uberpack {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "merge_conflict") return Warning::merge_conflict;
    if (lower == "data_readers_merged") return Warning::data_readers_merged;
    if (lower == "invalid_configuration") return Warning::invalid_configuration;
    if (lower == "unknown_dependent") return Warning::unknown_dependent;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

} // namespace uberpack
