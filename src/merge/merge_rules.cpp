#include "uberpack/merge_rules.hpp"

#include <array>

namespace uberpack {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// (.*/)?project.clj
bool is_project_descriptor(const std::string& path) {
    const std::string name = "project.clj";
    if (!ends_with(path, name)) {
        return false;
    }
    return path.size() == name.size() || path[path.size() - name.size() - 1] == '/';
}

// META-INF/.*\.(SF|RSA|DSA|MF)
bool is_signature_or_manifest(const std::string& path) {
    const std::string prefix = "META-INF/";
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    for (const char* ext : {".SF", ".RSA", ".DSA", ".MF"}) {
        std::string suffix(ext);
        // The extension must follow the prefix, not overlap it
        if (path.size() >= prefix.size() + suffix.size() && ends_with(path, suffix)) {
            return true;
        }
    }
    return false;
}

using EntryPredicate = bool (*)(const std::string&);

constexpr std::array<EntryPredicate, 2> EXCLUSION_RULES = {
    is_project_descriptor,
    is_signature_or_manifest,
};

} // namespace

bool is_excluded_entry(const std::string& entry_path) {
    for (EntryPredicate rule : EXCLUSION_RULES) {
        if (rule(entry_path)) {
            return true;
        }
    }
    return false;
}

bool is_data_readers_entry(const std::string& entry_path) {
    auto slash = entry_path.rfind('/');
    std::string name = slash == std::string::npos ? entry_path : entry_path.substr(slash + 1);
    return name == "data_readers.clj" || name == "data_readers.cljc";
}

} // namespace uberpack
