#include "uberpack/manifest.hpp"
#include "uberpack/merge_rules.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace uberpack {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Split one "name: value" line into CRLF-terminated physical lines
void append_wrapped_line(const std::string& line, std::string& out) {
    size_t pos = 0;
    size_t limit = MANIFEST_LINE_LIMIT;
    while (line.size() - pos > limit) {
        size_t cut = pos + limit;
        // Never split a multi-byte character
        while (cut > pos + 1 && is_utf8_continuation(line[cut])) {
            --cut;
        }
        out.append(line, pos, cut - pos);
        out += "\r\n ";
        pos = cut;
        limit = MANIFEST_LINE_LIMIT - 1;
    }
    out.append(line, pos, std::string::npos);
    out += "\r\n";
}

} // namespace

// ============================================================================
// ManifestAttributes
// ============================================================================

void ManifestAttributes::set(const std::string& name, const std::string& value) {
    for (auto& attr : attributes_) {
        if (iequals(attr.first, name)) {
            attr.second = value;
            return;
        }
    }
    attributes_.emplace_back(name, value);
}

std::optional<std::string> ManifestAttributes::get(const std::string& name) const {
    for (const auto& attr : attributes_) {
        if (iequals(attr.first, name)) {
            return attr.second;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Manifest Synthesis
// ============================================================================

std::string normalize_main_class(const std::string& main) {
    std::string result = main;
    std::replace(result.begin(), result.end(), '-', '_');
    return result;
}

bool has_multi_release_marker(const std::string& working_dir) {
    std::error_code ec;
    return std::filesystem::is_directory(std::filesystem::path(working_dir) / MULTI_RELEASE_DIR, ec);
}

ManifestResult synthesize_manifest(const ManifestInputs& inputs) {
    ManifestResult result;

    result.attributes.set(ATTR_MANIFEST_VERSION, MANIFEST_VERSION);
    result.attributes.set(ATTR_CREATED_BY, MANIFEST_CREATED_BY);
    result.attributes.set(ATTR_BUILD_JDK_SPEC, inputs.build_jdk_spec);

    if (inputs.main) {
        result.attributes.set(ATTR_MAIN_CLASS, normalize_main_class(*inputs.main));
    }
    if (inputs.multi_release) {
        result.attributes.set(ATTR_MULTI_RELEASE, "true");
    }

    for (const auto& [name, value] : inputs.overrides) {
        if (!is_valid_attribute_name(name)) {
            result.error = "invalid manifest attribute name: '" + name + "'";
            return result;
        }
        if (value.find_first_of("\r\n") != std::string::npos) {
            result.error = "manifest attribute value contains a line break: " + name;
            return result;
        }
        result.attributes.set(name, value);
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Manifest Serialization
// ============================================================================

bool is_valid_attribute_name(const std::string& name) {
    if (name.empty() || name.size() > 70) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

std::string serialize_manifest(const ManifestAttributes& attributes) {
    std::string out;

    if (auto version = attributes.get(ATTR_MANIFEST_VERSION)) {
        append_wrapped_line(std::string(ATTR_MANIFEST_VERSION) + ": " + *version, out);
    }
    for (const auto& [name, value] : attributes.items()) {
        if (iequals(name, ATTR_MANIFEST_VERSION)) {
            continue;
        }
        append_wrapped_line(name + ": " + value, out);
    }

    out += "\r\n";
    return out;
}

ManifestResult parse_manifest(const std::string& text) {
    ManifestResult result;

    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            lines.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }

    std::string name;
    std::string value;
    bool pending = false;
    for (const auto& line : lines) {
        if (line.empty()) {
            break;  // end of main section
        }
        if (line[0] == ' ') {
            if (!pending) {
                result.error = "continuation line without attribute";
                return result;
            }
            value += line.substr(1);
            continue;
        }
        if (pending) {
            result.attributes.set(name, value);
        }
        auto sep = line.find(": ");
        if (sep == std::string::npos) {
            result.error = "malformed manifest line: " + line;
            return result;
        }
        name = line.substr(0, sep);
        value = line.substr(sep + 2);
        pending = true;
    }
    if (pending) {
        result.attributes.set(name, value);
    }

    result.ok = true;
    return result;
}

} // namespace uberpack
