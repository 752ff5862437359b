#include "uberpack/uber.hpp"
#include "uberpack/extractor.hpp"
#include "uberpack/merge_rules.hpp"
#include "uberpack/platform.hpp"
#include "uberpack/prune.hpp"
#include "uberpack/zip.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace uberpack {

namespace {

struct WorkingEntry {
    std::string name;      // Portable relative path; directories end in '/'
    std::string path;      // Absolute path in the working directory
    bool directory = false;
};

bool collect_working_entries(const std::string& working_dir, std::vector<WorkingEntry>& entries,
                             std::string& error) {
    fs::path root(working_dir);
    std::error_code ec;

    fs::recursive_directory_iterator it(root, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        WorkingEntry entry;
        entry.path = it->path().string();
        entry.name = to_portable_path(it->path().lexically_relative(root).generic_string());

        std::error_code status_ec;
        entry.directory = it->is_directory(status_ec);
        if (entry.directory) {
            entry.name += "/";
        }
        entries.push_back(std::move(entry));
    }
    if (ec) {
        error = "failed to walk working directory: " + ec.message();
        return false;
    }

    // A directory name ends in '/', so it sorts before its own contents
    std::sort(entries.begin(), entries.end(),
              [](const WorkingEntry& a, const WorkingEntry& b) { return a.name < b.name; });
    return true;
}

int64_t now_unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

bool write_archive(const std::string& working_dir, const std::string& output,
                   const ManifestAttributes& manifest, UberResult& result) {
    std::vector<WorkingEntry> entries;
    if (!collect_working_entries(working_dir, entries, result.error)) {
        return false;
    }

    ZipWriter writer(output);
    auto opened = writer.open();
    if (!opened.ok) {
        result.error = opened.error;
        return false;
    }

    auto added = writer.add_bytes(MANIFEST_ENTRY, serialize_manifest(manifest), now_unix_seconds());
    if (!added.ok) {
        result.error = added.error;
        return false;
    }

    for (const auto& entry : entries) {
        if (entry.name == MANIFEST_ENTRY) {
            continue;
        }

        auto mtime = get_last_modified(entry.path);
        if (!mtime) {
            result.error = "failed to stat " + entry.path;
            return false;
        }

        if (entry.directory) {
            added = writer.add_directory(entry.name.substr(0, entry.name.size() - 1), *mtime);
        } else {
            std::ifstream in(entry.path, std::ios::binary);
            if (!in) {
                result.error = "failed to open " + entry.path;
                return false;
            }
            added = writer.add_stream(entry.name, in, *mtime);
        }
        if (!added.ok) {
            result.error = added.error;
            return false;
        }
    }

    auto finished = writer.finish();
    if (!finished.ok) {
        result.error = finished.error;
        return false;
    }

    result.entries_written = writer.entry_count();
    return true;
}

} // namespace

std::vector<std::string> resolve_source_paths(const LibraryMap& kept,
                                              const std::string& class_dir,
                                              const std::string& project_root) {
    std::vector<std::string> sources;
    for (const auto& lib : kept) {
        for (const auto& path : lib.paths) {
            sources.push_back(resolve_path(project_root, path));
        }
    }
    sources.push_back(resolve_path(project_root, class_dir));
    return sources;
}

UberResult uber(UberParams params) {
    UberResult result;

    if (params.uber_file.empty()) {
        result.error = "uber_file is required";
        return result;
    }
    if (params.class_dir.empty()) {
        result.error = "class_dir is required";
        return result;
    }

    auto temp = create_temp_directory("uber", params.work_root);
    if (!temp.ok) {
        result.error = temp.error;
        return result;
    }
    ScopedDirectory working_dir(temp.path);
    result.working_dir = working_dir.path();

    // Prune optional libraries
    auto pruned = remove_optional(params.libs);
    if (!pruned.ok) {
        result.error = pruned.error;
        return result;
    }
    result.pruned = pruned.pruned;

    if (params.warnings) {
        for (const auto& [coordinate, dependent] : pruned.unknown_dependents) {
            params.warnings->emit(Warning::unknown_dependent,
                                  warnings::unknown_dependent(coordinate, dependent));
        }
    }

    // Relative paths need a base; pin it once so every path agrees
    if (params.project_root.empty()) {
        auto cwd = current_directory();
        if (!cwd.ok) {
            result.error = cwd.error;
            return result;
        }
        params.project_root = cwd.path;
    }

    result.sources = resolve_source_paths(pruned.kept, params.class_dir, params.project_root);
    result.uber_file = resolve_path(params.project_root, params.uber_file);

    auto parent = ensure_parent_directory(result.uber_file);
    if (!parent.ok) {
        result.error = parent.error;
        return result;
    }

    // Explode every source in order
    std::unique_ptr<CollectingConflictObserver> collecting;
    ExtractOptions options;
    options.observer = params.observer;
    if (!options.observer && params.warnings) {
        collecting = std::make_unique<CollectingConflictObserver>(*params.warnings);
        options.observer = collecting.get();
    }

    for (const auto& source : result.sources) {
        auto extracted = explode(source, working_dir.path(), options);
        if (!extracted.ok) {
            result.error = extracted.error;
            return result;
        }
        result.files_merged += extracted.files_merged;
        result.conflicts_dropped += extracted.conflicts_dropped;
        result.entries_excluded += extracted.entries_excluded;

        if (params.warnings && params.warnings->has_errors()) {
            result.error = "warning treated as error while processing " + source + ": " +
                           params.warnings->first_error();
            return result;
        }
    }

    // Synthesize the manifest
    ManifestInputs inputs;
    inputs.main = params.main;
    inputs.multi_release = has_multi_release_marker(working_dir.path());
    inputs.overrides = params.manifest;
    if (params.build_jdk_spec) {
        inputs.build_jdk_spec = *params.build_jdk_spec;
    } else {
        inputs.build_jdk_spec = detect_build_jdk_spec();
    }

    auto manifest = synthesize_manifest(inputs);
    if (!manifest.ok) {
        result.error = manifest.error;
        return result;
    }
    result.manifest = manifest.attributes;

    // Write the archive next to its destination, then move it into place
    std::string partial = result.uber_file + ".partial-" + generate_uuid();
    if (!write_archive(working_dir.path(), partial, result.manifest, result)) {
        remove_file(partial);
        return result;
    }

    auto moved = replace_file(partial, result.uber_file);
    if (!moved.ok) {
        remove_file(partial);
        result.error = moved.error;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace uberpack
