#pragma once

#include "uberpack/manifest.hpp"
#include "uberpack/types.hpp"
#include "uberpack/warnings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace uberpack {

// ============================================================================
// Uber Archive Assembly
// ============================================================================

struct UberParams {
    LibraryMap libs;                      // Resolved library map, in resolution order
    std::string class_dir;                // Compiled project output, extracted last
    std::string uber_file;                // Destination archive
    std::optional<std::string> main;      // Entry-point namespace, e.g. "my-app.core"
    ManifestOverrides manifest;           // Applied on top of derived attributes
    std::string project_root;             // Base for relative paths; empty = cwd

    // Build-Jdk-Spec value; detected from the environment when unset
    std::optional<std::string> build_jdk_spec;

    // Parent of the temporary working directory; empty = system temp dir
    std::string work_root;

    // Optional diagnostics. When only warnings is set, merge decisions are
    // forwarded to it through a CollectingConflictObserver.
    ConflictObserver* observer = nullptr;
    WarningCollector* warnings = nullptr;
};

struct UberResult {
    bool ok = false;
    std::string error;

    std::string uber_file;                // Resolved destination path
    std::string working_dir;              // Removed before uber() returns
    std::vector<std::string> sources;     // Resolved sources, in extraction order
    std::vector<Coordinate> pruned;       // Libraries dropped as optional
    ManifestAttributes manifest;

    size_t entries_written = 0;           // Entries in the output archive, manifest included
    size_t files_merged = 0;
    size_t conflicts_dropped = 0;
    size_t entries_excluded = 0;
};

// Flatten the pruned library map into extraction order: every library's
// paths in map order, then class_dir. Relative paths are resolved against
// project_root.
std::vector<std::string> resolve_source_paths(const LibraryMap& kept,
                                              const std::string& class_dir,
                                              const std::string& project_root);

// Build a single executable archive from the library map and the compiled
// output directory.
//
// Steps: prune optional libraries, explode every source into a fresh
// working directory (first writer wins, reader descriptors merged),
// synthesize the manifest, then write the archive with the manifest first.
// The working directory is removed on every return path.
UberResult uber(UberParams params);

} // namespace uberpack
