#pragma once

#include "uberpack/warnings.hpp"

#include <cstddef>
#include <string>

namespace uberpack {

// ============================================================================
// Exploding Sources into the Working Directory
// ============================================================================

struct ExtractOptions {
    // Receives dropped conflicts and descriptor merges; may be null
    ConflictObserver* observer = nullptr;

    // Size of the single copy buffer used for the whole source
    size_t buffer_size = 16 * 1024;
};

struct ExtractResult {
    bool ok = false;
    std::string error;
    size_t files_written = 0;      // New files placed in the working directory
    size_t files_merged = 0;       // Reader descriptors merged into an existing copy
    size_t conflicts_dropped = 0;  // Entries dropped because the path was taken
    size_t entries_excluded = 0;   // Entries matching an exclusion rule
};

// Place every non-excluded file of source_path under working_dir.
//
// source_path may be a directory (walked recursively) or an archive file
// (entries streamed one at a time). For every file:
//   - excluded paths are skipped;
//   - a path not yet present is written and gets the source's timestamp;
//   - an existing data_readers.clj/.cljc is merged with the new copy, the
//     new copy's values winning on shared keys;
//   - any other existing path keeps its first content.
//
// Any read, write or descriptor parse failure aborts with an error.
ExtractResult explode(const std::string& source_path,
                      const std::string& working_dir,
                      const ExtractOptions& options = {});

} // namespace uberpack
