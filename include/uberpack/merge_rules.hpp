#pragma once

#include <string>

namespace uberpack {

// ============================================================================
// Entry Exclusion Rules
// ============================================================================

// Entries matching any rule never reach the working directory:
//   (.*/)?project.clj                   project descriptor, any directory
//   META-INF/.*\.(SF|RSA|DSA|MF)        signatures and manifests
// Matching is on the full entry path and case-sensitive.
bool is_excluded_entry(const std::string& entry_path);

// ============================================================================
// Mergeable Entries
// ============================================================================

// data_readers.clj and data_readers.cljc, matched on the final path segment.
// Conflicting copies of these are merged instead of dropped.
bool is_data_readers_entry(const std::string& entry_path);

// Multi-release marker, relative to the archive root
inline constexpr const char* MULTI_RELEASE_DIR = "META-INF/versions";

// Manifest entry written by the assembler
inline constexpr const char* MANIFEST_ENTRY = "META-INF/MANIFEST.MF";

} // namespace uberpack
