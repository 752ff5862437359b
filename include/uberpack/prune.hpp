#pragma once

#include "uberpack/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace uberpack {

// ============================================================================
// Optional Dependency Pruning
// ============================================================================

struct PruneResult {
    bool ok = false;
    std::string error;
    LibraryMap kept;                  // Required nodes, input order preserved
    std::vector<Coordinate> pruned;   // Optional and transitively optional nodes
    // (library, dependent) pairs whose dependent is not in the map
    std::vector<std::pair<Coordinate, Coordinate>> unknown_dependents;
};

// Drop optional nodes, then repeatedly drop any required node whose
// dependents are non-empty and all already dropped, until a pass moves
// nothing. Nodes without dependents are never dropped unless optional.
//
// Duplicate coordinates, self-dependencies and dependency cycles are
// rejected. Dependents that are not in the map count as required.
PruneResult remove_optional(const LibraryMap& libs);

} // namespace uberpack
