#include "uberpack/prune.hpp"

#include <deque>
#include <unordered_map>

namespace uberpack {

namespace {

// Index-based view of the library map; dependents refer to node ids
struct DependencyGraph {
    std::vector<const LibraryNode*> nodes;
    std::vector<std::vector<size_t>> dependents;
    std::vector<bool> has_unknown_dependent;
};

bool build_graph(const LibraryMap& libs, DependencyGraph& graph, PruneResult& result) {
    std::unordered_map<Coordinate, size_t> ids;
    ids.reserve(libs.size());

    for (const auto& lib : libs) {
        if (!ids.emplace(lib.coordinate, graph.nodes.size()).second) {
            result.error = "duplicate library coordinate: " + lib.coordinate;
            return false;
        }
        graph.nodes.push_back(&lib);
    }

    graph.dependents.resize(libs.size());
    graph.has_unknown_dependent.assign(libs.size(), false);

    for (size_t i = 0; i < libs.size(); ++i) {
        for (const auto& dep : libs[i].dependents) {
            if (dep == libs[i].coordinate) {
                result.error = "library lists itself as a dependent: " + dep;
                return false;
            }
            auto it = ids.find(dep);
            if (it == ids.end()) {
                graph.has_unknown_dependent[i] = true;
                result.unknown_dependents.emplace_back(libs[i].coordinate, dep);
                continue;
            }
            graph.dependents[i].push_back(it->second);
        }
    }
    return true;
}

// Kahn's algorithm over node -> dependent edges
bool check_acyclic(const DependencyGraph& graph, PruneResult& result) {
    size_t n = graph.nodes.size();
    std::vector<size_t> indegree(n, 0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t d : graph.dependents[i]) {
            ++indegree[d];
        }
    }

    std::deque<size_t> ready;
    for (size_t i = 0; i < n; ++i) {
        if (indegree[i] == 0) ready.push_back(i);
    }

    size_t visited = 0;
    std::vector<bool> done(n, false);
    while (!ready.empty()) {
        size_t i = ready.front();
        ready.pop_front();
        done[i] = true;
        ++visited;
        for (size_t d : graph.dependents[i]) {
            if (--indegree[d] == 0) ready.push_back(d);
        }
    }

    if (visited == n) {
        return true;
    }
    for (size_t i = 0; i < n; ++i) {
        if (!done[i]) {
            result.error = "dependency cycle involving " + graph.nodes[i]->coordinate;
            break;
        }
    }
    return false;
}

} // namespace

PruneResult remove_optional(const LibraryMap& libs) {
    PruneResult result;

    DependencyGraph graph;
    if (!build_graph(libs, graph, result) || !check_acyclic(graph, result)) {
        return result;
    }

    size_t n = graph.nodes.size();
    std::vector<bool> optional(n, false);
    bool any_optional = false;
    for (size_t i = 0; i < n; ++i) {
        optional[i] = graph.nodes[i]->optional;
        any_optional = any_optional || optional[i];
    }

    if (!any_optional) {
        result.ok = true;
        result.kept = libs;
        return result;
    }

    // Each pass judges every required node against the optional set as it
    // stood at the start of the pass
    while (true) {
        std::vector<size_t> moves;
        for (size_t i = 0; i < n; ++i) {
            if (optional[i] || graph.has_unknown_dependent[i] || graph.dependents[i].empty()) {
                continue;
            }
            bool all_optional = true;
            for (size_t d : graph.dependents[i]) {
                if (!optional[d]) {
                    all_optional = false;
                    break;
                }
            }
            if (all_optional) {
                moves.push_back(i);
            }
        }
        if (moves.empty()) {
            break;
        }
        for (size_t i : moves) {
            optional[i] = true;
        }
    }

    for (size_t i = 0; i < n; ++i) {
        if (optional[i]) {
            result.pruned.push_back(graph.nodes[i]->coordinate);
        } else {
            result.kept.push_back(*graph.nodes[i]);
        }
    }

    result.ok = true;
    return result;
}

} // namespace uberpack
