#pragma once

/// @file dependency_graph.hpp
/// @brief Dependency edges between assets

#include "fwd.hpp"
#include "types.hpp"
#include <relic/core/error.hpp>
#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace relic_asset {

// =============================================================================
// DependencyEdge
// =============================================================================

/// Dependent asset requires (or optionally uses) a dependency
struct DependencyEdge {
    AssetId dependent;
    AssetId dependency;
    AssetPath dependency_path;
    bool required = true;
};

// =============================================================================
// DependencyGraph
// =============================================================================

/// Directed graph dependent -> dependency, with reverse lookup.
/// Edges that would close a cycle are rejected. Internally synchronized.
class DependencyGraph {
public:
    DependencyGraph() = default;

    DependencyGraph(const DependencyGraph&) = delete;
    DependencyGraph& operator=(const DependencyGraph&) = delete;

    /// Record an edge. Fails with CyclicDependency if the dependency already
    /// reaches the dependent (self-edges included); the edge is then dropped.
    [[nodiscard]] Result<void> add_edge(const DependencyEdge& edge);

    /// Outgoing edges of a node
    [[nodiscard]] std::vector<DependencyEdge> dependencies_of(const AssetId& id) const;

    /// Direct dependents of a node
    [[nodiscard]] std::set<AssetId> dependents_of(const AssetId& id) const;

    /// All nodes reaching `id`, nearest first, excluding `id`
    [[nodiscard]] std::vector<AssetId> transitive_dependents(const AssetId& id) const;

    /// Check if dependent -> dependency would close a cycle
    [[nodiscard]] bool would_create_cycle(const AssetId& dependent, const AssetId& dependency) const;

    /// Remove outgoing edges of a node
    void clear_dependencies(const AssetId& id);

    /// Remove a node with all its incoming and outgoing edges
    void remove_node(const AssetId& id);

    /// Check if a node has any edge
    [[nodiscard]] bool contains(const AssetId& id) const;

    /// Total number of edges
    [[nodiscard]] std::size_t edge_count() const;

    /// Remove everything
    void clear();

private:
    [[nodiscard]] bool reaches(const AssetId& from, const AssetId& to) const;
    void erase_outgoing(const AssetId& id);

    std::unordered_map<AssetId, std::vector<DependencyEdge>> m_forward;
    std::unordered_map<AssetId, std::set<AssetId>> m_reverse;
    mutable std::shared_mutex m_mutex;
};

} // namespace relic_asset
