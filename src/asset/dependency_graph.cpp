/// @file dependency_graph.cpp
/// @brief DependencyGraph implementation

#include <relic/asset/dependency_graph.hpp>

#include <algorithm>
#include <deque>
#include <mutex>
#include <unordered_set>

namespace relic_asset {

Result<void> DependencyGraph::add_edge(const DependencyEdge& edge) {
    std::unique_lock lock(m_mutex);

    if (edge.dependent == edge.dependency || reaches(edge.dependency, edge.dependent)) {
        return relic_core::Err(AssetError::cyclic_dependency(
            relic_core::to_hex(edge.dependent.raw()), edge.dependency_path.to_string()));
    }

    auto& edges = m_forward[edge.dependent];
    for (auto& existing : edges) {
        if (existing.dependency == edge.dependency) {
            existing.required = existing.required || edge.required;
            return relic_core::Ok();
        }
    }
    edges.push_back(edge);
    m_reverse[edge.dependency].insert(edge.dependent);
    return relic_core::Ok();
}

std::vector<DependencyEdge> DependencyGraph::dependencies_of(const AssetId& id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_forward.find(id);
    return it != m_forward.end() ? it->second : std::vector<DependencyEdge>{};
}

std::set<AssetId> DependencyGraph::dependents_of(const AssetId& id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_reverse.find(id);
    return it != m_reverse.end() ? it->second : std::set<AssetId>{};
}

std::vector<AssetId> DependencyGraph::transitive_dependents(const AssetId& id) const {
    std::shared_lock lock(m_mutex);

    std::vector<AssetId> out;
    std::unordered_set<AssetId> visited{id};
    std::deque<AssetId> queue{id};

    while (!queue.empty()) {
        AssetId current = queue.front();
        queue.pop_front();

        auto it = m_reverse.find(current);
        if (it == m_reverse.end()) {
            continue;
        }
        for (const auto& dependent : it->second) {
            if (visited.insert(dependent).second) {
                out.push_back(dependent);
                queue.push_back(dependent);
            }
        }
    }
    return out;
}

bool DependencyGraph::would_create_cycle(const AssetId& dependent, const AssetId& dependency) const {
    std::shared_lock lock(m_mutex);
    return dependent == dependency || reaches(dependency, dependent);
}

void DependencyGraph::clear_dependencies(const AssetId& id) {
    std::unique_lock lock(m_mutex);
    erase_outgoing(id);
}

void DependencyGraph::remove_node(const AssetId& id) {
    std::unique_lock lock(m_mutex);
    erase_outgoing(id);

    auto it = m_reverse.find(id);
    if (it == m_reverse.end()) {
        return;
    }
    for (const auto& dependent : it->second) {
        auto fit = m_forward.find(dependent);
        if (fit == m_forward.end()) {
            continue;
        }
        auto& edges = fit->second;
        edges.erase(std::remove_if(edges.begin(), edges.end(),
            [&](const DependencyEdge& e) { return e.dependency == id; }), edges.end());
        if (edges.empty()) {
            m_forward.erase(fit);
        }
    }
    m_reverse.erase(it);
}

bool DependencyGraph::contains(const AssetId& id) const {
    std::shared_lock lock(m_mutex);
    return m_forward.find(id) != m_forward.end() || m_reverse.find(id) != m_reverse.end();
}

std::size_t DependencyGraph::edge_count() const {
    std::shared_lock lock(m_mutex);
    std::size_t count = 0;
    for (const auto& [id, edges] : m_forward) {
        count += edges.size();
    }
    return count;
}

void DependencyGraph::clear() {
    std::unique_lock lock(m_mutex);
    m_forward.clear();
    m_reverse.clear();
}

bool DependencyGraph::reaches(const AssetId& from, const AssetId& to) const {
    // m_mutex held
    std::unordered_set<AssetId> visited{from};
    std::deque<AssetId> queue{from};

    while (!queue.empty()) {
        AssetId current = queue.front();
        queue.pop_front();
        if (current == to) {
            return true;
        }

        auto it = m_forward.find(current);
        if (it == m_forward.end()) {
            continue;
        }
        for (const auto& edge : it->second) {
            if (visited.insert(edge.dependency).second) {
                queue.push_back(edge.dependency);
            }
        }
    }
    return false;
}

void DependencyGraph::erase_outgoing(const AssetId& id) {
    // m_mutex held
    auto it = m_forward.find(id);
    if (it == m_forward.end()) {
        return;
    }
    for (const auto& edge : it->second) {
        auto rit = m_reverse.find(edge.dependency);
        if (rit != m_reverse.end()) {
            rit->second.erase(id);
            if (rit->second.empty()) {
                m_reverse.erase(rit);
            }
        }
    }
    m_forward.erase(it);
}

} // namespace relic_asset
