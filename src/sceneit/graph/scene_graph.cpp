/**
 * @file scene_graph.cpp
 */
#include "sceneit/graph/scene_graph.hpp"

#include <algorithm>
#include <ostream>
#include <queue>

namespace sceneit
{

// ============================================================================
// Membership
// ============================================================================

SceneGraphUpdate SceneGraph::add_scene(const SceneId& scene)
{
    m_edges.try_emplace(scene);
    return SceneAdded{scene};
}

SceneGraphUpdate SceneGraph::add_root(const SceneId& scene)
{
    add_scene(scene);
    m_roots.insert(scene);
    return SceneSetAsRoot{scene};
}

SceneGraphUpdate SceneGraph::delete_scene(const SceneId& scene)
{
    auto it = m_edges.find(scene);
    if (it == m_edges.end())
    {
        throw SceneGraphError::scene_not_in_graph(scene);
    }

    m_edges.erase(it);
    m_roots.erase(scene);

    // Purge incoming edges
    for (auto& [member, successors] : m_edges)
    {
        successors.erase(scene);
    }

    return SceneDeleted{scene};
}

// ============================================================================
// Edges
// ============================================================================

SceneGraphUpdate SceneGraph::add_edge(const SceneId& from, const SceneId& dest)
{
    add_scene(from);
    add_scene(dest);
    m_edges.at(from).insert(dest);
    return ScenesLinked{from, dest};
}

SceneGraphUpdate SceneGraph::delete_edge(const SceneId& from, const SceneId& dest)
{
    auto it = m_edges.find(from);
    if (it == m_edges.end())
    {
        throw SceneGraphError::scene_not_in_graph(from);
    }

    it->second.erase(dest);
    return EdgeDeleted{from, dest};
}

SceneGraphUpdate SceneGraph::move_scene(const SceneId& scene, const SceneId& from, const SceneId& dest)
{
    require_member(scene);
    require_member(from);
    require_member(dest);

    if (from == dest)
    {
        return SceneMoved{scene, from, dest};
    }

    auto& from_successors = m_edges.at(from);
    if (from_successors.erase(scene) == 0)
    {
        throw SceneGraphError::invalid_move(scene, from, dest);
    }

    // Checked with the from -> scene edge already removed. Rejected if the new
    // dest -> scene edge would close a loop (scene reaches dest), or if dest
    // already reaches scene by another path.
    if (is_descendant(scene, dest) || is_descendant(dest, scene))
    {
        from_successors.insert(scene);
        throw SceneGraphError::cycle_detected(scene, dest);
    }

    m_edges.at(dest).insert(scene);
    return SceneMoved{scene, from, dest};
}

// ============================================================================
// Queries
// ============================================================================

SceneIdRange SceneGraph::next_scenes(const SceneId& scene) const
{
    auto it = m_edges.find(scene);
    if (it == m_edges.end())
    {
        return SceneIdRange();
    }
    return SceneIdRange(it->second);
}

std::unordered_set<SceneId> SceneGraph::unreachable_scenes() const
{
    // Multi-source DFS seeded with every root
    std::unordered_set<SceneId> visited;
    std::vector<SceneId> stack(m_roots.begin(), m_roots.end());

    while (!stack.empty())
    {
        SceneId current = stack.back();
        stack.pop_back();

        if (!visited.insert(current).second)
        {
            continue;
        }

        auto it = m_edges.find(current);
        if (it == m_edges.end())
        {
            continue;
        }
        for (const SceneId& successor : it->second)
        {
            if (visited.count(successor) == 0)
            {
                stack.push_back(successor);
            }
        }
    }

    std::unordered_set<SceneId> unreachable;
    for (const auto& [member, successors] : m_edges)
    {
        if (visited.count(member) == 0)
        {
            unreachable.insert(member);
        }
    }
    return unreachable;
}

bool SceneGraph::contains(const SceneId& scene) const
{
    return m_edges.count(scene) != 0;
}

bool SceneGraph::is_root(const SceneId& scene) const
{
    return m_roots.count(scene) != 0;
}

const std::unordered_set<SceneId>& SceneGraph::roots() const noexcept
{
    return m_roots;
}

std::size_t SceneGraph::scene_count() const noexcept
{
    return m_edges.size();
}

std::size_t SceneGraph::edge_count() const noexcept
{
    std::size_t count = 0;
    for (const auto& [member, successors] : m_edges)
    {
        count += successors.size();
    }
    return count;
}

// ============================================================================
// Diagnostic listing
// ============================================================================

void SceneGraph::print_from(std::ostream& os, const std::optional<SceneId>& start) const
{
    std::unordered_set<SceneId> visited;

    if (start.has_value())
    {
        print_subtree(os, start.value(), visited);
        return;
    }

    std::vector<SceneId> ordered_roots(m_roots.begin(), m_roots.end());
    std::sort(ordered_roots.begin(), ordered_roots.end());

    for (const SceneId& root : ordered_roots)
    {
        os << "ROOT: " << root << "\n";
        print_subtree(os, root, visited);
        os << "\n";
    }
}

void SceneGraph::print_subtree(std::ostream& os, const SceneId& start,
                               std::unordered_set<SceneId>& visited) const
{
    std::queue<std::pair<SceneId, std::size_t>> queue;
    queue.emplace(start, 0);

    while (!queue.empty())
    {
        auto [scene, depth] = queue.front();
        queue.pop();

        if (!visited.insert(scene).second)
        {
            continue;
        }

        os << std::string(depth * 2, ' ') << "- " << scene << "\n";

        auto it = m_edges.find(scene);
        if (it == m_edges.end())
        {
            continue;
        }
        for (const SceneId& successor : it->second)
        {
            if (visited.count(successor) == 0)
            {
                queue.emplace(successor, depth + 1);
            }
        }
    }
}

// ============================================================================
// Helpers
// ============================================================================

void SceneGraph::require_member(const SceneId& scene) const
{
    if (!contains(scene))
    {
        throw SceneGraphError::scene_not_in_graph(scene);
    }
}

bool SceneGraph::is_descendant(const SceneId& start, const SceneId& target) const
{
    // Iterative DFS; the target is recognized when popped, so start == target
    // is reported on the first pop.
    std::unordered_set<SceneId> visited;
    std::vector<SceneId> stack;
    stack.push_back(start);

    while (!stack.empty())
    {
        SceneId current = stack.back();
        stack.pop_back();

        if (current == target)
        {
            return true;
        }
        if (!visited.insert(current).second)
        {
            continue;
        }

        auto it = m_edges.find(current);
        if (it == m_edges.end())
        {
            continue;
        }
        for (const SceneId& successor : it->second)
        {
            if (visited.count(successor) == 0)
            {
                stack.push_back(successor);
            }
        }
    }

    return false;
}

} // namespace sceneit
