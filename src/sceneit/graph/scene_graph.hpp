/**
 * @file scene_graph.hpp
 */
#pragma once
#include "sceneit/common/common.hpp"
#include "sceneit/graph/scene_graph_exceptions.hpp"
#include "sceneit/graph/scene_graph_update.hpp"
#include "sceneit/graph/scene_id_range.hpp"
#include "sceneit/story/story_items.fwd.hpp"

namespace sceneit
{

/**
 * @brief The directed "what can come next" relation between scenes.
 *
 * @details
 * `SceneGraph` stores scene identifiers only: the successor sets (edges) and the
 * set of roots (story entry points). It never sees scene content or metadata.
 * The owner keeps content in its own store keyed by the same identifiers and
 * reacts to the `SceneGraphUpdate` each mutation returns.
 *
 * @par Membership
 * - Every member scene has an entry in the edge map, even with no successors.
 * - Scenes referenced by `add_root()` or `add_edge()` become members.
 * - Every root is a member, and every successor is a member.
 *
 * @par Cycles
 * Cycles are not forbidden in general; `add_edge()` accepts any edge. Only
 * `move_scene()` refuses a move that would place a scene below one of its own
 * descendants.
 *
 * @par Errors
 * Failing operations throw `SceneGraphError` and leave the graph unchanged.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization.
 * - Concurrent reads (const methods) are safe if no concurrent writes occur.
 */
class SceneGraph
{
public:
    SceneGraph() = default;

    /**
     * @brief Add a scene with no successors. Idempotent.
     * @return `SceneAdded`.
     */
    SceneGraphUpdate add_scene(const SceneId& scene);

    /**
     * @brief Mark a scene as a story entry point, adding it if absent.
     * @return `SceneSetAsRoot`.
     */
    SceneGraphUpdate add_root(const SceneId& scene);

    /**
     * @brief Add the edge `from -> dest`, adding either scene if absent. Idempotent.
     * @return `ScenesLinked`.
     */
    SceneGraphUpdate add_edge(const SceneId& from, const SceneId& dest);

    /**
     * @brief Reparent `scene` from `from`'s successors to `dest`'s successors.
     * @return `SceneMoved`. When `from == dest` the graph is not modified.
     * @throw SceneGraphError with `SceneNotInGraph` naming the first missing id
     *        (checked in the order scene, from, dest), `InvalidMove` if `scene` is
     *        not a successor of `from`, or `CycleDetected` if, once the
     *        `from -> scene` edge is removed, `dest` is reachable from `scene` or
     *        `scene` is reachable from `dest`.
     */
    SceneGraphUpdate move_scene(const SceneId& scene, const SceneId& from, const SceneId& dest);

    /**
     * @brief Remove a scene, its outgoing edges, every edge into it, and its root mark.
     * @return `SceneDeleted`.
     * @throw SceneGraphError with `SceneNotInGraph` if the scene is not a member.
     */
    SceneGraphUpdate delete_scene(const SceneId& scene);

    /**
     * @brief Remove the edge `from -> dest`.
     * @return `EdgeDeleted`. Removing an edge that does not exist is a no-op.
     * @throw SceneGraphError with `SceneNotInGraph` if `from` is not a member.
     */
    SceneGraphUpdate delete_edge(const SceneId& from, const SceneId& dest);

    /**
     * @brief The direct successors of a scene.
     * @return An empty range if the scene is not a member or has no successors.
     */
    SceneIdRange next_scenes(const SceneId& scene) const;

    /**
     * @brief Members that no root can reach.
     * @details With no roots every member is returned.
     */
    std::unordered_set<SceneId> unreachable_scenes() const;

    /**
     * @brief Write an indented breadth-first listing of the graph.
     *
     * @details
     * With a start scene, lists the scenes reachable from it, each once, indented
     * two spaces per level of BFS depth. Without one, lists every root in
     * identifier order under a `ROOT: <id>` header, resetting the depth per root;
     * a scene already listed under an earlier root is not listed again.
     *
     * @note Diagnostic output only; the format is not stable.
     */
    void print_from(std::ostream& os, const std::optional<SceneId>& start = std::nullopt) const;

    bool contains(const SceneId& scene) const;

    bool is_root(const SceneId& scene) const;

    const std::unordered_set<SceneId>& roots() const noexcept;

    /**
     * @brief Number of member scenes.
     */
    std::size_t scene_count() const noexcept;

    /**
     * @brief Number of edges across all successor sets.
     */
    std::size_t edge_count() const noexcept;

private:
    // -------------------------------------------------------------------------
    // Structure
    // -------------------------------------------------------------------------

    /// Successor set of each member scene.
    std::unordered_map<SceneId, std::unordered_set<SceneId>> m_edges;

    /// Story entry points. Always a subset of the keys of m_edges.
    std::unordered_set<SceneId> m_roots;

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    /// Throw SceneNotInGraph unless the scene is a member.
    void require_member(const SceneId& scene) const;

    /// True if target is start itself or reachable from it.
    bool is_descendant(const SceneId& start, const SceneId& target) const;

    /// BFS listing from start, skipping and extending the shared visited set.
    void print_subtree(std::ostream& os, const SceneId& start,
                       std::unordered_set<SceneId>& visited) const;
};

} // namespace sceneit
