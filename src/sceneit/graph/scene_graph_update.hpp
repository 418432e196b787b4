/**
 * @file scene_graph_update.hpp
 * @brief Change notifications returned by SceneGraph mutations.
 */
#pragma once
#include "sceneit/common/common.hpp"
#include "sceneit/story/story_items.fwd.hpp"

namespace sceneit
{

// ============================================================================
// Update kinds
// ============================================================================

struct SceneAdded
{
    SceneId scene;
};

struct SceneSetAsRoot
{
    SceneId scene;
};

struct ScenesLinked
{
    SceneId from;
    SceneId dest;
};

struct SceneMoved
{
    SceneId scene;
    SceneId from;
    SceneId dest;
};

struct SceneDeleted
{
    SceneId scene;
};

struct EdgeDeleted
{
    SceneId from;
    SceneId dest;
};

/**
 * @brief A value describing a completed structural mutation of a `SceneGraph`.
 *
 * @details
 * Every successful mutating call on `SceneGraph` returns exactly one update.
 * The graph never calls back into its owner; the owner inspects the update and
 * decides which side effects to apply (touching metadata, refreshing views).
 * A no-op mutation (re-adding an existing scene or edge, moving within the
 * same parent) still returns its update.
 */
using SceneGraphUpdate =
    std::variant<SceneAdded, SceneSetAsRoot, ScenesLinked, SceneMoved, SceneDeleted, EdgeDeleted>;

/**
 * @brief Scenes referenced by an update, in declaration order of its fields.
 *
 * @details
 * A move yields `{scene, from, dest}`, a link or unlink yields `{from, dest}`,
 * and every other update yields its single scene.
 */
std::vector<SceneId> affected_scenes(const SceneGraphUpdate& update);

/**
 * @brief A one-line human-readable description, e.g. `linked <from> -> <dest>`.
 */
std::string describe(const SceneGraphUpdate& update);

} // namespace sceneit
