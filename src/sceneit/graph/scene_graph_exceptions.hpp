/**
 * @file scene_graph_exceptions.hpp
 */
#pragma once
#include "sceneit/common/common.hpp"
#include "sceneit/story/story_items.fwd.hpp"

namespace sceneit
{

/**
 * @brief Error codes for structural operations on scenes.
 */
enum class SceneGraphErrorCode
{
    UnknownScene,     ///< Identifier absent from the storyboard's scene bank.
    SceneNotInGraph,  ///< Identifier absent from the scene graph.
    InvalidMove,      ///< The moved scene is not a successor of the source scene.
    CycleDetected     ///< The move would make a scene its own descendant.
};

/**
 * @brief Exception class for scene graph and storyboard structural errors.
 *
 * @details
 * `SceneGraphError` is thrown by `SceneGraph` and `Storyboard` methods when a
 * referenced scene is missing or a move would break the graph. Each exception
 * carries an error code, a descriptive message, and the scene identifiers
 * involved, in a fixed order per code:
 * - `UnknownScene`, `SceneNotInGraph`: `{scene}`
 * - `InvalidMove`: `{scene, from, dest}`
 * - `CycleDetected`: `{scene, dest}`
 *
 * A method that throws `SceneGraphError` has not modified its object.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class SceneGraphError : public std::exception
{
public:
    SceneGraphError(SceneGraphErrorCode code, std::vector<SceneId> scenes, std::string message)
        : m_code(code)
        , m_scenes(std::move(scenes))
        , m_message(std::move(message))
    {
    }

    static SceneGraphError unknown_scene(const SceneId& scene)
    {
        return SceneGraphError(
            SceneGraphErrorCode::UnknownScene, {scene},
            "Scene " + scene.to_string() + " is not in the storyboard");
    }

    static SceneGraphError scene_not_in_graph(const SceneId& scene)
    {
        return SceneGraphError(
            SceneGraphErrorCode::SceneNotInGraph, {scene},
            "Scene " + scene.to_string() + " is not in the scene graph");
    }

    static SceneGraphError invalid_move(const SceneId& scene, const SceneId& from, const SceneId& dest)
    {
        return SceneGraphError(
            SceneGraphErrorCode::InvalidMove, {scene, from, dest},
            "Cannot move scene " + scene.to_string() + " from " + from.to_string() +
                " to " + dest.to_string() + ": it is not a successor of " + from.to_string());
    }

    static SceneGraphError cycle_detected(const SceneId& scene, const SceneId& dest)
    {
        return SceneGraphError(
            SceneGraphErrorCode::CycleDetected, {scene, dest},
            "Moving scene " + scene.to_string() + " under " + dest.to_string() +
                " would create a cycle: " + scene.to_string() + " would become its own descendant");
    }

    SceneGraphErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the scene identifiers involved in the error.
     */
    const std::vector<SceneId>& scenes() const noexcept
    {
        return m_scenes;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    SceneGraphErrorCode m_code;
    std::vector<SceneId> m_scenes;
    std::string m_message;
};

} // namespace sceneit
