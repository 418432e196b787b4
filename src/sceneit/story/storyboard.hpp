/**
 * @file storyboard.hpp
 * @brief Storyboard owns scene content and keeps it consistent with the SceneGraph.
 */
#pragma once
#include "sceneit/common/common.hpp"
#include "sceneit/common/metadata.hpp"
#include "sceneit/graph/scene_graph.hpp"
#include "sceneit/story/author.hpp"
#include "sceneit/story/character.hpp"
#include "sceneit/story/scene.hpp"
#include "sceneit/story/title.hpp"

namespace sceneit
{

/**
 * @brief Script format the story is written for.
 */
enum class StoryTemplate
{
    Teleplay,
    Screenplay,
    HalfHourSitcom,
    Novel
};

const char* to_string(StoryTemplate story_template) noexcept;

/**
 * @brief Configuration for storyboard behavior.
 */
struct StoryboardConfig
{
    /**
     * @brief Whether structural edits touch the metadata of the scenes they affect.
     */
    bool touch_on_structural_change{true};
};

/**
 * @brief The project aggregate: title, authors, characters, scenes and their ordering.
 *
 * @details
 * `Storyboard` owns scene content in its scene bank and the ordering in a
 * `SceneGraph`, both keyed by `SceneId`. It is the only entry point for
 * structural edits, and keeps the two consistent:
 *
 * 1. Check that every referenced scene is in the scene bank, else throw
 *    `SceneGraphError` with `UnknownScene`.
 * 2. Delegate the structural change to the `SceneGraph`.
 * 3. Apply the returned `SceneGraphUpdate`: touch each affected scene that is
 *    still in the scene bank.
 *
 * The graph stores identifiers only and never owns content.
 *
 * @par Errors
 * - `SceneGraphError` from either layer propagates to the caller.
 * - A call that throws leaves the storyboard unchanged.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization.
 */
class Storyboard
{
public:
    /**
     * @brief Construct an empty storyboard.
     * @param config Behavior options.
     */
    explicit Storyboard(StoryboardConfig config = {});

    // -------------------------------------------------------------------------
    // Title, summary, template
    // -------------------------------------------------------------------------

    void update_title(Title title);

    void clear_title();

    const std::optional<Title>& title() const noexcept
    {
        return m_title;
    }

    void update_summary(Summary summary);

    void clear_summary();

    const std::optional<Summary>& summary() const noexcept
    {
        return m_summary;
    }

    void update_template(StoryTemplate story_template);

    void clear_template();

    const std::optional<StoryTemplate>& story_template() const noexcept
    {
        return m_template;
    }

    // -------------------------------------------------------------------------
    // Authors and characters
    // -------------------------------------------------------------------------

    /**
     * @brief Add an author, replacing any author with the same id.
     */
    void add_author(Author author);

    void remove_author(const AuthorId& author_id);

    const std::unordered_map<AuthorId, Author>& authors() const noexcept
    {
        return m_authors;
    }

    /**
     * @brief Add a character, replacing any character with the same id.
     */
    void add_character(Character character);

    void remove_character(const CharacterId& character_id);

    const std::unordered_map<CharacterId, Character>& characters() const noexcept
    {
        return m_characters;
    }

    // -------------------------------------------------------------------------
    // Structural edits
    // -------------------------------------------------------------------------

    /**
     * @brief Store a scene and add it to the graph with no links.
     * @return The scene's id.
     * @note A scene with the same id replaces the stored one; its links are kept.
     */
    SceneId add_scene(Scene scene);

    /**
     * @brief Mark a stored scene as a story entry point.
     * @throw SceneGraphError with `UnknownScene` if the scene is not stored.
     */
    void set_scene_as_root(const SceneId& scene_id);

    /**
     * @brief Add the link `from -> dest`.
     * @throw SceneGraphError with `UnknownScene` naming `from` if it is not stored,
     *        else naming `dest` if it is not stored.
     */
    void link_scenes(const SceneId& from, const SceneId& dest);

    /**
     * @brief Remove the link `from -> dest`. Removing a link that does not exist is a no-op.
     * @throw SceneGraphError with `UnknownScene` (`from` checked first), or
     *        `SceneNotInGraph` from the graph.
     */
    void unlink_scenes(const SceneId& from, const SceneId& dest);

    /**
     * @brief Reparent `scene` from `from` to `dest`. Touches all three scenes.
     * @throw SceneGraphError with `UnknownScene` (checked in order scene, from, dest),
     *        or `SceneNotInGraph`, `InvalidMove`, `CycleDetected` from the graph.
     */
    void move_scene(const SceneId& scene, const SceneId& from, const SceneId& dest);

    /**
     * @brief Remove a scene from the scene bank and from the graph, with all its links.
     * @note Does nothing if the scene is not stored.
     * @throw SceneGraphError with `SceneNotInGraph` if the scene is stored but
     *        missing from the graph; the scene is then kept.
     */
    void delete_scene(const SceneId& scene_id);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    /**
     * @brief Look up a stored scene.
     * @return Pointer to the scene, or nullptr. Invalidated by any edit that adds
     *         or deletes scenes.
     */
    const Scene* scene(const SceneId& scene_id) const;

    bool contains_scene(const SceneId& scene_id) const;

    std::size_t scene_count() const noexcept
    {
        return m_scene_bank.size();
    }

    SceneIdRange next_scenes(const SceneId& scene_id) const;

    bool is_root(const SceneId& scene_id) const;

    /**
     * @brief Stored scenes that no root reaches; they would be left out of any outline.
     */
    std::unordered_set<SceneId> standalone_scenes() const;

    /**
     * @brief Write the indented listing of every root and what it reaches.
     */
    void print_outline(std::ostream& os) const;

    const SceneGraph& scene_graph() const noexcept
    {
        return m_scene_graph;
    }

    const Metadata& metadata() const noexcept
    {
        return m_metadata;
    }

private:
    StoryboardConfig m_config{};
    std::optional<Title> m_title{};
    std::optional<Summary> m_summary{};
    std::optional<StoryTemplate> m_template{};
    std::unordered_map<AuthorId, Author> m_authors{};
    std::unordered_map<CharacterId, Character> m_characters{};
    std::unordered_map<SceneId, Scene> m_scene_bank{};
    SceneGraph m_scene_graph{};
    Metadata m_metadata{};

    /// Throw UnknownScene unless the scene is in the scene bank.
    void require_scene(const SceneId& scene_id) const;

    /// React to a graph mutation by touching every affected scene still stored.
    void apply_update(const SceneGraphUpdate& update);
};

} // namespace sceneit
