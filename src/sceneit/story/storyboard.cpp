/**
 * @file storyboard.cpp
 */
#include "sceneit/story/storyboard.hpp"

namespace sceneit
{

const char* to_string(StoryTemplate story_template) noexcept
{
    switch (story_template)
    {
    case StoryTemplate::Teleplay:
        return "Teleplay";
    case StoryTemplate::Screenplay:
        return "Screenplay";
    case StoryTemplate::HalfHourSitcom:
        return "Half-hour Sitcom";
    case StoryTemplate::Novel:
        return "Novel";
    }
    return "?";
}

Storyboard::Storyboard(StoryboardConfig config)
    : m_config{config}
{}

// ============================================================================
// Title, summary, template
// ============================================================================

void Storyboard::update_title(Title title)
{
    m_title = std::move(title);
    m_metadata.touch();
}

void Storyboard::clear_title()
{
    m_title.reset();
    m_metadata.touch();
}

void Storyboard::update_summary(Summary summary)
{
    m_summary = std::move(summary);
    m_metadata.touch();
}

void Storyboard::clear_summary()
{
    m_summary.reset();
    m_metadata.touch();
}

void Storyboard::update_template(StoryTemplate story_template)
{
    m_template = story_template;
    m_metadata.touch();
}

void Storyboard::clear_template()
{
    m_template.reset();
    m_metadata.touch();
}

// ============================================================================
// Authors and characters
// ============================================================================

void Storyboard::add_author(Author author)
{
    AuthorId author_id = author.id();
    m_authors.insert_or_assign(author_id, std::move(author));
    m_metadata.touch();
}

void Storyboard::remove_author(const AuthorId& author_id)
{
    m_authors.erase(author_id);
    m_metadata.touch();
}

void Storyboard::add_character(Character character)
{
    CharacterId character_id = character.id();
    m_characters.insert_or_assign(character_id, std::move(character));
    m_metadata.touch();
}

void Storyboard::remove_character(const CharacterId& character_id)
{
    m_characters.erase(character_id);
    m_metadata.touch();
}

// ============================================================================
// Structural edits
// ============================================================================

SceneId Storyboard::add_scene(Scene scene)
{
    SceneId scene_id = scene.id();
    m_scene_bank.insert_or_assign(scene_id, std::move(scene));
    apply_update(m_scene_graph.add_scene(scene_id));
    return scene_id;
}

void Storyboard::set_scene_as_root(const SceneId& scene_id)
{
    require_scene(scene_id);
    apply_update(m_scene_graph.add_root(scene_id));
}

void Storyboard::link_scenes(const SceneId& from, const SceneId& dest)
{
    require_scene(from);
    require_scene(dest);
    apply_update(m_scene_graph.add_edge(from, dest));
}

void Storyboard::unlink_scenes(const SceneId& from, const SceneId& dest)
{
    require_scene(from);
    require_scene(dest);
    apply_update(m_scene_graph.delete_edge(from, dest));
}

void Storyboard::move_scene(const SceneId& scene, const SceneId& from, const SceneId& dest)
{
    require_scene(scene);
    require_scene(from);
    require_scene(dest);
    apply_update(m_scene_graph.move_scene(scene, from, dest));
}

void Storyboard::delete_scene(const SceneId& scene_id)
{
    auto it = m_scene_bank.find(scene_id);
    if (it == m_scene_bank.end())
    {
        return;
    }

    // Graph first: if it throws, the scene stays in the bank
    SceneGraphUpdate update = m_scene_graph.delete_scene(scene_id);
    m_scene_bank.erase(it);
    apply_update(update);
}

// ============================================================================
// Queries
// ============================================================================

const Scene* Storyboard::scene(const SceneId& scene_id) const
{
    auto it = m_scene_bank.find(scene_id);
    if (it == m_scene_bank.end())
    {
        return nullptr;
    }
    return &it->second;
}

bool Storyboard::contains_scene(const SceneId& scene_id) const
{
    return m_scene_bank.count(scene_id) != 0;
}

SceneIdRange Storyboard::next_scenes(const SceneId& scene_id) const
{
    return m_scene_graph.next_scenes(scene_id);
}

bool Storyboard::is_root(const SceneId& scene_id) const
{
    return m_scene_graph.is_root(scene_id);
}

std::unordered_set<SceneId> Storyboard::standalone_scenes() const
{
    return m_scene_graph.unreachable_scenes();
}

void Storyboard::print_outline(std::ostream& os) const
{
    m_scene_graph.print_from(os);
}

// ============================================================================
// Helpers
// ============================================================================

void Storyboard::require_scene(const SceneId& scene_id) const
{
    if (!contains_scene(scene_id))
    {
        throw SceneGraphError::unknown_scene(scene_id);
    }
}

void Storyboard::apply_update(const SceneGraphUpdate& update)
{
    m_metadata.touch();

    if (!m_config.touch_on_structural_change)
    {
        return;
    }

    // Each affected scene is touched once, even when an update names it twice
    // (a move within the same parent). A deleted scene is already gone from the
    // bank, so its touch is skipped.
    std::unordered_set<SceneId> touched;
    for (const SceneId& scene_id : affected_scenes(update))
    {
        if (!touched.insert(scene_id).second)
        {
            continue;
        }
        auto it = m_scene_bank.find(scene_id);
        if (it != m_scene_bank.end())
        {
            it->second.touch();
        }
    }
}

} // namespace sceneit
