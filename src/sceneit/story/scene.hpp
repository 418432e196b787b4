/**
 * @file scene.hpp
 */
#pragma once
#include "sceneit/common/common.hpp"
#include "sceneit/common/metadata.hpp"
#include "sceneit/story/scene_elements.hpp"
#include "sceneit/story/story_items.fwd.hpp"

namespace sceneit
{

/**
 * @brief One draft of a scene: an optional heading and an ordered list of elements.
 */
class SceneVariant
{
public:
    SceneVariant();

    const SceneVariantId& id() const noexcept
    {
        return m_id;
    }

    const std::optional<SceneHeading>& heading() const noexcept
    {
        return m_heading;
    }

    const std::vector<SceneElement>& elements() const noexcept
    {
        return m_elements;
    }

    void set_heading(SceneHeading heading);

    void clear_heading();

    void add_element(SceneElement element);

    const Metadata& metadata() const noexcept
    {
        return m_metadata;
    }

    void touch()
    {
        m_metadata.touch();
    }

private:
    SceneVariantId m_id;
    std::optional<SceneHeading> m_heading;
    std::vector<SceneElement> m_elements;
    Metadata m_metadata;
};

/**
 * @brief A narrative unit with one or more alternate drafts (variants).
 *
 * @details
 * A new scene starts with a single empty variant, which is active. The scene's
 * position in the story is not stored here; that is the scene graph's job.
 *
 * @par Invariants
 * - `variants()` is never empty.
 * - The active variant id always names one of `variants()`.
 */
class Scene
{
public:
    Scene();

    const SceneId& id() const noexcept
    {
        return m_id;
    }

    const SceneVariantId& active_variant_id() const noexcept
    {
        return m_active_variant;
    }

    const SceneVariant& active_variant() const;

    SceneVariant& active_variant();

    const std::vector<SceneVariant>& variants() const noexcept
    {
        return m_variants;
    }

    /**
     * @brief Append a variant without activating it.
     * @return The id of the added variant.
     */
    SceneVariantId add_variant(SceneVariant variant);

    /**
     * @brief Make another of this scene's variants the active one.
     * @throw std::out_of_range if the id is not one of this scene's variants.
     */
    void set_active_variant(const SceneVariantId& variant_id);

    const Metadata& metadata() const noexcept
    {
        return m_metadata;
    }

    void touch()
    {
        m_metadata.touch();
    }

private:
    SceneId m_id;
    std::vector<SceneVariant> m_variants;
    SceneVariantId m_active_variant;
    Metadata m_metadata;

    std::vector<SceneVariant>::const_iterator find_variant(const SceneVariantId& variant_id) const;
};

} // namespace sceneit
