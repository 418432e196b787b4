/**
 * @file scene.cpp
 */
#include "sceneit/story/scene.hpp"

#include <algorithm>

namespace sceneit
{

// ============================================================================
// SceneVariant
// ============================================================================

SceneVariant::SceneVariant()
    : m_id(SceneVariantId::generate())
{
}

void SceneVariant::set_heading(SceneHeading heading)
{
    m_heading = std::move(heading);
    m_metadata.touch();
}

void SceneVariant::clear_heading()
{
    m_heading.reset();
    m_metadata.touch();
}

void SceneVariant::add_element(SceneElement element)
{
    m_elements.push_back(std::move(element));
    m_metadata.touch();
}

// ============================================================================
// Scene
// ============================================================================

Scene::Scene()
    : m_id(SceneId::generate())
    , m_variants(1)
    , m_active_variant(m_variants.front().id())
{
}

const SceneVariant& Scene::active_variant() const
{
    // Invariant: the active id always names a stored variant
    return *find_variant(m_active_variant);
}

SceneVariant& Scene::active_variant()
{
    auto it = find_variant(m_active_variant);
    return m_variants[static_cast<size_t>(it - m_variants.cbegin())];
}

SceneVariantId Scene::add_variant(SceneVariant variant)
{
    SceneVariantId variant_id = variant.id();
    m_variants.push_back(std::move(variant));
    m_metadata.touch();
    return variant_id;
}

void Scene::set_active_variant(const SceneVariantId& variant_id)
{
    if (find_variant(variant_id) == m_variants.cend())
    {
        throw std::out_of_range("Variant " + variant_id.to_string() +
                                " does not belong to scene " + m_id.to_string());
    }
    m_active_variant = variant_id;
    m_metadata.touch();
}

std::vector<SceneVariant>::const_iterator Scene::find_variant(const SceneVariantId& variant_id) const
{
    return std::find_if(m_variants.cbegin(), m_variants.cend(),
                        [&](const SceneVariant& v) { return v.id() == variant_id; });
}

} // namespace sceneit
