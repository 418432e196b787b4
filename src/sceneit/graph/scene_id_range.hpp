/**
 * @file scene_id_range.hpp
 */
#pragma once
#include "sceneit/common/common.hpp"
#include "sceneit/story/story_items.fwd.hpp"

namespace sceneit
{

/**
 * @brief A read-only, restartable view over a set of scene identifiers.
 *
 * @details
 * Returned by `SceneGraph::next_scenes()`. The view does not copy; iterating it
 * walks the graph's own successor set, and it can be iterated any number of
 * times. A default-constructed range is empty.
 *
 * @par Lifetime
 * - Invalidated by any mutation of the graph that produced it.
 */
class SceneIdRange
{
public:
    using const_iterator = std::unordered_set<SceneId>::const_iterator;

    SceneIdRange() noexcept = default;

    explicit SceneIdRange(const std::unordered_set<SceneId>& ids) noexcept
        : m_ids(&ids)
    {
    }

    const_iterator begin() const noexcept
    {
        return ids().begin();
    }

    const_iterator end() const noexcept
    {
        return ids().end();
    }

    std::size_t size() const noexcept
    {
        return ids().size();
    }

    bool empty() const noexcept
    {
        return ids().empty();
    }

    bool contains(const SceneId& id) const
    {
        return ids().count(id) != 0;
    }

private:
    const std::unordered_set<SceneId>& ids() const noexcept
    {
        static const std::unordered_set<SceneId> empty_ids;
        return m_ids ? *m_ids : empty_ids;
    }

    const std::unordered_set<SceneId>* m_ids = nullptr;
};

} // namespace sceneit
