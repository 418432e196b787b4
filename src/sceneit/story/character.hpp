/**
 * @file character.hpp
 */
#pragma once
#include "sceneit/common/common.hpp"
#include "sceneit/common/metadata.hpp"
#include "sceneit/story/story_items.fwd.hpp"

namespace sceneit
{

/**
 * @brief Validated character name: non-empty, at most 100 code points, no control characters.
 */
class CharacterName
{
public:
    /**
     * @throw ValidationError with `EmptyName`, `NameTooLong` or `ContainsControlChars`.
     */
    explicit CharacterName(const std::string& input);

    const std::string& str() const noexcept
    {
        return m_name;
    }

    bool operator==(const CharacterName& other) const noexcept
    {
        return m_name == other.m_name;
    }

    bool operator!=(const CharacterName& other) const noexcept
    {
        return !(*this == other);
    }

private:
    std::string m_name;
};

/**
 * @brief A person in the story; speakers of dialogue refer to characters by id.
 */
class Character
{
public:
    explicit Character(CharacterName name);

    const CharacterId& id() const noexcept
    {
        return m_id;
    }

    const CharacterName& name() const noexcept
    {
        return m_name;
    }

    void rename(CharacterName name);

    const Metadata& metadata() const noexcept
    {
        return m_metadata;
    }

    void touch()
    {
        m_metadata.touch();
    }

private:
    CharacterId m_id;
    CharacterName m_name;
    Metadata m_metadata;
};

} // namespace sceneit
