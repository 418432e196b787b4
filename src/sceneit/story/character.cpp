/**
 * @file character.cpp
 */
#include "sceneit/story/character.hpp"
#include "sceneit/common/text.hpp"

namespace sceneit
{

CharacterName::CharacterName(const std::string& input)
    : m_name(validated_name(input, "Character name"))
{
}

Character::Character(CharacterName name)
    : m_id(CharacterId::generate())
    , m_name(std::move(name))
{
}

void Character::rename(CharacterName name)
{
    m_name = std::move(name);
    m_metadata.touch();
}

} // namespace sceneit
