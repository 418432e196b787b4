/**
 * @file story_items.fwd.hpp
 * @brief Forward declarations of the story entities and their identifier aliases.
 */
#pragma once
#include "sceneit/common/id.hpp"

namespace sceneit {

class Scene;
class SceneVariant;
class Author;
class Character;
class Dialogue;

using SceneId = Id<Scene>;
using SceneVariantId = Id<SceneVariant>;
using AuthorId = Id<Author>;
using CharacterId = Id<Character>;
using DialogueId = Id<Dialogue>;

} // namespace sceneit
