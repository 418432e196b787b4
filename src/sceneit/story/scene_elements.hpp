/**
 * @file scene_elements.hpp
 * @brief Building blocks of a scene draft: heading, action beats, dialogue.
 */
#pragma once
#include "sceneit/common/common.hpp"
#include "sceneit/common/metadata.hpp"
#include "sceneit/story/story_items.fwd.hpp"

namespace sceneit
{

// ============================================================================
// Heading
// ============================================================================

/**
 * @brief Camera placement of a scene heading.
 */
enum class CameraLocation
{
    Interior,
    Exterior
};

/**
 * @brief Time-of-day slot of a scene heading.
 */
enum class SceneTimeOfDay
{
    Morning,
    Dawn,
    Day,
    Dusk,
    Evening,
    Night,
    Later,
    Continuous
};

const char* to_string(CameraLocation location) noexcept;

const char* to_string(SceneTimeOfDay time_of_day) noexcept;

/**
 * @brief Where a scene takes place, e.g. "Kitchen". Non-empty, no control characters.
 */
class SceneLocation
{
public:
    /**
     * @throw ValidationError with `EmptyHeadingLocation` or `ContainsControlChars`.
     */
    explicit SceneLocation(const std::string& input);

    const std::string& str() const noexcept
    {
        return m_text;
    }

    bool operator==(const SceneLocation& other) const noexcept
    {
        return m_text == other.m_text;
    }

private:
    std::string m_text;
};

/**
 * @brief A scene heading (slug line): camera placement, location and time of day.
 */
struct SceneHeading
{
    CameraLocation camera_location;
    SceneLocation location;
    SceneTimeOfDay time_of_day;

    /**
     * @brief Render as a slug line, e.g. `INT. KITCHEN - NIGHT`.
     */
    std::string to_string() const;

    bool operator==(const SceneHeading& other) const noexcept
    {
        return camera_location == other.camera_location && location == other.location &&
               time_of_day == other.time_of_day;
    }
};

// ============================================================================
// Action
// ============================================================================

/**
 * @brief A line of action description. Non-empty, no control characters.
 */
class SceneAction
{
public:
    /**
     * @throw ValidationError with `EmptySceneAction` or `ContainsControlChars`.
     */
    explicit SceneAction(const std::string& input);

    const std::string& str() const noexcept
    {
        return m_text;
    }

private:
    std::string m_text;
};

// ============================================================================
// Dialogue
// ============================================================================

/**
 * @brief Spoken text. Non-empty, no control characters.
 */
class DialogueText
{
public:
    /**
     * @throw ValidationError with `EmptyDialogueText` or `ContainsControlChars`.
     */
    explicit DialogueText(const std::string& input);

    const std::string& str() const noexcept
    {
        return m_text;
    }

private:
    std::string m_text;
};

/**
 * @brief A delivery direction inside a dialogue, e.g. "(whispering)". Non-empty.
 */
class Parenthetical
{
public:
    /**
     * @throw ValidationError with `EmptyParenthetical`.
     */
    explicit Parenthetical(const std::string& input);

    const std::string& str() const noexcept
    {
        return m_text;
    }

private:
    std::string m_text;
};

using DialogueBlock = std::variant<DialogueText, Parenthetical>;

/**
 * @brief One character's turn of speech within a scene.
 *
 * @details
 * Holds the scene it belongs to and the speaking character by identifier only;
 * either may since have been deleted from the storyboard.
 */
class Dialogue
{
public:
    Dialogue(SceneId scene, CharacterId speaker);

    const DialogueId& id() const noexcept
    {
        return m_id;
    }

    const SceneId& scene() const noexcept
    {
        return m_scene;
    }

    const CharacterId& speaker() const noexcept
    {
        return m_speaker;
    }

    const std::vector<DialogueBlock>& blocks() const noexcept
    {
        return m_blocks;
    }

    /// Append a block and touch the dialogue.
    void add_block(DialogueBlock block);

    const Metadata& metadata() const noexcept
    {
        return m_metadata;
    }

    void touch()
    {
        m_metadata.touch();
    }

private:
    DialogueId m_id;
    SceneId m_scene;
    CharacterId m_speaker;
    std::vector<DialogueBlock> m_blocks;
    Metadata m_metadata;
};

using SceneElement = std::variant<SceneAction, Dialogue>;

} // namespace sceneit
