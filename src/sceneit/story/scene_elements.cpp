/**
 * @file scene_elements.cpp
 */
#include "sceneit/story/scene_elements.hpp"
#include "sceneit/common/text.hpp"
#include "sceneit/common/validation_error.hpp"

#include <cctype>

namespace sceneit
{

// ============================================================================
// Heading
// ============================================================================

const char* to_string(CameraLocation location) noexcept
{
    switch (location)
    {
    case CameraLocation::Interior:
        return "INT.";
    case CameraLocation::Exterior:
        return "EXT.";
    }
    return "?";
}

const char* to_string(SceneTimeOfDay time_of_day) noexcept
{
    switch (time_of_day)
    {
    case SceneTimeOfDay::Morning:
        return "MORNING";
    case SceneTimeOfDay::Dawn:
        return "DAWN";
    case SceneTimeOfDay::Day:
        return "DAY";
    case SceneTimeOfDay::Dusk:
        return "DUSK";
    case SceneTimeOfDay::Evening:
        return "EVENING";
    case SceneTimeOfDay::Night:
        return "NIGHT";
    case SceneTimeOfDay::Later:
        return "LATER";
    case SceneTimeOfDay::Continuous:
        return "CONTINUOUS";
    }
    return "?";
}

SceneLocation::SceneLocation(const std::string& input)
    : m_text(normalize_whitespace(input))
{
    if (m_text.empty())
    {
        throw ValidationError(ValidationErrorCode::EmptyHeadingLocation,
                              "Scene location must not be empty");
    }
    if (has_control_chars(m_text))
    {
        throw ValidationError(ValidationErrorCode::ContainsControlChars,
                              "Scene location contains control characters");
    }
}

std::string SceneHeading::to_string() const
{
    std::string place = location.str();
    for (char& ch : place)
    {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return std::string(sceneit::to_string(camera_location)) + " " + place + " - " +
           sceneit::to_string(time_of_day);
}

// ============================================================================
// Action
// ============================================================================

SceneAction::SceneAction(const std::string& input)
    : m_text(normalize_whitespace(input))
{
    if (m_text.empty())
    {
        throw ValidationError(ValidationErrorCode::EmptySceneAction,
                              "Scene action must not be empty");
    }
    if (has_control_chars(m_text))
    {
        throw ValidationError(ValidationErrorCode::ContainsControlChars,
                              "Scene action contains control characters");
    }
}

// ============================================================================
// Dialogue
// ============================================================================

DialogueText::DialogueText(const std::string& input)
    : m_text(normalize_whitespace(input))
{
    if (m_text.empty())
    {
        throw ValidationError(ValidationErrorCode::EmptyDialogueText,
                              "Dialogue text must not be empty");
    }
    if (has_control_chars(m_text))
    {
        throw ValidationError(ValidationErrorCode::ContainsControlChars,
                              "Dialogue text contains control characters");
    }
}

Parenthetical::Parenthetical(const std::string& input)
    : m_text(normalize_whitespace(input))
{
    if (m_text.empty())
    {
        throw ValidationError(ValidationErrorCode::EmptyParenthetical,
                              "Parenthetical must not be empty");
    }
}

Dialogue::Dialogue(SceneId scene, CharacterId speaker)
    : m_id(DialogueId::generate())
    , m_scene(std::move(scene))
    , m_speaker(std::move(speaker))
{
}

void Dialogue::add_block(DialogueBlock block)
{
    m_blocks.push_back(std::move(block));
    m_metadata.touch();
}

} // namespace sceneit
