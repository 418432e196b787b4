/**
 * @file title.cpp
 */
#include "sceneit/story/title.hpp"
#include "sceneit/common/text.hpp"
#include "sceneit/common/validation_error.hpp"

namespace sceneit
{

Title::Title(const std::string& input)
    : m_text(normalize_whitespace(input))
{
    if (m_text.empty())
    {
        throw ValidationError(ValidationErrorCode::EmptyTitle, "Title must not be empty");
    }
    if (code_point_count(m_text) > k_max_name_length)
    {
        throw ValidationError(
            ValidationErrorCode::TitleTooLong,
            "Title must be at most " + std::to_string(k_max_name_length) + " characters");
    }
    if (has_control_chars(m_text))
    {
        throw ValidationError(ValidationErrorCode::ContainsControlChars,
                              "Title contains control characters");
    }
}

Title Title::untitled()
{
    return Title("Untitled Storyboard");
}

Summary::Summary(const std::string& input)
    : m_text(normalize_whitespace(input))
{
    if (m_text.empty())
    {
        throw ValidationError(ValidationErrorCode::EmptySummary, "Summary must not be empty");
    }
    if (has_control_chars(m_text))
    {
        throw ValidationError(ValidationErrorCode::ContainsControlChars,
                              "Summary contains control characters");
    }
}

} // namespace sceneit
