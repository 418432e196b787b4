/**
 * @file validation_error.hpp
 */
#pragma once
#include "sceneit/common/common.hpp"

namespace sceneit
{

/**
 * @brief Reasons a piece of user-supplied text was rejected.
 */
enum class ValidationErrorCode
{
    EmptyTitle,
    TitleTooLong,
    EmptySummary,
    EmptyName,
    NameTooLong,
    ContainsControlChars,
    EmptyRevisionNote,
    EmptyHeadingLocation,
    EmptySceneAction,
    EmptyDialogueText,
    EmptyParenthetical
};

/**
 * @brief Exception thrown by the constructors of validated text types.
 *
 * @details
 * Every validated wrapper (titles, names, dialogue text, ...) normalizes its
 * input and throws `ValidationError` if the result breaks one of its rules.
 * A constructed wrapper is therefore always valid, and code downstream of it
 * does not re-validate.
 */
class ValidationError : public std::invalid_argument
{
public:
    ValidationError(ValidationErrorCode code, const std::string& message)
        : std::invalid_argument(message)
        , m_code(code)
    {
    }

    ValidationErrorCode code() const noexcept
    {
        return m_code;
    }

private:
    ValidationErrorCode m_code;
};

} // namespace sceneit
