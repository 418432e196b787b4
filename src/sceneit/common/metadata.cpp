/**
 * @file metadata.cpp
 */
#include "sceneit/common/metadata.hpp"
#include "sceneit/common/text.hpp"
#include "sceneit/common/validation_error.hpp"

#include <algorithm>

namespace sceneit
{

// ============================================================================
// RevisionNote
// ============================================================================

RevisionNote::RevisionNote(const std::string& input)
    : m_text(normalize_whitespace(input))
{
    if (m_text.empty())
    {
        throw ValidationError(ValidationErrorCode::EmptyRevisionNote,
                              "Revision note must not be empty");
    }
    if (has_control_chars(m_text))
    {
        throw ValidationError(ValidationErrorCode::ContainsControlChars,
                              "Revision note contains control characters");
    }
}

// ============================================================================
// Metadata
// ============================================================================

Metadata::Metadata()
    : created_at(Clock::now())
    , updated_at(created_at)
{
}

void Metadata::touch()
{
    updated_at = std::max(updated_at, Clock::now());
    ++version;
}

void Metadata::add_revision_note(RevisionNote note)
{
    revision_notes.push_back(std::move(note));
}

bool Metadata::add_tag(const std::string& tag)
{
    if (has_tag(tag))
    {
        return false;
    }
    tags.push_back(tag);
    return true;
}

bool Metadata::has_tag(const std::string& tag) const noexcept
{
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

} // namespace sceneit
