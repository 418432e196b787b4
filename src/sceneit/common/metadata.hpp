/**
 * @file metadata.hpp
 * @brief Revision bookkeeping attached to every story entity.
 */
#pragma once
#include "sceneit/common/common.hpp"

namespace sceneit
{

/**
 * @brief A short, validated note describing a revision.
 */
class RevisionNote
{
public:
    /**
     * @brief Construct a revision note from raw input.
     * @param input The note text; whitespace is normalized.
     * @throw ValidationError with `EmptyRevisionNote` or `ContainsControlChars`.
     */
    explicit RevisionNote(const std::string& input);

    const std::string& str() const noexcept
    {
        return m_text;
    }

    bool operator==(const RevisionNote& other) const noexcept
    {
        return m_text == other.m_text;
    }

    bool operator!=(const RevisionNote& other) const noexcept
    {
        return !(*this == other);
    }

private:
    std::string m_text;
};

/**
 * @brief Creation time, last-modified time and a revision counter for an entity.
 *
 * @details
 * A fresh `Metadata` has `created_at == updated_at == now` and `version == 1`.
 * `touch()` is the only operation that advances `updated_at` and `version`;
 * the owning aggregate calls it whenever a structural change affects the entity.
 *
 * @par Invariants
 * - `version` never decreases.
 * - `updated_at` never moves backwards, even if the system clock does.
 */
struct Metadata
{
    using Clock = std::chrono::system_clock;

    Metadata();

    Clock::time_point created_at;
    Clock::time_point updated_at;
    std::uint32_t version{1};
    std::vector<RevisionNote> revision_notes;
    std::vector<std::string> tags;
    bool locked{false};

    /**
     * @brief Record a modification: bump `updated_at` to now and increment `version`.
     */
    void touch();

    void add_revision_note(RevisionNote note);

    /**
     * @brief Add a tag unless it is already present.
     * @return True if the tag was added.
     */
    bool add_tag(const std::string& tag);

    bool has_tag(const std::string& tag) const noexcept;
};

} // namespace sceneit
