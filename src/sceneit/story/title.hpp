/**
 * @file title.hpp
 * @brief Validated story title and summary text.
 */
#pragma once
#include "sceneit/common/common.hpp"

namespace sceneit
{

/**
 * @brief The title of a story.
 *
 * @details
 * Input is whitespace-normalized; the result must be non-empty, at most
 * `k_max_name_length` code points, and free of control characters.
 */
class Title
{
public:
    /**
     * @throw ValidationError with `EmptyTitle`, `TitleTooLong` or `ContainsControlChars`.
     */
    explicit Title(const std::string& input);

    /**
     * @brief The placeholder title of a new storyboard, "Untitled Storyboard".
     */
    static Title untitled();

    const std::string& str() const noexcept
    {
        return m_text;
    }

    bool operator==(const Title& other) const noexcept
    {
        return m_text == other.m_text;
    }

    bool operator!=(const Title& other) const noexcept
    {
        return !(*this == other);
    }

private:
    std::string m_text;
};

/**
 * @brief A free-form synopsis of a story. Non-empty, no control characters.
 */
class Summary
{
public:
    /**
     * @throw ValidationError with `EmptySummary` or `ContainsControlChars`.
     */
    explicit Summary(const std::string& input);

    const std::string& str() const noexcept
    {
        return m_text;
    }

    bool operator==(const Summary& other) const noexcept
    {
        return m_text == other.m_text;
    }

    bool operator!=(const Summary& other) const noexcept
    {
        return !(*this == other);
    }

private:
    std::string m_text;
};

} // namespace sceneit
