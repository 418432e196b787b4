/**
 * @file author.hpp
 */
#pragma once
#include "sceneit/common/common.hpp"
#include "sceneit/common/metadata.hpp"
#include "sceneit/story/story_items.fwd.hpp"

namespace sceneit
{

/**
 * @brief Validated author name: non-empty, at most 100 code points, no control characters.
 */
class AuthorName
{
public:
    /**
     * @throw ValidationError with `EmptyName`, `NameTooLong` or `ContainsControlChars`.
     */
    explicit AuthorName(const std::string& input);

    const std::string& str() const noexcept
    {
        return m_name;
    }

    bool operator==(const AuthorName& other) const noexcept
    {
        return m_name == other.m_name;
    }

    bool operator!=(const AuthorName& other) const noexcept
    {
        return !(*this == other);
    }

private:
    std::string m_name;
};

/**
 * @brief A person credited with writing the story.
 */
class Author
{
public:
    explicit Author(AuthorName name);

    const AuthorId& id() const noexcept
    {
        return m_id;
    }

    const AuthorName& name() const noexcept
    {
        return m_name;
    }

    /// Replace the name and touch the metadata.
    void rename(AuthorName name);

    const Metadata& metadata() const noexcept
    {
        return m_metadata;
    }

    void touch()
    {
        m_metadata.touch();
    }

private:
    AuthorId m_id;
    AuthorName m_name;
    Metadata m_metadata;
};

} // namespace sceneit
