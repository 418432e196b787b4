/**
 * @file author.cpp
 */
#include "sceneit/story/author.hpp"
#include "sceneit/common/text.hpp"

namespace sceneit
{

AuthorName::AuthorName(const std::string& input)
    : m_name(validated_name(input, "Author name"))
{
}

Author::Author(AuthorName name)
    : m_id(AuthorId::generate())
    , m_name(std::move(name))
{
}

void Author::rename(AuthorName name)
{
    m_name = std::move(name);
    m_metadata.touch();
}

} // namespace sceneit
