/**
 * @file id.hpp
 */
#pragma once
#include "sceneit/common/common.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <ostream>

namespace sceneit
{

namespace detail
{

/**
 * @brief Draw a fresh random (version 4) UUID.
 *
 * @details
 * Each thread owns its own generator, so this may be called from any thread.
 * @throw boost::uuids::entropy_error if the system entropy source fails.
 */
boost::uuids::uuid next_uuid();

} // namespace detail

/**
 * @brief A unique identifier bound at compile time to the kind of entity it names.
 *
 * @details
 * `Id<Kind>` wraps a `boost::uuids::uuid`. The template parameter `Kind` is a pure
 * tag: it has no runtime representation, and is usually the entity class itself
 * (forward declared where the full type is not needed).
 *
 * @par Construction
 * - `Id<Kind>::generate()` for a fresh identifier.
 * - From an existing `boost::uuids::uuid` (explicit).
 * - No default constructor; an identifier always names something.
 *
 * @par Type safety
 * - Comparison operators only accept `Id<Kind>` with the same `Kind`.
 * - An `Id<A>` is neither constructible from nor assignable from an `Id<B>`.
 *
 * @par Value semantics
 * - Trivially copyable and assignable.
 * - Equality, ordering and hashing use the uuid value only.
 * - An identifier may outlive its entity. Presence of an identifier in one
 *   container says nothing about whether the entity still exists elsewhere.
 *
 * @par Standard library integration
 * - `std::hash<Id<Kind>>` specialization provided.
 * - `operator<<` writes the canonical 36-character form.
 */
template <typename Kind>
class Id
{
public:
    explicit Id(const boost::uuids::uuid& value) noexcept
        : m_value(value)
    {
    }

    static Id generate()
    {
        return Id(detail::next_uuid());
    }

    const boost::uuids::uuid& value() const noexcept
    {
        return m_value;
    }

    std::string to_string() const
    {
        return boost::uuids::to_string(m_value);
    }

    bool operator==(const Id<Kind>& other) const noexcept
    {
        return m_value == other.m_value;
    }

    bool operator!=(const Id<Kind>& other) const noexcept
    {
        return !(*this == other);
    }

    bool operator<(const Id<Kind>& other) const noexcept
    {
        return m_value < other.m_value;
    }

    bool operator>(const Id<Kind>& other) const noexcept
    {
        return other < *this;
    }

    bool operator<=(const Id<Kind>& other) const noexcept
    {
        return !(*this > other);
    }

    bool operator>=(const Id<Kind>& other) const noexcept
    {
        return !(*this < other);
    }

    std::size_t hash() const noexcept
    {
        return boost::uuids::hash_value(m_value);
    }

private:
    boost::uuids::uuid m_value;
};

template <typename Kind>
std::ostream& operator<<(std::ostream& os, const Id<Kind>& id)
{
    return os << id.value();
}

} // namespace sceneit

namespace std
{

template <typename Kind>
struct hash<sceneit::Id<Kind>>
{
    std::size_t operator()(const sceneit::Id<Kind>& id) const noexcept
    {
        return id.hash();
    }
};

} // namespace std
