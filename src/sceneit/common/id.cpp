/**
 * @file id.cpp
 */
#include "sceneit/common/id.hpp"

#include <boost/uuid/random_generator.hpp>

namespace sceneit
{
namespace detail
{

boost::uuids::uuid next_uuid()
{
    thread_local boost::uuids::random_generator generator;
    return generator();
}

} // namespace detail
} // namespace sceneit
