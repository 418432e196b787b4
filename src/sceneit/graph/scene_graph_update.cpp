/**
 * @file scene_graph_update.cpp
 */
#include "sceneit/graph/scene_graph_update.hpp"

namespace sceneit
{

namespace
{

struct AffectedScenesVisitor
{
    std::vector<SceneId> operator()(const SceneAdded& u) const { return {u.scene}; }
    std::vector<SceneId> operator()(const SceneSetAsRoot& u) const { return {u.scene}; }
    std::vector<SceneId> operator()(const ScenesLinked& u) const { return {u.from, u.dest}; }
    std::vector<SceneId> operator()(const SceneMoved& u) const { return {u.scene, u.from, u.dest}; }
    std::vector<SceneId> operator()(const SceneDeleted& u) const { return {u.scene}; }
    std::vector<SceneId> operator()(const EdgeDeleted& u) const { return {u.from, u.dest}; }
};

struct DescribeVisitor
{
    std::string operator()(const SceneAdded& u) const
    {
        return "added " + u.scene.to_string();
    }

    std::string operator()(const SceneSetAsRoot& u) const
    {
        return "set root " + u.scene.to_string();
    }

    std::string operator()(const ScenesLinked& u) const
    {
        return "linked " + u.from.to_string() + " -> " + u.dest.to_string();
    }

    std::string operator()(const SceneMoved& u) const
    {
        return "moved " + u.scene.to_string() + " from " + u.from.to_string() +
               " to " + u.dest.to_string();
    }

    std::string operator()(const SceneDeleted& u) const
    {
        return "deleted " + u.scene.to_string();
    }

    std::string operator()(const EdgeDeleted& u) const
    {
        return "unlinked " + u.from.to_string() + " -> " + u.dest.to_string();
    }
};

} // namespace

std::vector<SceneId> affected_scenes(const SceneGraphUpdate& update)
{
    return std::visit(AffectedScenesVisitor{}, update);
}

std::string describe(const SceneGraphUpdate& update)
{
    return std::visit(DescribeVisitor{}, update);
}

} // namespace sceneit
