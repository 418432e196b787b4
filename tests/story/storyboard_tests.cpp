#include <gtest/gtest.h>
#include "sceneit/story/storyboard.hpp"

#include <sstream>

using namespace sceneit;

namespace
{

uint32_t version_of(const Storyboard& board, const SceneId& scene_id)
{
    const Scene* scene = board.scene(scene_id);
    return scene ? scene->metadata().version : 0;
}

SceneGraphError expect_scene_error(const std::function<void()>& action)
{
    try
    {
        action();
    }
    catch (const SceneGraphError& e)
    {
        return e;
    }
    ADD_FAILURE() << "Expected SceneGraphError";
    return SceneGraphError::unknown_scene(SceneId::generate());
}

} // namespace

// ============================================================================
// Title, summary, template
// ============================================================================

TEST(StoryboardTests, NewStoryboard_IsEmpty)
{
    Storyboard board;

    EXPECT_FALSE(board.title().has_value());
    EXPECT_FALSE(board.summary().has_value());
    EXPECT_FALSE(board.story_template().has_value());
    EXPECT_TRUE(board.authors().empty());
    EXPECT_TRUE(board.characters().empty());
    EXPECT_EQ(board.scene_count(), 0u);
    EXPECT_EQ(board.scene_graph().scene_count(), 0u);
    EXPECT_EQ(board.metadata().version, 1u);
}

TEST(StoryboardTests, TitleSummaryTemplate_UpdateAndClear)
{
    Storyboard board;

    board.update_title(Title("The Long Night"));
    board.update_summary(Summary("A keeper relights the lamp."));
    board.update_template(StoryTemplate::HalfHourSitcom);

    EXPECT_EQ(board.title()->str(), "The Long Night");
    EXPECT_EQ(board.summary()->str(), "A keeper relights the lamp.");
    EXPECT_EQ(board.story_template(), StoryTemplate::HalfHourSitcom);
    EXPECT_STREQ(to_string(*board.story_template()), "Half-hour Sitcom");
    EXPECT_EQ(board.metadata().version, 4u);

    board.clear_title();
    board.clear_summary();
    board.clear_template();

    EXPECT_FALSE(board.title().has_value());
    EXPECT_FALSE(board.summary().has_value());
    EXPECT_FALSE(board.story_template().has_value());
    EXPECT_EQ(board.metadata().version, 7u);
}

TEST(StoryboardTests, AuthorsAndCharacters)
{
    Storyboard board;
    Author author(AuthorName("Jordan Vale"));
    AuthorId author_id = author.id();
    Character character(CharacterName("Mara"));
    CharacterId character_id = character.id();

    board.add_author(std::move(author));
    board.add_character(std::move(character));

    ASSERT_EQ(board.authors().count(author_id), 1u);
    EXPECT_EQ(board.authors().at(author_id).name().str(), "Jordan Vale");
    ASSERT_EQ(board.characters().count(character_id), 1u);

    board.remove_author(author_id);
    board.remove_character(character_id);
    board.remove_character(character_id);

    EXPECT_TRUE(board.authors().empty());
    EXPECT_TRUE(board.characters().empty());
}

// ============================================================================
// Structural edits
// ============================================================================

TEST(StoryboardTests, AddScene_StoresContentAndGraphMember)
{
    Storyboard board;
    Scene scene;
    SceneId expected = scene.id();

    SceneId scene_id = board.add_scene(std::move(scene));

    EXPECT_EQ(scene_id, expected);
    EXPECT_TRUE(board.contains_scene(scene_id));
    EXPECT_TRUE(board.scene_graph().contains(scene_id));
    EXPECT_TRUE(board.next_scenes(scene_id).empty());
    EXPECT_EQ(version_of(board, scene_id), 2u);
}

TEST(StoryboardTests, AddScene_ReplacesContentKeepsEdges)
{
    Storyboard board;
    SceneId a = board.add_scene(Scene());
    SceneId b = board.add_scene(Scene());
    board.link_scenes(a, b);

    Scene revised = *board.scene(a);
    revised.active_variant().add_element(SceneAction("Revised."));
    board.add_scene(std::move(revised));

    EXPECT_EQ(board.scene_count(), 2u);
    EXPECT_EQ(board.scene(a)->active_variant().elements().size(), 1u);
    EXPECT_TRUE(board.next_scenes(a).contains(b));
}

TEST(StoryboardTests, LinkScenes_UnknownSceneLeavesGraphUntouched)
{
    Storyboard board;
    SceneId known = board.add_scene(Scene());
    SceneId stranger = SceneId::generate();
    auto board_version = board.metadata().version;

    auto error = expect_scene_error([&] { board.link_scenes(known, stranger); });

    EXPECT_EQ(error.code(), SceneGraphErrorCode::UnknownScene);
    EXPECT_EQ(error.scenes(), std::vector<SceneId>{stranger});
    EXPECT_FALSE(board.scene_graph().contains(stranger));
    EXPECT_EQ(board.scene_graph().scene_count(), 1u);
    EXPECT_EQ(board.scene_graph().edge_count(), 0u);
    EXPECT_EQ(board.metadata().version, board_version);
    EXPECT_EQ(version_of(board, known), 2u);
}

TEST(StoryboardTests, UnknownScene_ReportsFirstMissingInArgumentOrder)
{
    Storyboard board;
    SceneId known = board.add_scene(Scene());
    SceneId x = SceneId::generate();
    SceneId y = SceneId::generate();

    EXPECT_EQ(expect_scene_error([&] { board.link_scenes(x, y); }).scenes().at(0), x);
    EXPECT_EQ(expect_scene_error([&] { board.unlink_scenes(known, y); }).scenes().at(0), y);
    EXPECT_EQ(expect_scene_error([&] { board.move_scene(x, known, y); }).scenes().at(0), x);
    EXPECT_EQ(expect_scene_error([&] { board.move_scene(known, x, y); }).scenes().at(0), x);
    EXPECT_EQ(expect_scene_error([&] { board.move_scene(known, known, y); }).scenes().at(0), y);
    EXPECT_EQ(expect_scene_error([&] { board.set_scene_as_root(x); }).code(),
              SceneGraphErrorCode::UnknownScene);
}

TEST(StoryboardTests, LinkScenes_TouchesBothEnds)
{
    Storyboard board;
    SceneId a = board.add_scene(Scene());
    SceneId b = board.add_scene(Scene());
    SceneId c = board.add_scene(Scene());

    board.link_scenes(a, b);

    EXPECT_EQ(version_of(board, a), 3u);
    EXPECT_EQ(version_of(board, b), 3u);
    EXPECT_EQ(version_of(board, c), 2u);
    EXPECT_TRUE(board.next_scenes(a).contains(b));

    board.unlink_scenes(a, b);

    EXPECT_EQ(version_of(board, a), 4u);
    EXPECT_EQ(version_of(board, b), 4u);
    EXPECT_TRUE(board.next_scenes(a).empty());
}

TEST(StoryboardTests, SetSceneAsRoot_TouchesScene)
{
    Storyboard board;
    SceneId a = board.add_scene(Scene());

    board.set_scene_as_root(a);

    EXPECT_TRUE(board.is_root(a));
    EXPECT_EQ(version_of(board, a), 3u);
}

TEST(StoryboardTests, MoveScene_TouchesAllThree)
{
    Storyboard board;
    SceneId a = board.add_scene(Scene());
    SceneId b = board.add_scene(Scene());
    SceneId c = board.add_scene(Scene());
    SceneId d = board.add_scene(Scene());
    board.link_scenes(a, b);
    board.link_scenes(b, c);
    board.link_scenes(a, d);
    uint32_t a_before = version_of(board, a);
    uint32_t b_before = version_of(board, b);
    uint32_t c_before = version_of(board, c);
    uint32_t d_before = version_of(board, d);

    board.move_scene(c, b, a);

    EXPECT_TRUE(board.next_scenes(a).contains(c));
    EXPECT_FALSE(board.next_scenes(b).contains(c));
    EXPECT_EQ(version_of(board, a), a_before + 1);
    EXPECT_EQ(version_of(board, b), b_before + 1);
    EXPECT_EQ(version_of(board, c), c_before + 1);
    EXPECT_EQ(version_of(board, d), d_before);
}

TEST(StoryboardTests, MoveScene_SameParentTouchesEachOnce)
{
    Storyboard board;
    SceneId a = board.add_scene(Scene());
    SceneId b = board.add_scene(Scene());
    board.link_scenes(a, b);
    uint32_t a_before = version_of(board, a);

    board.move_scene(b, a, a);

    EXPECT_EQ(version_of(board, a), a_before + 1);
}

TEST(StoryboardTests, MoveScene_CycleRejectedWithoutTouches)
{
    Storyboard board;
    SceneId a = board.add_scene(Scene());
    SceneId b = board.add_scene(Scene());
    SceneId c = board.add_scene(Scene());
    board.link_scenes(a, b);
    board.link_scenes(b, c);
    uint32_t b_before = version_of(board, b);
    uint32_t board_before = board.metadata().version;

    auto error = expect_scene_error([&] { board.move_scene(b, a, c); });

    EXPECT_EQ(error.code(), SceneGraphErrorCode::CycleDetected);
    EXPECT_TRUE(board.next_scenes(a).contains(b));
    EXPECT_TRUE(board.next_scenes(c).empty());
    EXPECT_EQ(version_of(board, b), b_before);
    EXPECT_EQ(board.metadata().version, board_before);
}

TEST(StoryboardTests, DeleteScene_RemovesContentAndEdges)
{
    Storyboard board;
    SceneId a = board.add_scene(Scene());
    SceneId b = board.add_scene(Scene());
    board.set_scene_as_root(a);
    board.link_scenes(a, b);

    board.delete_scene(b);

    EXPECT_FALSE(board.contains_scene(b));
    EXPECT_EQ(board.scene(b), nullptr);
    EXPECT_FALSE(board.scene_graph().contains(b));
    EXPECT_TRUE(board.next_scenes(a).empty());
    EXPECT_TRUE(board.standalone_scenes().empty());
}

TEST(StoryboardTests, DeleteScene_AbsentIsNoOp)
{
    Storyboard board;
    board.add_scene(Scene());
    auto board_version = board.metadata().version;

    EXPECT_NO_THROW(board.delete_scene(SceneId::generate()));
    EXPECT_EQ(board.scene_count(), 1u);
    EXPECT_EQ(board.metadata().version, board_version);
}

TEST(StoryboardTests, StandaloneScenes)
{
    Storyboard board;
    SceneId a = board.add_scene(Scene());
    SceneId b = board.add_scene(Scene());
    SceneId c = board.add_scene(Scene());
    board.set_scene_as_root(a);
    board.link_scenes(a, b);
    board.link_scenes(b, c);

    EXPECT_TRUE(board.standalone_scenes().empty());

    board.unlink_scenes(b, c);

    EXPECT_EQ(board.standalone_scenes(), (std::unordered_set<SceneId>{c}));
}

TEST(StoryboardTests, PrintOutline_ListsRoots)
{
    Storyboard board;
    SceneId a = board.add_scene(Scene());
    SceneId b = board.add_scene(Scene());
    board.set_scene_as_root(a);
    board.link_scenes(a, b);

    std::ostringstream oss;
    board.print_outline(oss);

    std::string expected = "ROOT: " + a.to_string() + "\n" +
                           "- " + a.to_string() + "\n" +
                           "  - " + b.to_string() + "\n\n";
    EXPECT_EQ(oss.str(), expected);
}

// ============================================================================
// Configuration and metadata
// ============================================================================

TEST(StoryboardTests, Config_StructuralTouchesDisabled)
{
    StoryboardConfig config;
    config.touch_on_structural_change = false;
    Storyboard board(config);

    SceneId a = board.add_scene(Scene());
    SceneId b = board.add_scene(Scene());
    board.link_scenes(a, b);
    board.set_scene_as_root(a);

    EXPECT_EQ(version_of(board, a), 1u);
    EXPECT_EQ(version_of(board, b), 1u);
    EXPECT_EQ(board.metadata().version, 5u);
}

TEST(StoryboardTests, Metadata_TouchedOnEveryMutation)
{
    Storyboard board;
    SceneId a = board.add_scene(Scene());
    SceneId b = board.add_scene(Scene());
    EXPECT_EQ(board.metadata().version, 3u);

    board.link_scenes(a, b);
    board.move_scene(b, a, a);
    board.unlink_scenes(a, b);
    board.delete_scene(b);

    EXPECT_EQ(board.metadata().version, 7u);
    EXPECT_GE(board.metadata().updated_at, board.metadata().created_at);
}
