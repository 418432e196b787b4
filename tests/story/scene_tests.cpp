#include <gtest/gtest.h>
#include "sceneit/story/scene.hpp"

using namespace sceneit;

TEST(SceneTests, NewScene_HasOneActiveVariant)
{
    Scene scene;

    ASSERT_EQ(scene.variants().size(), 1u);
    EXPECT_EQ(scene.active_variant_id(), scene.variants().front().id());
    EXPECT_EQ(scene.active_variant().id(), scene.active_variant_id());
    EXPECT_FALSE(scene.active_variant().heading().has_value());
    EXPECT_TRUE(scene.active_variant().elements().empty());
    EXPECT_EQ(scene.metadata().version, 1u);
}

TEST(SceneTests, DistinctScenes_DistinctIds)
{
    Scene first;
    Scene second;

    EXPECT_NE(first.id(), second.id());
    EXPECT_NE(first.active_variant_id(), second.active_variant_id());
}

TEST(SceneTests, Variant_EditsTouchVariantOnly)
{
    Scene scene;
    SceneVariant& draft = scene.active_variant();

    draft.set_heading(SceneHeading{CameraLocation::Interior, SceneLocation("Kitchen"),
                                   SceneTimeOfDay::Night});
    draft.add_element(SceneAction("The kettle screams."));
    draft.add_element(Dialogue(scene.id(), CharacterId::generate()));

    EXPECT_EQ(draft.metadata().version, 4u);
    EXPECT_EQ(scene.metadata().version, 1u);
    ASSERT_EQ(draft.elements().size(), 2u);
    EXPECT_TRUE(std::holds_alternative<SceneAction>(draft.elements()[0]));
    EXPECT_TRUE(std::holds_alternative<Dialogue>(draft.elements()[1]));
    EXPECT_EQ(draft.heading()->to_string(), "INT. KITCHEN - NIGHT");

    draft.clear_heading();
    EXPECT_FALSE(draft.heading().has_value());
}

TEST(SceneTests, AddVariant_KeepsActive)
{
    Scene scene;
    SceneVariantId original = scene.active_variant_id();

    SceneVariant alternate;
    alternate.add_element(SceneAction("The kettle is silent."));
    SceneVariantId alternate_id = scene.add_variant(std::move(alternate));

    EXPECT_EQ(scene.variants().size(), 2u);
    EXPECT_EQ(scene.active_variant_id(), original);
    EXPECT_EQ(scene.metadata().version, 2u);

    scene.set_active_variant(alternate_id);
    EXPECT_EQ(scene.active_variant_id(), alternate_id);
    EXPECT_EQ(scene.active_variant().elements().size(), 1u);
    EXPECT_EQ(scene.metadata().version, 3u);
}

TEST(SceneTests, SetActiveVariant_ForeignIdRejected)
{
    Scene scene;
    Scene other;
    SceneVariantId original = scene.active_variant_id();

    EXPECT_THROW(scene.set_active_variant(other.active_variant_id()), std::out_of_range);
    EXPECT_EQ(scene.active_variant_id(), original);
    EXPECT_EQ(scene.metadata().version, 1u);
}

TEST(SceneTests, CopyKeepsIdentity)
{
    Scene scene;
    scene.active_variant().add_element(SceneAction("Rain."));

    Scene copy = scene;
    copy.active_variant().add_element(SceneAction("Thunder."));

    EXPECT_EQ(copy.id(), scene.id());
    EXPECT_EQ(scene.active_variant().elements().size(), 1u);
    EXPECT_EQ(copy.active_variant().elements().size(), 2u);
}
