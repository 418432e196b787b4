#include "sceneit/story/storyboard.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace sceneit;

namespace
{

Scene make_scene(const std::string& location, CameraLocation camera, SceneTimeOfDay time_of_day,
                 const std::string& action)
{
    Scene scene;
    SceneVariant& draft = scene.active_variant();
    draft.set_heading(SceneHeading{camera, SceneLocation(location), time_of_day});
    draft.add_element(SceneAction(action));
    return scene;
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== sceneit ======\n" << std::flush;

        Storyboard board;
        board.update_title(Title("The Long Night"));
        board.update_template(StoryTemplate::Screenplay);
        board.add_author(Author(AuthorName("Jordan Vale")));

        Character mara(CharacterName("Mara"));
        CharacterId mara_id = mara.id();
        board.add_character(std::move(mara));

        SceneId opening = board.add_scene(make_scene(
            "Lighthouse", CameraLocation::Exterior, SceneTimeOfDay::Dusk,
            "Waves hammer the rocks below."));
        SceneId stairs = board.add_scene(make_scene(
            "Lighthouse stairwell", CameraLocation::Interior, SceneTimeOfDay::Continuous,
            "Mara climbs, lantern swinging."));
        SceneId lamp_room = board.add_scene(make_scene(
            "Lamp room", CameraLocation::Interior, SceneTimeOfDay::Night,
            "The great lens is dark."));
        SceneId harbor = board.add_scene(make_scene(
            "Harbor", CameraLocation::Exterior, SceneTimeOfDay::Night,
            "A boat drifts without lights."));

        Dialogue line(stairs, mara_id);
        line.add_block(Parenthetical("out of breath"));
        line.add_block(DialogueText("Someone put the light out."));
        Scene stairs_copy = *board.scene(stairs);
        stairs_copy.active_variant().add_element(std::move(line));
        board.add_scene(std::move(stairs_copy));

        board.set_scene_as_root(opening);
        board.link_scenes(opening, stairs);
        board.link_scenes(stairs, lamp_room);
        board.link_scenes(stairs, harbor);

        std::cout << "\n------ outline ------\n";
        board.print_outline(std::cout);

        // Harbor becomes an alternative to the stairwell rather than a branch of it
        board.move_scene(harbor, stairs, opening);

        try
        {
            board.move_scene(stairs, opening, lamp_room);
        }
        catch (const SceneGraphError& e)
        {
            std::cout << "\nRejected move: " << e.what() << "\n";
        }

        board.unlink_scenes(opening, harbor);

        std::cout << "\n------ outline after edits ------\n";
        board.print_outline(std::cout);

        std::cout << "\n------ standalone scenes ------\n";
        for (const SceneId& scene_id : board.standalone_scenes())
        {
            const Scene* scene = board.scene(scene_id);
            std::cout << "- " << scene_id;
            if (scene && scene->active_variant().heading())
            {
                std::cout << " (" << scene->active_variant().heading()->to_string() << ")";
            }
            std::cout << "\n";
        }

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
