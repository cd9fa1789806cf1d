#include <iostream>
#include <memory>

#include "GameLoop.hpp"
#include "Logger.hpp"
#include "actions/Action.hpp"
#include "bridge/FramePacket.hpp"

using namespace vellum;

int main() {
    // Create a scene with a parent and two sprites
    std::cout << "Building scene..." << std::endl;
    auto scene = std::make_shared<Scene>(Size{320.0f, 240.0f});

    NodeId pivot = scene->create_node("pivot");
    scene->add_child(scene->root(), pivot);
    scene->transform(pivot).position = {160.0f, 120.0f};

    Sprite sprite;
    sprite.size = {32.0f, 32.0f};
    sprite.texture_id = 1;
    NodeId orbiter = scene->create_sprite(sprite, "orbiter");
    scene->add_child(pivot, orbiter);
    scene->transform(orbiter).position = {48.0f, 0.0f};
    scene->transform(orbiter).z_position = 1.0f;

    sprite.texture_id = 2;
    NodeId watcher = scene->create_sprite(sprite, "watcher");
    scene->add_child(scene->root(), watcher);
    scene->transform(watcher).position = {20.0f, 20.0f};
    scene->add_constraint(watcher, Constraint::orient_to_node(orbiter));
    scene->set_warp(watcher, WarpGeometryGrid::wave(4, 4, 0.05f, 1.0f), 1);
    scene->run_action(watcher,
                      Action::repeat_forever(Action::sequence(
                          {Action::move_by({10.0f, 0.0f}, 0.05f), Action::move_by({-10.0f, 0.0f}, 0.05f)})),
                      "patrol");

    scene->set_update_callback([pivot](Scene& s, float dt) {
        s.transform(pivot).rotation += dt;
        if (s.frame_count() == 1) {
            s.audio().system().play_music(7, 0.8f, 1.0f);
        }
    });

    // Drive it like a host running at a jittery ~50 Hz
    GameLoop loop;
    loop.present(scene);

    InputState input;
    for (int frame = 0; frame < 10; ++frame) {
        input.pointer_down = frame >= 4 && frame < 6;
        loop.tick(frame % 3 == 0 ? 0.025 : 0.017, input);

        FramePacket packet = loop.build_frame_packet();
        std::cout << "frame " << frame << ": updates=" << packet.updates_this_tick
                  << " alpha=" << packet.interpolation_alpha
                  << " draws=" << packet.draw_commands.size()
                  << " audio=" << packet.audio_commands.size() << std::endl;
    }

    std::cout << scene->describe_tree();
    std::cout << "Simulated " << loop.total_updates() << " updates, " << loop.total_time()
              << "s" << std::endl;

    Logger::shutdown();
    return 0;
}
