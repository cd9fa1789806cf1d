#ifndef VELLUM_GAME_LOOP_HPP
#define VELLUM_GAME_LOOP_HPP

#include <cstdint>
#include <memory>
#include <vector>

#include "GameClock.hpp"
#include "InputState.hpp"
#include "LowLevelRenderer/RenderQueue.hpp"
#include "SimulationManager.hpp"
#include "audio/AudioTypes.hpp"
#include "bridge/FramePacket.hpp"
#include "scene/Scene.hpp"

namespace vellum {

/**
 * @brief Fixed-timestep driver for one presented scene.
 *
 * The host calls tick() once per display frame with the real elapsed time.
 * Real time is clamped to max_frame_time(), banked in an accumulator and
 * drained in fixed_timestep() slices, one Scene::process_frame each. The
 * number of steps only depends on the sequence of deltas, never on how long a
 * step takes to run.
 */
class GameLoop {
   public:
    explicit GameLoop(double fixed_timestep = SimulationManager::Instance()->getFixedTimestep());

    // --- Scene ----------------------------------------------------------------

    // Replaces the current scene and empties the accumulator. Total time is kept.
    void present(std::shared_ptr<Scene> scene);
    void remove_scene();
    const std::shared_ptr<Scene>& scene() const { return scene_; }

    // --- Driving --------------------------------------------------------------

    void tick(double real_delta_time, const InputState& input);

    // Exactly one fixed update, ignoring the accumulator. No-op while paused.
    void step(const InputState& input);

    // Clears accumulator, total time, input and edge state. The scene stays.
    void reset();

    // --- Output ---------------------------------------------------------------

    // Valid until the next call; empty when no scene is presented.
    const std::vector<DrawCommand>& generate_draw_commands();
    const std::vector<DrawCommand>& draw_commands() const { return render_queue_.commands(); }
    const std::vector<WarpMesh>& warp_meshes() const { return render_queue_.warp_meshes(); }

    // Drains the presented scene's audio queue.
    std::vector<AudioCommand> consume_audio_commands();

    // Draw commands, audio and telemetry for the frame, ready to serialize.
    FramePacket build_frame_packet();

    // --- Telemetry ------------------------------------------------------------

    double interpolation_alpha() const { return accumulator_ / fixed_timestep_; }
    int updates_this_tick() const { return updates_this_tick_; }
    double total_time() const { return clock_.getSeconds(); }
    uint64_t total_updates() const { return clock_.getTicks(); }
    double updates_per_second() const { return 1.0 / fixed_timestep_; }
    double accumulator() const { return accumulator_; }
    const InputState& input() const { return input_; }

    // --- Configuration --------------------------------------------------------

    double fixed_timestep() const { return fixed_timestep_; }
    // Non-positive values are ignored.
    void set_fixed_timestep(double seconds);

    double max_frame_time() const { return max_frame_time_; }
    void set_max_frame_time(double seconds);

   private:
    std::shared_ptr<Scene> scene_;
    double fixed_timestep_;
    double max_frame_time_;
    double accumulator_{0.0};
    GameClock clock_;
    InputState input_;
    bool previous_pointer_down_{false};
    bool pending_pressed_{false};
    bool pending_released_{false};
    int updates_this_tick_{0};
    RenderQueue render_queue_;

    // Edge detection for a new host snapshot, merged with undelivered edges.
    void latch_input_(const InputState& input);
    void run_update_();
};

}  // namespace vellum

#endif  // VELLUM_GAME_LOOP_HPP
