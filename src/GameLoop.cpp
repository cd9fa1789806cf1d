#include "GameLoop.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "Logger.hpp"

namespace vellum {

namespace {

// Slack on the "accumulator >= timestep" test so that, e.g., 0.25 s drains into
// exactly 15 steps of 1/60 s despite rounding in the repeated subtraction.
constexpr double kStepTolerance = 1e-6;

}  // namespace

GameLoop::GameLoop(double fixed_timestep)
    : fixed_timestep_(fixed_timestep > 0.0 ? fixed_timestep
                                           : SimulationManager::kDefaultFixedTimestep),
      max_frame_time_(SimulationManager::Instance()->getMaxFrameTime()) {}

void GameLoop::present(std::shared_ptr<Scene> scene) {
    scene_ = std::move(scene);
    accumulator_ = 0.0;
    render_queue_.clear();
    Logger::getLogger()->info("Presented scene ({} node(s) under root)",
                              scene_ ? scene_->children(scene_->root()).size() : 0);
}

void GameLoop::remove_scene() {
    scene_.reset();
    render_queue_.clear();
    Logger::getLogger()->info("Scene removed from game loop");
}

void GameLoop::set_fixed_timestep(double seconds) {
    if (!(seconds > 0.0)) {
        Logger::getLogger()->warn("Ignoring non-positive fixed timestep: {}", seconds);
        return;
    }
    fixed_timestep_ = seconds;
}

void GameLoop::set_max_frame_time(double seconds) {
    if (!(seconds > 0.0)) {
        Logger::getLogger()->warn("Ignoring non-positive max frame time: {}", seconds);
        return;
    }
    max_frame_time_ = seconds;
}

void GameLoop::latch_input_(const InputState& input) {
    input_ = input;
    input_.update_edge_detection(previous_pointer_down_);
    input_.pointer_just_pressed = input_.pointer_just_pressed || pending_pressed_;
    input_.pointer_just_released = input_.pointer_just_released || pending_released_;
    previous_pointer_down_ = input.pointer_down;
}

void GameLoop::run_update_() {
    scene_->set_input(input_);
    scene_->process_frame(static_cast<float>(fixed_timestep_));
    clock_.tick(fixed_timestep_);
    ++updates_this_tick_;
    // Edges are delivered to one update only.
    input_.clear_edge_flags();
    pending_pressed_ = false;
    pending_released_ = false;
}

void GameLoop::tick(double real_delta_time, const InputState& input) {
    if (!scene_ || scene_->is_paused()) {
        updates_this_tick_ = 0;
        return;
    }

    latch_input_(input);
    scene_->audio().begin_frame();

    double delta = std::isfinite(real_delta_time) ? std::max(0.0, real_delta_time) : 0.0;
    if (delta > max_frame_time_) {
        Logger::getLogger()->debug("Frame delta {:.3f}s clamped to {:.3f}s", delta,
                                   max_frame_time_);
        delta = max_frame_time_;
    }
    accumulator_ += delta;

    updates_this_tick_ = 0;
    const double threshold = fixed_timestep_ * (1.0 - kStepTolerance);
    while (accumulator_ >= threshold) {
        run_update_();
        accumulator_ = std::max(0.0, accumulator_ - fixed_timestep_);
    }

    if (updates_this_tick_ == 0) {
        // No update saw this tick's edges; hand them to the next one.
        pending_pressed_ = input_.pointer_just_pressed;
        pending_released_ = input_.pointer_just_released;
    }
}

void GameLoop::step(const InputState& input) {
    if (!scene_ || scene_->is_paused()) {
        updates_this_tick_ = 0;
        return;
    }

    latch_input_(input);
    scene_->audio().begin_frame();
    updates_this_tick_ = 0;
    run_update_();
}

void GameLoop::reset() {
    accumulator_ = 0.0;
    clock_.reset();
    input_ = InputState{};
    previous_pointer_down_ = false;
    pending_pressed_ = false;
    pending_released_ = false;
    updates_this_tick_ = 0;
    render_queue_.clear();
    Logger::getLogger()->info("Game loop reset");
}

const std::vector<DrawCommand>& GameLoop::generate_draw_commands() {
    if (!scene_) {
        render_queue_.clear();
    } else {
        scene_->generate_draw_commands(render_queue_);
    }
    return render_queue_.commands();
}

std::vector<AudioCommand> GameLoop::consume_audio_commands() {
    if (!scene_) {
        return {};
    }
    return scene_->audio().consume_commands();
}

FramePacket GameLoop::build_frame_packet() {
    FramePacket packet;
    packet.draw_commands = generate_draw_commands();
    packet.warp_meshes = render_queue_.warp_meshes();
    packet.audio_commands = consume_audio_commands();
    packet.interpolation_alpha = interpolation_alpha();
    packet.updates_this_tick = static_cast<std::uint32_t>(updates_this_tick_);
    packet.total_time = total_time();
    if (scene_) {
        packet.viewport = scene_->viewport();
        packet.view_transform = scene_->view_transform(scene_->size());
    }
    return packet;
}

}  // namespace vellum
