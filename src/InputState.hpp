#ifndef VELLUM_INPUT_STATE_HPP
#define VELLUM_INPUT_STATE_HPP

#include <optional>

#include "geometry/Geometry.hpp"

namespace vellum {

// Snapshot of the host's input for one tick. The just_pressed / just_released
// flags are filled in by GameLoop, not by the host.
struct InputState {
    bool up{false};
    bool down{false};
    bool left{false};
    bool right{false};
    bool action{false};
    bool action2{false};
    bool pause{false};

    std::optional<Point> pointer_position{};
    bool pointer_down{false};
    bool pointer_just_pressed{false};
    bool pointer_just_released{false};

    bool operator==(const InputState&) const = default;

    // Unit vector from the direction flags, +y up. Zero when none or opposing.
    Vector2 direction() const;

    bool has_directional_input() const { return up || down || left || right; }
    bool has_action_input() const { return action || action2; }
    bool has_any_input() const {
        return has_directional_input() || has_action_input() || pause || pointer_down;
    }

    void update_edge_detection(bool previous_pointer_down);
    void clear_edge_flags();
};

}  // namespace vellum

#endif  // VELLUM_INPUT_STATE_HPP
