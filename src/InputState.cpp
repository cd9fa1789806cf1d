#include "InputState.hpp"

namespace vellum {

Vector2 InputState::direction() const {
    Vector2 dir{};
    if (left) dir.x -= 1.0f;
    if (right) dir.x += 1.0f;
    if (down) dir.y -= 1.0f;
    if (up) dir.y += 1.0f;
    return normalized(dir);
}

void InputState::update_edge_detection(bool previous_pointer_down) {
    pointer_just_pressed = pointer_down && !previous_pointer_down;
    pointer_just_released = !pointer_down && previous_pointer_down;
}

void InputState::clear_edge_flags() {
    pointer_just_pressed = false;
    pointer_just_released = false;
}

}  // namespace vellum
