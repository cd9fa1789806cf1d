#include "scene/Camera.hpp"

#include <algorithm>

namespace vellum {

Rect camera_viewport(Point position, Vec2 scale, Size scene_size) {
    // A zero zoom would make the viewport infinite.
    const float sx = scale.x != 0.0f ? scale.x : 1.0f;
    const float sy = scale.y != 0.0f ? scale.y : 1.0f;
    const float width = scene_size.width / sx;
    const float height = scene_size.height / sy;
    return {{position.x - width / 2.0f, position.y - height / 2.0f}, {width, height}};
}

AffineTransform camera_view_transform(Point position, float rotation, Vec2 scale, Size view_size) {
    return AffineTransform::translation(view_size.width / 2.0f, view_size.height / 2.0f)
        .concatenated(AffineTransform::scale(scale.x, scale.y))
        .concatenated(AffineTransform::rotation(-rotation))
        .concatenated(AffineTransform::translation(-position.x, -position.y));
}

void camera_smooth_follow(Transform& camera, Point target, float smoothing, float dt) {
    const float step = smoothing * dt;
    const float factor = step > 0.0f ? std::min(step, 1.0f) : 0.0f;
    camera.position = lerp(camera.position, target, factor);
}

void camera_clamp_to_bounds(Transform& camera, const Rect& bounds, Size scene_size) {
    const Rect viewport = camera_viewport(camera.position, camera.scale, scene_size);
    const float half_width = viewport.size.width / 2.0f;
    const float half_height = viewport.size.height / 2.0f;

    camera.position.x = std::max(bounds.min_x() + half_width,
                                 std::min(bounds.max_x() - half_width, camera.position.x));
    camera.position.y = std::max(bounds.min_y() + half_height,
                                 std::min(bounds.max_y() - half_height, camera.position.y));
}

}  // namespace vellum
