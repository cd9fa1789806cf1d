#ifndef VELLUM_CAMERA_HPP
#define VELLUM_CAMERA_HPP

#include "components/NodeComponents.hpp"
#include "geometry/AffineTransform.hpp"
#include "geometry/Geometry.hpp"

namespace vellum {

// A camera is an ordinary node picked with Scene::set_camera. Its position is
// the center of the view in scene coordinates, its rotation turns the view and
// its scale zooms (above 1 zooms in). Children of the camera follow the view.

// Visible area of the scene for a camera at 'position' with 'scale'.
Rect camera_viewport(Point position, Vec2 scale, Size scene_size);

// Scene to view coordinates: the camera's position lands on the view's center.
AffineTransform camera_view_transform(Point position, float rotation, Vec2 scale, Size view_size);

// Moves the camera a fraction min(1, smoothing * dt) of the way to 'target'.
void camera_smooth_follow(Transform& camera, Point target, float smoothing, float dt);

// Keeps the viewport inside 'bounds'. A viewport larger than 'bounds' is
// pinned to its minimum edges.
void camera_clamp_to_bounds(Transform& camera, const Rect& bounds, Size scene_size);

inline void set_camera_zoom(Transform& camera, float zoom) { camera.scale = {zoom, zoom}; }

}  // namespace vellum

#endif  // VELLUM_CAMERA_HPP
