#ifndef VELLUM_DRAW_COMMAND_HPP
#define VELLUM_DRAW_COMMAND_HPP

#include <cstdint>
#include <vector>

#include "components/SpriteComponent.hpp"
#include "geometry/Geometry.hpp"

namespace vellum {

/**
 * @brief One fully resolved quad for the renderer.
 *
 * Plain data with no identity. Produced fresh every frame; consumers read it
 * and drop it.
 */
struct DrawCommand {
    Point world_position{};
    float world_rotation{0.0f};
    Vec2 world_scale{1.0f, 1.0f};
    Size size{};
    Point anchor_point{0.5f, 0.5f};
    TextureID texture_id{kNoTexture};
    Rect texture_rect{Rect::unit()};
    TextureFilteringMode filtering_mode{TextureFilteringMode::Linear};
    bool uses_mipmaps{false};
    Color color{Color::white()};
    float alpha{1.0f};
    float z_position{0.0f};
    BlendMode blend_mode{BlendMode::Alpha};
    Rect center_rect{Rect::unit()};
    // Index into the frame's warp meshes, -1 for a plain quad.
    std::int32_t warp_mesh{-1};

    bool operator==(const DrawCommand&) const = default;

    Size rendered_size() const { return scaled(size, world_scale); }

    // Axis-aligned bounds ignoring rotation.
    Rect bounds() const {
        Size s = rendered_size();
        return {{world_position.x - s.width * anchor_point.x,
                 world_position.y - s.height * anchor_point.y},
                s};
    }
};

// Subdivided warp mesh referenced by DrawCommand::warp_mesh. Positions and UVs
// are normalized to the sprite's quad, row-major.
struct WarpMesh {
    std::int32_t columns{1};
    std::int32_t rows{1};
    std::vector<Point> uvs;
    std::vector<Point> positions;

    bool operator==(const WarpMesh&) const = default;
};

}  // namespace vellum

#endif  // VELLUM_DRAW_COMMAND_HPP
